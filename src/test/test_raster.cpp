// Curve flattening, edge bookkeeping and coverage rasterization.

#include <catch2/catch.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <vector>

#include "ttraster/ttraster.hpp"
#include "font_builder.hpp"

using ttraster::Bitmap;
using ttraster::ContourSet;
using ttraster::CoverageBitmap;
using ttraster::Error;
using ttraster::FontView;
using ttraster::GlyphOutline;
using ttraster::Vertex;
using namespace ttraster_test;

namespace {

    Vertex V(Vertex::Kind kind, int x, int y, int cx = 0, int cy = 0) {
        Vertex v;
        v.Update(kind, x, y, cx, cy);
        return v;
    }

    GlyphOutline Square(int x0, int y0, int x1, int y1) {
        return {
            V(Vertex::Kind::Move, x0, y0), V(Vertex::Kind::Line, x0, y1),
            V(Vertex::Kind::Line, x1, y1), V(Vertex::Kind::Line, x1, y0),
            V(Vertex::Kind::Line, x0, y0)
        };
    }

    struct LoadedFont {
        std::vector<std::uint8_t> bytes;
        FontView font;

        LoadedFont() : bytes{ TestFontBuilder().Build() } {
            REQUIRE(font.ReadBytes(bytes.data(), bytes.size()) == Error::None);
        }
    };

    // Test font whose kSquare is a rectangle from y_lo to 400 with a glyph
    // header claiming yMin = -256 and yMax = 0.
    std::vector<std::uint8_t> FontWithHeaderBelowOutline(int y_lo) {
        auto records = TestGlyphRecords();
        auto& g = records[kSquare];
        g = SimpleGlyph({ { {80, y_lo, true}, {80, 400, true}, {480, 400, true}, {480, y_lo, true} } });
        g[4] = 0xFF; g[5] = 0x00; // yMin
        g[8] = 0x00; g[9] = 0x00; // yMax
        const auto lg = MakeLocaGlyf(records, 1);
        return TestFontBuilder().Set("loca", lg.first).Set("glyf", lg.second).Build();
    }

    // pixel value within one step of the exact coverage
    bool CoverageNear(std::uint8_t value, double coverage) {
        return std::abs(int(value) - int(coverage * 255.0 + 0.5)) <= 1;
    }

    // deterministic pseudo random numbers
    struct Lcg {
        std::uint32_t state;
        std::uint32_t Next() {
            state = state * 1664525u + 1013904223u;
            return state >> 8;
        }
    };

} // namespace

TEST_CASE("FlattenCurves - counting and filling passes agree", "[ttraster][flatten]") {
    const GlyphOutline bowl = {
        V(Vertex::Kind::Move, 0, 0), V(Vertex::Kind::Curve, 50, 100, 0, 100),
        V(Vertex::Kind::Curve, 100, 0, 100, 100), V(Vertex::Kind::Line, 0, 0),
        V(Vertex::Kind::Move, 200, 200), V(Vertex::Kind::Line, 300, 200),
        V(Vertex::Kind::Curve, 200, 200, 250, 400)
    };

    for (float flatness : { 100.0f, 1.0f, 0.35f, 0.01f }) {
        INFO("flatness " << flatness);
        ContourSet cs;
        FontView::FlattenCurves(bowl, flatness, cs);

        REQUIRE(cs.lengths.size() == 2);
        size_t total = 0;
        for (int len : cs.lengths) total += static_cast<size_t>(len);
        REQUIRE(total == cs.points.size());
        REQUIRE(total == ttraster::detail::CountFlattenedPoints(bowl, flatness));

        REQUIRE(cs.points[0].x == 0.0f);
        REQUIRE(cs.points[0].y == 0.0f);
        const auto& second = cs.points[static_cast<size_t>(cs.lengths[0])];
        REQUIRE(second.x == 200.0f);
        REQUIRE(second.y == 200.0f);
        // every curve ends exactly on its end point
        REQUIRE(cs.points.back().x == 200.0f);
        REQUIRE(cs.points.back().y == 200.0f);
    }

    SECTION("coarse tolerance collapses a curve to its end point") {
        ContourSet cs;
        FontView::FlattenCurves(bowl, 1000.0f, cs);
        REQUIRE(cs.lengths[0] == 4);
    }

    SECTION("finer tolerance yields more points") {
        ContourSet coarse, fine;
        FontView::FlattenCurves(bowl, 1.0f, coarse);
        FontView::FlattenCurves(bowl, 0.01f, fine);
        REQUIRE(fine.points.size() > coarse.points.size());
    }

    SECTION("subdivision depth is bounded") {
        const size_t n = ttraster::detail::CountFlattenedPoints(bowl, 1e-9f);
        REQUIRE(n <= 3 * (size_t(1) << (TTRASTER_MAX_CURVE_SUBDIVISION + 1)) + 4);
    }
}

TEST_CASE("FlattenCurves - commands before the first move are ignored", "[ttraster][flatten]") {
    const GlyphOutline outline = {
        V(Vertex::Kind::Line, 5, 5), V(Vertex::Kind::Curve, 9, 9, 7, 7),
        V(Vertex::Kind::Move, 0, 0), V(Vertex::Kind::Line, 10, 0)
    };
    ContourSet cs;
    FontView::FlattenCurves(outline, 0.35f, cs);
    REQUIRE(cs.lengths == std::vector<int>{ 2 });
    REQUIRE(cs.points[1].x == 10.0f);

    FontView::FlattenCurves(GlyphOutline{}, 0.35f, cs);
    REQUIRE(cs.points.empty());
    REQUIRE(cs.lengths.empty());
}

TEST_CASE("HandlePool - chunked allocation and free list reuse", "[ttraster][pool]") {
    struct Node {
        ttraster::detail::Handle next;
        int value;
    };
    using Pool = ttraster::detail::HandlePool<Node>;
    Pool pool;

    std::vector<ttraster::detail::Handle> handles;
    for (std::uint32_t i = 0; i <= Pool::kPerChunk; ++i) {
        const auto h = pool.Alloc();
        REQUIRE(h != ttraster::detail::kNullHandle);
        pool[h].value = static_cast<int>(i);
        handles.push_back(h);
    }
    REQUIRE(pool.chunks.size() == 2);
    REQUIRE(handles.front() == 0);
    REQUIRE(handles.back() == Pool::kPerChunk);
    for (std::uint32_t i = 0; i <= Pool::kPerChunk; ++i)
        REQUIRE(pool[handles[i]].value == static_cast<int>(i));

    pool.Free(handles[5]);
    pool.Free(handles[7]);
    REQUIRE(pool.Alloc() == handles[7]);
    REQUIRE(pool.Alloc() == handles[5]);
    REQUIRE(pool.Alloc() == Pool::kPerChunk + 1);
    REQUIRE(pool.chunks.size() == 2);
}

TEST_CASE("SortEdges - orders by top y", "[ttraster][edges]") {
    for (int n : { 0, 1, 5, 12, 13, 100, 2000 }) {
        INFO("n = " << n);
        Lcg rng{ static_cast<std::uint32_t>(n) * 7919u + 1u };
        std::vector<ttraster::detail::Edge> edges(static_cast<size_t>(n));
        for (auto& e : edges) {
            e = ttraster::detail::Edge{};
            // plenty of duplicates
            e.y0 = static_cast<float>(rng.Next() % 64) * 0.5f;
            e.x0 = static_cast<float>(rng.Next() % 100);
        }
        ttraster::detail::SortEdges(edges.data(), n);
        for (int i = 1; i < n; ++i)
            REQUIRE(edges[static_cast<size_t>(i - 1)].y0 <= edges[static_cast<size_t>(i)].y0);
    }
}

TEST_CASE("FontView::Rasterize - empty outline clears the bitmap", "[ttraster][raster]") {
    const int w = 8, h = 6, stride = 10;
    std::vector<std::uint8_t> pixels(static_cast<size_t>(stride * h), 0xAB);
    Bitmap bm{ w, h, stride, pixels.data() };

    FontView::Rasterize(bm, 0.35f, GlyphOutline{}, 1.0f, 1.0f, 0.0f, 0.0f, 0, 0, true);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < stride; ++x)
            REQUIRE(pixels[static_cast<size_t>(y * stride + x)] == (x < w ? 0 : 0xAB));
}

TEST_CASE("FontView::Rasterize - half pixel shift splits edge coverage", "[ttraster][raster]") {
    const int w = 11, h = 10, stride = 14;
    std::vector<std::uint8_t> pixels(static_cast<size_t>(stride * h), 0xCD);
    Bitmap bm{ w, h, stride, pixels.data() };

    FontView::Rasterize(bm, 0.35f, Square(0, 0, 10, 10), 1.0f, 1.0f, 0.5f, 0.0f, 0, -10, true);

    std::vector<std::uint8_t> expected(static_cast<size_t>(w), 255);
    expected.front() = 128;
    expected.back() = 128;
    for (int y = 0; y < h; ++y) {
        INFO("row " << y);
        const std::vector<std::uint8_t> row(pixels.begin() + y * stride, pixels.begin() + y * stride + w);
        REQUIRE(row == expected);
        for (int x = w; x < stride; ++x)
            REQUIRE(pixels[static_cast<size_t>(y * stride + x)] == 0xCD);
    }
}

TEST_CASE("FontView::Rasterize - contour direction does not matter", "[ttraster][raster]") {
    GlyphOutline cw = Square(0, 0, 6, 6);
    GlyphOutline ccw = {
        V(Vertex::Kind::Move, 0, 0), V(Vertex::Kind::Line, 6, 0),
        V(Vertex::Kind::Line, 6, 6), V(Vertex::Kind::Line, 0, 6),
        V(Vertex::Kind::Line, 0, 0)
    };
    std::vector<std::uint8_t> a(64, 0), b(64, 0);
    Bitmap ba{ 8, 8, 8, a.data() }, bb{ 8, 8, 8, b.data() };
    FontView::Rasterize(ba, 0.35f, cw, 1.0f, 1.0f, 1.0f, 0.0f, 0, -7, true);
    FontView::Rasterize(bb, 0.35f, ccw, 1.0f, 1.0f, 1.0f, 0.0f, 0, -7, true);
    REQUIRE(a == b);
    REQUIRE(a[8 * 3 + 3] == 255);
    REQUIRE(a[8 * 3 + 0] == 0);
}

TEST_CASE("FontView::RasterizeGlyph - axis aligned square", "[ttraster][raster]") {
    LoadedFont f;

    SECTION("edges on pixel boundaries give full coverage") {
        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.125f, 0.125f, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.w == 50);
        REQUIRE(bm.h == 50);
        REQUIRE(bm.x_off == 10);
        REQUIRE(bm.y_off == -50);
        for (int y = 0; y < bm.h; ++y)
            for (int x = 0; x < bm.w; ++x)
                REQUIRE(bm.At(x, y) == 255);
    }

    SECTION("zero x scale uses the y scale") {
        CoverageBitmap a, b;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.0f, 0.125f, 0.0f, 0.0f, a) == Error::None);
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.125f, 0.125f, 0.0f, 0.0f, b) == Error::None);
        REQUIRE(a.w == b.w);
        REQUIRE(a.h == b.h);
        REQUIRE(a.pixels == b.pixels);

        CoverageBitmap c;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.125f, 0.0f, 0.0f, 0.0f, c) == Error::None);
        REQUIRE(c.pixels == b.pixels);

        CoverageBitmap none;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.0f, 0.0f, 0.0f, 0.0f, none) == Error::None);
        REQUIRE(none.w == 0);
        REQUIRE(none.pixels.empty());
    }

    SECTION("subpixel shift spreads coverage over the border") {
        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.125f, 0.125f, 0.5f, 0.25f, bm) == Error::None);
        REQUIRE(bm.w == 51);
        REQUIRE(bm.h == 51);
        REQUIRE(bm.x_off == 10);
        REQUIRE(bm.y_off == -50);

        // top row is 3/4 covered, bottom row 1/4, side columns 1/2
        REQUIRE(bm.At(25, 0) == 191);
        REQUIRE(bm.At(25, 50) == 64);
        REQUIRE(bm.At(0, 25) == 128);
        REQUIRE(bm.At(50, 25) == 128);
        REQUIRE(bm.At(0, 0) == 96);
        REQUIRE(bm.At(50, 50) == 32);
        for (int y = 1; y < 50; ++y)
            for (int x = 1; x < 50; ++x)
                REQUIRE(bm.At(x, y) == 255);
    }
}

TEST_CASE("FontView::RasterizeGlyph - sloped edges", "[ttraster][raster]") {
    LoadedFont f;
    CoverageBitmap bm;
    REQUIRE(f.font.RasterizeCodepoint('D', 0.1f, 0.1f, 0.0f, 0.0f, bm) == Error::None);
    REQUIRE(bm.w == 40);
    REQUIRE(bm.h == 40);

    // total coverage matches the triangle area of 800 pixels
    double sum = 0;
    for (std::uint8_t v : bm.pixels) sum += v;
    REQUIRE(sum / 255.0 == Approx(800.0).epsilon(0.01));

    // mirror symmetric around the apex
    for (int y = 0; y < bm.h; ++y)
        for (int x = 0; x < bm.w / 2; ++x)
            REQUIRE(std::abs(int(bm.At(x, y)) - int(bm.At(bm.w - 1 - x, y))) <= 1);

    // apex row is thin, base row is wide
    REQUIRE(bm.At(0, 39) > 0);
    REQUIRE(bm.At(0, 0) == 0);
    REQUIRE(bm.At(20, 30) == 255);
}

TEST_CASE("FontView::MakeGlyphBitmap - caller buffer", "[ttraster][raster]") {
    LoadedFont f;

    SECTION("writes w x h pixels and leaves stride padding alone") {
        const int w = 50, h = 50, stride = 53;
        std::vector<std::uint8_t> pixels(static_cast<size_t>(stride * h), 0xCD);
        REQUIRE(f.font.MakeGlyphBitmap(pixels.data(), kSquare, w, h, stride, 0.125f, 0.125f) == Error::None);
        for (int y = 0; y < h; ++y)
            for (int x = 0; x < stride; ++x)
                REQUIRE(pixels[static_cast<size_t>(y * stride + x)] == (x < w ? 255 : 0xCD));
    }

    SECTION("whitespace glyph produces a zero bitmap") {
        std::vector<std::uint8_t> pixels(16 * 16, 0xAB);
        REQUIRE(f.font.MakeCodepointBitmap(pixels.data(), ' ', 16, 16, 16, 0.1f, 0.1f) == Error::None);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);
    }

    SECTION("undecodable glyph reports the error and clears the bitmap") {
        std::vector<std::uint8_t> pixels(16 * 16, 0xAB);
        REQUIRE(f.font.MakeGlyphBitmap(pixels.data(), kSelfRef, 16, 16, 16, 0.1f, 0.1f) == Error::Malformed);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);

        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kPointMatch, 0.1f, 0.1f, 0.0f, 0.0f, bm) == Error::Malformed);
        REQUIRE(bm.pixels.empty());
    }

    SECTION("same output as RasterizeGlyph") {
        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kBowl, 0.17f, 0.17f, 0.3f, 0.6f, bm) == Error::None);
        REQUIRE(bm.w > 0);
        std::vector<std::uint8_t> pixels(static_cast<size_t>(bm.w * bm.h), 0);
        REQUIRE(f.font.MakeGlyphBitmap(pixels.data(), kBowl, bm.w, bm.h, bm.w, 0.17f, 0.17f, 0.3f, 0.6f) == Error::None);
        REQUIRE(pixels == bm.pixels);
    }
}

TEST_CASE("FontView::ScaleForPixelHeight - maps ascent to descent onto the pixel height", "[ttraster][metrics]") {
    LoadedFont f;
    const ttraster::VMetrics vm = f.font.GetFontVMetrics();
    for (float px : { 8.0f, 13.0f, 20.0f, 64.0f, 200.0f }) {
        const float s = f.font.ScaleForPixelHeight(px);
        REQUIRE(s * static_cast<float>(vm.ascent - vm.descent) == Approx(px).epsilon(1e-5));
    }
}

TEST_CASE("FontView::Rasterize - edges ending above the first row", "[ttraster][raster]") {
    const int w = 10, h = 4;

    SECTION("outline entirely above the bitmap") {
        std::vector<std::uint8_t> pixels(static_cast<size_t>(w * h), 0xCD);
        Bitmap bm{ w, h, w, pixels.data() };
        FontView::Rasterize(bm, 0.35f, Square(0, 2, 10, 10), 1.0f, 1.0f, 0.0f, 0.0f, 0, 0, true);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);
    }

    SECTION("contour above the bitmap next to one inside it") {
        GlyphOutline outline = Square(0, 2, 10, 10);
        const GlyphOutline inside = Square(2, -3, 6, 0);
        outline.insert(outline.end(), inside.begin(), inside.end());

        std::vector<std::uint8_t> pixels(static_cast<size_t>(w * h), 0xCD);
        Bitmap bm{ w, h, w, pixels.data() };
        FontView::Rasterize(bm, 0.35f, outline, 1.0f, 1.0f, 0.0f, 0.0f, 0, 0, true);
        for (int y = 0; y < h; ++y)
            for (int x = 0; x < w; ++x) {
                INFO("pixel " << x << "," << y);
                const bool covered = y < 3 && x >= 2 && x < 6;
                REQUIRE(pixels[static_cast<size_t>(y * w + x)] == (covered ? 255 : 0));
            }
    }
}

TEST_CASE("FontView::RasterizeGlyph - glyph header smaller than the outline", "[ttraster][raster]") {
    SECTION("outline wholly outside the header box draws nothing") {
        const auto bytes = FontWithHeaderBelowOutline(100);
        FontView font;
        REQUIRE(font.ReadBytes(bytes.data(), bytes.size()) == Error::None);

        CoverageBitmap bm;
        REQUIRE(font.RasterizeGlyph(kSquare, 0.125f, 0.125f, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.w == 50);
        REQUIRE(bm.h == 32);
        REQUIRE(bm.y_off == 0);
        for (std::uint8_t p : bm.pixels) REQUIRE(p == 0);

        std::vector<std::uint8_t> pixels(static_cast<size_t>(bm.w * bm.h), 0xAB);
        REQUIRE(font.MakeGlyphBitmap(pixels.data(), kSquare, bm.w, bm.h, bm.w, 0.125f, 0.125f) == Error::None);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);
    }

    SECTION("outline crossing the header top keeps the part inside") {
        const auto bytes = FontWithHeaderBelowOutline(-100);
        FontView font;
        REQUIRE(font.ReadBytes(bytes.data(), bytes.size()) == Error::None);

        CoverageBitmap bm;
        REQUIRE(font.RasterizeGlyph(kSquare, 0.125f, 0.125f, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.w == 50);
        REQUIRE(bm.h == 32);
        // the rectangle bottom sits at pixel row 12.5
        for (int y = 0; y < bm.h; ++y) {
            INFO("row " << y);
            const int expected = y < 12 ? 255 : (y == 12 ? 128 : 0);
            for (int x = 0; x < bm.w; ++x)
                REQUIRE(bm.At(x, y) == expected);
        }
    }
}

TEST_CASE("FontView - degenerate metrics and transforms give empty bitmaps", "[ttraster][raster][metrics]") {
    SECTION("zero line height") {
        const auto bytes = TestFontBuilder().Set("hhea", MakeHhea(0, 0, 0, 4)).Build();
        FontView font;
        REQUIRE(font.ReadBytes(bytes.data(), bytes.size()) == Error::None);

        const float s = font.ScaleForPixelHeight(20.0f);
        REQUIRE(s == 0.0f);

        CoverageBitmap bm;
        REQUIRE(font.RasterizeCodepoint('A', s, s, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.w == 0);
        REQUIRE(bm.h == 0);
        REQUIRE(bm.pixels.empty());

        std::vector<std::uint8_t> pixels(16 * 16, 0xAB);
        REQUIRE(font.MakeCodepointBitmap(pixels.data(), 'A', 16, 16, 16, s, s) == Error::None);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);
    }

    SECTION("zero units per em") {
        const auto bytes = TestFontBuilder().Set("head", MakeHead(0, 0, -200, 480, 800, 1)).Build();
        FontView font;
        REQUIRE(font.ReadBytes(bytes.data(), bytes.size()) == Error::None);
        REQUIRE(font.ScaleForMappingEmToPixels(12.0f) == 0.0f);
    }

    LoadedFont f;
    const float inf = std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();

    SECTION("non-finite scales and shifts") {
        const ttraster::Box box = f.font.GetGlyphBitmapBox(kSquare, inf, inf);
        REQUIRE(box.x0 == 0);
        REQUIRE(box.y0 == 0);
        REQUIRE(box.x1 == 0);
        REQUIRE(box.y1 == 0);

        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kSquare, inf, inf, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.pixels.empty());
        REQUIRE(f.font.RasterizeGlyph(kSquare, nan, 0.1f, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.pixels.empty());
        REQUIRE(f.font.RasterizeGlyph(kSquare, 0.1f, 0.1f, nan, 0.0f, bm) == Error::None);
        REQUIRE(bm.pixels.empty());

        std::vector<std::uint8_t> pixels(16 * 16, 0xAB);
        REQUIRE(f.font.MakeGlyphBitmap(pixels.data(), kSquare, 16, 16, 16, 0.1f, 0.1f, 0.0f, inf) == Error::None);
        for (std::uint8_t p : pixels) REQUIRE(p == 0);
    }

    SECTION("box coordinates outside the int range") {
        const ttraster::Box box = f.font.GetGlyphBitmapBox(kSquare, 1e30f, 1e30f);
        REQUIRE(box.Width() == 0);
        REQUIRE(box.Height() == 0);
        CoverageBitmap bm;
        REQUIRE(f.font.RasterizeGlyph(kSquare, 1e30f, 1e30f, 0.0f, 0.0f, bm) == Error::None);
        REQUIRE(bm.pixels.empty());
    }
}

TEST_CASE("FontView::Rasterize - edges leaving the bitmap mid row", "[ttraster][raster]") {
    // in pixel space the triangle (0,0) (0,2) (3,2), hypotenuse x = 1.5 y
    const GlyphOutline tri = {
        V(Vertex::Kind::Move, 0, 0), V(Vertex::Kind::Line, 0, -2),
        V(Vertex::Kind::Line, 3, -2), V(Vertex::Kind::Line, 0, 0)
    };
    // exact coverage of the 4x2 pixels
    const double exact[2][4] = {
        { 2.0 / 3.0, 1.0 / 12.0, 0.0,       0.0 },
        { 1.0,       11.0 / 12.0, 1.0 / 3.0, 0.0 },
    };

    std::vector<std::uint8_t> wide(8, 0);
    Bitmap wb{ 4, 2, 4, wide.data() };
    FontView::Rasterize(wb, 0.35f, tri, 1.0f, 1.0f, 0.0f, 0.0f, 0, 0, true);
    for (int y = 0; y < 2; ++y)
        for (int x = 0; x < 4; ++x) {
            INFO("pixel " << x << "," << y);
            REQUIRE(CoverageNear(wide[static_cast<size_t>(y * 4 + x)], exact[y][x]));
        }

    SECTION("hypotenuse leaves through the right border in the second row") {
        std::vector<std::uint8_t> pixels(4, 0xCD);
        Bitmap bm{ 2, 2, 2, pixels.data() };
        FontView::Rasterize(bm, 0.35f, tri, 1.0f, 1.0f, 0.0f, 0.0f, 0, 0, true);
        for (int y = 0; y < 2; ++y)
            for (int x = 0; x < 2; ++x) {
                INFO("pixel " << x << "," << y);
                const std::uint8_t p = pixels[static_cast<size_t>(y * 2 + x)];
                REQUIRE(CoverageNear(p, exact[y][x]));
                REQUIRE(std::abs(int(p) - int(wide[static_cast<size_t>(y * 4 + x)])) <= 1);
            }
    }

    SECTION("hypotenuse enters through the left border in the first row") {
        // bitmap starts at pixel column 1
        std::vector<std::uint8_t> pixels(6, 0xCD);
        Bitmap bm{ 3, 2, 3, pixels.data() };
        FontView::Rasterize(bm, 0.35f, tri, 1.0f, 1.0f, 0.0f, 0.0f, 1, 0, true);
        for (int y = 0; y < 2; ++y)
            for (int x = 0; x < 3; ++x) {
                INFO("pixel " << x << "," << y);
                const std::uint8_t p = pixels[static_cast<size_t>(y * 3 + x)];
                REQUIRE(CoverageNear(p, exact[y][x + 1]));
                REQUIRE(std::abs(int(p) - int(wide[static_cast<size_t>(y * 4 + x + 1)])) <= 1);
            }
    }
}

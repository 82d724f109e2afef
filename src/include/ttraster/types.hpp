#pragma once

#include <stddef.h> // size_t
#include <stdint.h> // int16_t
#include <vector>

namespace ttraster {

struct Vertex {
    enum class Kind : uint8_t {
        Move = 1,  // move-to
        Line = 2,  // line-to
        Curve = 3  // quadratic Bezier curve-to
    };
    Kind kind{};

    using value_t = int16_t;
    value_t x{}, y{};
    value_t cx{}, cy{};

    void Update(Kind kind_, int32_t x_,  int32_t y_,
                            int32_t cx_, int32_t cy_) noexcept {
        kind = kind_;

        // narrow from i32 to i16
        x = static_cast<value_t>(x_);
        y = static_cast<value_t>(y_);
        cx = static_cast<value_t>(cx_);
        cy = static_cast<value_t>(cy_);
    }

    bool operator==(const Vertex& o) const noexcept {
        return kind == o.kind && x == o.x && y == o.y && cx == o.cx && cy == o.cy;
    }
    bool operator!=(const Vertex& o) const noexcept { return !(*this == o); }
};

// Decoded glyph outline in font design units, y axis up.
using GlyphOutline = std::vector<Vertex>;

struct Point { float x, y; };

// Flattened contours: `points` holds every contour back to back,
// `lengths[i]` is the point count of contour i.
struct ContourSet {
    std::vector<Point> points;
    std::vector<int> lengths;
};

struct GlyphHorMetrics {
    int advance;
    int lsb; // left side bearing
};

struct VMetrics {
    int ascent;
    int descent;
    int line_gap;
};

struct Box {
    int x0, y0, x1, y1;
    inline Box() noexcept { x0 = y0 = x1 = y1 = 0; }
    inline Box(int x0_, int y0_, int x1_, int y1_) noexcept
        : x0{ x0_ }, y0{ y0_ }, x1{ x1_ }, y1{ y1_ } {}

    inline int Width() const noexcept { return x1 - x0; }
    inline int Height() const noexcept { return y1 - y0; }
    inline bool Empty() const noexcept { return x1 <= x0 || y1 <= y0; }
};

// Non-owning view of a caller buffer of 8-bit coverage.
struct Bitmap {
    int w, h, stride;
    uint8_t* pixels;
};

// Owning coverage bitmap produced by FontView::RasterizeGlyph. `x_off`/`y_off`
// is the pixel-space position of the top-left corner relative to the origin.
struct CoverageBitmap {
    int w{}, h{}, stride{};
    int x_off{}, y_off{};
    std::vector<uint8_t> pixels;

    inline uint8_t At(int x, int y) const noexcept {
        return pixels[static_cast<size_t>(y) * static_cast<size_t>(stride) + static_cast<size_t>(x)];
    }
    inline Bitmap View() noexcept { return Bitmap{ w, h, stride, pixels.data() }; }
};

} // namespace ttraster

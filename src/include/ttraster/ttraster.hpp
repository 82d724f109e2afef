/*
MIT License
Copyright (c) 2017 Sean Barrett
Copyright (c) 2025 setbe

Permission is hereby granted, free of charge, to any person obtaining a copy of
this software and associated documentation files (the "Software"), to deal in
the Software without restriction, including without limitation the rights to
use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
of the Software, and to permit persons to whom the Software is furnished to do
so, subject to the following conditions:
The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#pragma once

// =======================================================================
//
//    ttraster -- TrueType glyph decoding and antialiased rasterization
//
// Every read of font data is range checked against the buffer passed to
// FontView::ReadBytes; malformed fonts produce an Error, never an
// out-of-bounds access.
//
// =======================================================================

#include <float.h>  // FLT_MAX
#include <math.h>   // floor, ceil
#include <stddef.h> // size_t
#include <stdint.h> // uint32_t

#include "ttraster/config.hpp"
#include "ttraster/error.hpp"
#include "ttraster/types.hpp"

#include "ttraster/detail/buf.hpp"
#include "ttraster/detail/table_dir.hpp"
#include "ttraster/detail/cmap.hpp"
#include "ttraster/detail/glyf.hpp"
#include "ttraster/detail/flatten.hpp"
#include "ttraster/detail/rasterizer.hpp"


namespace ttraster {
// Offsets cached by FontView::ReadBytes. Treat it as opaque.
struct FontInfo {
    const uint8_t* data;     // pointer to .ttf file
    size_t         size;     // bytes available at `data`
    int            fontstart; // offset of start of font

    int num_glyphs;           // number of glyphs, needed for range checking

    // table locations as offset from start of .ttf
    detail::TableRecord cmap, loca, head, glyf, hhea, hmtx, kern;
    detail::IndexMap index_map;       // a cmap mapping for our chosen character encoding
    int index_to_loc_format;          // format needed to map from glyph index to glyph
    int num_long_hor_metrics;
};

// Read-only view of one font inside a caller-owned byte buffer. The buffer
// must outlive the view. A loaded view is never mutated, so it may be
// shared by concurrent callers.
struct FontView {
    FontInfo fi{};

    FontView() = default;
    inline Error ReadBytes(const uint8_t* font_buffer, size_t size, int fontstart = 0) noexcept;

    // --- Metrics ---
    inline float ScaleForPixelHeight(float height) const noexcept;
    inline float ScaleForMappingEmToPixels(float pixels) const noexcept;
    inline int UnitsPerEm() const noexcept;
    inline int NumGlyphs() const noexcept { return fi.num_glyphs; }
    inline VMetrics GetFontVMetrics() const noexcept;
    inline Box GetFontBoundingBox() const noexcept;
    inline Error GetGlyphHorMetrics(int glyph_index, GlyphHorMetrics& out) const noexcept;
    inline Error GetCodepointHorMetrics(int codepoint, GlyphHorMetrics& out) const noexcept;

    // --- Character map ---
    // Returns 0 (the missing glyph) for unmapped codepoints and on error.
    inline int FindGlyphIndex(int unicode_codepoint) const noexcept;
    inline Error TryFindGlyphIndex(int unicode_codepoint, int& glyph_index) const noexcept;

    // --- Kerning ---
    inline int GetGlyphKernAdvance(int glyph1, int glyph2) const noexcept;
    inline int GetCodepointKernAdvance(int ch1, int ch2) const noexcept;

    // --- Outlines ---
    inline Error GetGlyphShape(int glyph_index, GlyphOutline& out) const;
    inline Error GetCodepointShape(int codepoint, GlyphOutline& out) const;
    inline bool IsGlyphEmpty(int glyph_index) const noexcept;

    // --- Boxes ---
    inline bool GetGlyphBox(int glyph_index, Box& out) const noexcept;
    inline bool GetCodepointBox(int codepoint, Box& out) const noexcept;
    inline Box GetGlyphBitmapBox(int glyph_index,
                          float scale_x,     float scale_y,
                          float shift_x = 0, float shift_y = 0) const noexcept;
    inline Box GetCodepointBitmapBox(int codepoint,
                          float scale_x,     float scale_y,
                          float shift_x = 0, float shift_y = 0) const noexcept;

    // --- Bitmaps ---
    inline Error MakeGlyphBitmap(uint8_t* output, int glyph_index,
                            int out_w, int out_h, int out_stride,
                            float scale_x,       float scale_y,
                            float shift_x = 0.f, float shift_y = 0.f) const;
    inline Error MakeCodepointBitmap(uint8_t* output, int codepoint,
                            int out_w, int out_h, int out_stride,
                            float scale_x,       float scale_y,
                            float shift_x = 0.f, float shift_y = 0.f) const;
    inline Error RasterizeGlyph(int glyph_index,
                            float scale_x, float scale_y,
                            float shift_x, float shift_y,
                            CoverageBitmap& out) const;
    inline Error RasterizeCodepoint(int codepoint,
                            float scale_x, float scale_y,
                            float shift_x, float shift_y,
                            CoverageBitmap& out) const;

    static inline void FlattenCurves(const GlyphOutline& vertices,
            float objspace_flatness, ContourSet& out) noexcept {
        detail::FlattenCurves(vertices, objspace_flatness, out);
    }

    static inline void Rasterize(Bitmap& out,    float flatness_in_pixels,
                   const GlyphOutline& vertices,
                   float scale_x,  float scale_y,
                   float shift_x,  float shift_y,
                     int x_off,      int y_off,
                    bool invert) noexcept;

    static inline int GetFontOffsetForIndex(const uint8_t* font_buffer, size_t size, int index) noexcept;
    static inline bool IsFont(const uint8_t* font_buffer, size_t size) noexcept;

private:
    inline detail::Buf File() const noexcept { return detail::Buf{ fi.data, fi.size }; }
    inline detail::Buf Table(const detail::TableRecord& t) const noexcept { return t.Slice(File()); }
    inline detail::GlyphSource Glyphs() const noexcept;
    static inline bool ResolveTransform(float& scale_x, float& scale_y,
                                        float shift_x, float shift_y) noexcept;
    // false for NaN and infinities
    static inline bool IsFinite(float v) noexcept { return v >= -FLT_MAX && v <= FLT_MAX; }
    // pixel coordinates stay within +-2^29 so Box::Width() and Height() fit an int
    static inline bool InPixelRange(float v) noexcept { return v >= -536870912.f && v <= 536870912.f; }
}; // struct FontView

// ============================================================================
//                         PUBLIC   METHODS
// ============================================================================

inline Error FontView::ReadBytes(const uint8_t* font_buffer, size_t size, int fontstart) noexcept {
    using detail::FindRequiredTable;
    using detail::FindTable;

    fi = FontInfo{};
    if (!font_buffer || fontstart < 0 || static_cast<size_t>(fontstart) >= size)
        return Error::Malformed;

    FontInfo info{};
    info.data = font_buffer;
    info.size = size;
    info.fontstart = fontstart;

    const detail::Buf file{ font_buffer, size };
    const size_t start = static_cast<size_t>(fontstart);
    Error err;

    if ((err = FindRequiredTable(file, start, "cmap", info.cmap)) != Error::None) return err;
    if ((err = FindRequiredTable(file, start, "loca", info.loca)) != Error::None) return err;
    if ((err = FindRequiredTable(file, start, "head", info.head)) != Error::None) return err;
    if ((err = FindRequiredTable(file, start, "glyf", info.glyf)) != Error::None) return err;
    if ((err = FindRequiredTable(file, start, "hhea", info.hhea)) != Error::None) return err;
    if ((err = FindRequiredTable(file, start, "hmtx", info.hmtx)) != Error::None) return err;
    if ((err = FindTable(file, start, "kern", info.kern)) != Error::None) return err; // not required

    bool ok = true;
    const detail::Buf head = info.head.Slice(file);
    if (!head.Fits(0, 54)) return Error::Malformed;
    if (head.U32(0, ok) != 0x00010000) return Error::HeadVersionUnsupported;

    const detail::Buf hhea = info.hhea.Slice(file);
    if (!hhea.Fits(0, 36)) return Error::Malformed;
    if (hhea.U32(0, ok) != 0x00010000) return Error::HheaVersionUnsupported;
    info.num_long_hor_metrics = hhea.U16(34, ok);

    detail::TableRecord maxp;
    if ((err = FindTable(file, start, "maxp", maxp)) != Error::None) return err;
    if (maxp.present) {
        const detail::Buf m = maxp.Slice(file);
        if (!m.Fits(0, 6)) return Error::Malformed;
        const uint32_t version = m.U32(0, ok);
        if (version != 0x00010000 && version != 0x00005000)
            return Error::MaxpVersionUnsupported;
        info.num_glyphs = m.U16(4, ok);
    } else {
        info.num_glyphs = 0xffff;
    }

    // find a cmap encoding table we understand *now* to avoid searching later
    if ((err = detail::SelectIndexMap(file, info.cmap, info.index_map)) != Error::None)
        return err;

    info.index_to_loc_format = head.I16(50, ok);
    if (!ok) return Error::Malformed;

    fi = info;
    return Error::None;
}

inline float FontView::ScaleForPixelHeight(float height) const noexcept {
    const VMetrics vm = GetFontVMetrics();
    const int h = vm.ascent - vm.descent;
    if (h == 0) return 0.f;
    return height / static_cast<float>(h);
}

inline float FontView::ScaleForMappingEmToPixels(float pixels) const noexcept {
    const int units_per_em = UnitsPerEm();
    if (units_per_em == 0) return 0.f;
    return pixels / static_cast<float>(units_per_em);
}

inline int FontView::UnitsPerEm() const noexcept {
    bool ok = true;
    return Table(fi.head).U16(18, ok);
}

inline VMetrics FontView::GetFontVMetrics() const noexcept {
    bool ok = true;
    const detail::Buf hhea = Table(fi.hhea);
    return VMetrics{ hhea.I16(4, ok), hhea.I16(6, ok), hhea.I16(8, ok) };
}

inline Box FontView::GetFontBoundingBox() const noexcept {
    bool ok = true;
    const detail::Buf head = Table(fi.head);
    return Box{ head.I16(36, ok), head.I16(38, ok), head.I16(40, ok), head.I16(42, ok) };
}

inline Error FontView::GetGlyphHorMetrics(int glyph_index, GlyphHorMetrics& out) const noexcept {
    out = GlyphHorMetrics{ 0, 0 };
    // num of long hor metrics
    const size_t num = static_cast<size_t>(fi.num_long_hor_metrics);
    if (glyph_index < 0 || num == 0) return Error::Malformed;

    const detail::Buf hmtx = Table(fi.hmtx);
    const size_t g = static_cast<size_t>(glyph_index);
    bool ok = true;
    if (g < num) {
        out.advance = hmtx.U16(4 * g, ok);
        out.lsb = hmtx.I16(4 * g + 2, ok);
    } else {
        // trailing glyphs share the last advance and carry their own bearing
        out.advance = hmtx.U16(4 * (num - 1), ok);
        out.lsb = hmtx.I16(4 * num + 2 * (g - num), ok);
    }
    if (!ok) {
        out = GlyphHorMetrics{ 0, 0 };
        return Error::Malformed;
    }
    return Error::None;
}

inline Error FontView::GetCodepointHorMetrics(int codepoint, GlyphHorMetrics& out) const noexcept {
    int glyph;
    const Error err = TryFindGlyphIndex(codepoint, glyph);
    if (err != Error::None) {
        out = GlyphHorMetrics{ 0, 0 };
        return err;
    }
    return GetGlyphHorMetrics(glyph, out);
}

inline int FontView::FindGlyphIndex(int unicode_codepoint) const noexcept {
    int glyph;
    return TryFindGlyphIndex(unicode_codepoint, glyph) == Error::None ? glyph : 0;
}

inline Error FontView::TryFindGlyphIndex(int unicode_codepoint, int& glyph_index) const noexcept {
    glyph_index = 0;
    if (!fi.data) return Error::Malformed;
    const detail::Buf sub = File().Range(fi.index_map.offset, fi.index_map.size);
    if (!sub.Ok()) return Error::Malformed;
    return detail::LookupGlyph(sub, fi.index_map.format, unicode_codepoint, glyph_index);
}

inline int FontView::GetGlyphKernAdvance(int glyph1, int glyph2) const noexcept {
    // we only look at the first table. it must be 'horizontal' and format 0.
    if (!fi.kern.present) return 0;
    const detail::Buf k = Table(fi.kern);
    bool ok = true;
    if (k.U16(2, ok) < 1 || !ok) // number of tables, need at least 1
        return 0;
    if (k.U16(8, ok) != 1 || !ok) // horizontal flag must be set in format
        return 0;

    int l = 0;
    int r = static_cast<int>(k.U16(10, ok)) - 1;
    const uint32_t needle = static_cast<uint32_t>(glyph1) << 16 | static_cast<uint32_t>(glyph2 & 0xFFFF);
    while (l <= r && ok) {
        const int m = (l + r) >> 1;
        const uint32_t straw = k.U32(18 + static_cast<size_t>(m) * 6, ok);
        if (needle < straw)
            r = m - 1;
        else if (needle > straw)
            l = m + 1;
        else {
            const int16_t value = k.I16(22 + static_cast<size_t>(m) * 6, ok);
            return ok ? value : 0;
        }
    }
    return 0;
}

inline int FontView::GetCodepointKernAdvance(int ch1, int ch2) const noexcept {
    if (!fi.kern.present) // if no kerning table, don't waste time looking up both codepoint->glyphs
        return 0;
    return GetGlyphKernAdvance(FindGlyphIndex(ch1), FindGlyphIndex(ch2));
}

inline detail::GlyphSource FontView::Glyphs() const noexcept {
    detail::GlyphSource src;
    src.loca = Table(fi.loca);
    src.glyf = Table(fi.glyf);
    src.num_glyphs = fi.num_glyphs;
    src.index_to_loc_format = fi.index_to_loc_format;
    return src;
}

inline Error FontView::GetGlyphShape(int glyph_index, GlyphOutline& out) const {
    out.clear();
    if (!fi.data) return Error::Malformed;
    return detail::DecodeGlyph(Glyphs(), glyph_index, 0, out);
}

inline Error FontView::GetCodepointShape(int codepoint, GlyphOutline& out) const {
    return GetGlyphShape(FindGlyphIndex(codepoint), out);
}

inline bool FontView::IsGlyphEmpty(int glyph_index) const noexcept {
    size_t begin, end;
    const detail::GlyphSource src = Glyphs();
    if (detail::GlyphLocation(src, glyph_index, begin, end) != Error::None || begin == end)
        return true;
    bool ok = true;
    const int16_t num_contours = src.glyf.I16(begin, ok);
    return !ok || num_contours == 0;
}

inline bool FontView::GetGlyphBox(int glyph_index, Box& box) const noexcept {
    box = Box{};
    size_t begin, end;
    const detail::GlyphSource src = Glyphs();
    if (detail::GlyphLocation(src, glyph_index, begin, end) != Error::None || begin == end)
        return false;

    const detail::Buf g = src.glyf.Range(begin, end - begin);
    bool ok = true;
    const Box b{ g.I16(2, ok), g.I16(4, ok), g.I16(6, ok), g.I16(8, ok) };
    if (!ok) return false;
    box = b;
    return true;
}

inline bool FontView::GetCodepointBox(int codepoint, Box& out) const noexcept {
    return GetGlyphBox(FindGlyphIndex(codepoint), out);
}

inline Box FontView::GetGlyphBitmapBox(int glyph_index,
                                 float scale_x, float scale_y,
                                 float shift_x, float shift_y) const noexcept {
    Box b{};
    if (!GetGlyphBox(glyph_index, b))
        return Box{}; // e.g. space character

    // move to integral bboxes (treating pixels as little squares, what pixels get touched)
    const float left   = floor( b.x0 * scale_x + shift_x);
    const float top    = floor(-b.y1 * scale_y + shift_y);
    const float right  = ceil ( b.x1 * scale_x + shift_x);
    const float bottom = ceil (-b.y0 * scale_y + shift_y);
    if (!InPixelRange(left) || !InPixelRange(top) || !InPixelRange(right) || !InPixelRange(bottom))
        return Box{};

    return Box{ static_cast<int>(left), static_cast<int>(top),
                static_cast<int>(right), static_cast<int>(bottom) };
}

inline Box FontView::GetCodepointBitmapBox(int codepoint,
                                 float scale_x, float scale_y,
                                 float shift_x, float shift_y) const noexcept {
    return GetGlyphBitmapBox(FindGlyphIndex(codepoint), scale_x, scale_y, shift_x, shift_y);
}

// A zero scale on one axis means "same as the other". False if both are zero
// or if any scale or shift is not finite.
inline bool FontView::ResolveTransform(float& scale_x, float& scale_y,
                                       float shift_x, float shift_y) noexcept {
    if (!IsFinite(scale_x) || !IsFinite(scale_y) || !IsFinite(shift_x) || !IsFinite(shift_y))
        return false;
    if (scale_x == 0) scale_x = scale_y;
    if (scale_y == 0) {
        if (scale_x == 0) return false;
        scale_y = scale_x;
    }
    return true;
}

inline Error FontView::MakeGlyphBitmap(
    uint8_t* output, int glyph_index,
    int out_w, int out_h,
    int out_stride,
    float scale_x, float scale_y,
    float shift_x, float shift_y) const {
    Bitmap bm;
    bm.pixels = output;
    bm.w = out_w;
    bm.h = out_h;
    bm.stride = out_stride;

    GlyphOutline vertices;
    const Error err = GetGlyphShape(glyph_index, vertices);
    if (err != Error::None || !ResolveTransform(scale_x, scale_y, shift_x, shift_y)) {
        detail::ClearBitmap(bm);
        return err;
    }
    const Box box = GetGlyphBitmapBox(glyph_index, scale_x, scale_y, shift_x, shift_y);

    if (bm.w > 0 && bm.h > 0)
        Rasterize(bm, TTRASTER_FLATNESS_IN_PIXELS, vertices, scale_x, scale_y,
                  shift_x, shift_y, box.x0, box.y0, true);
    return Error::None;
}

inline Error FontView::MakeCodepointBitmap(
    uint8_t* output, int codepoint,
    int out_w, int out_h,
    int out_stride,
    float scale_x, float scale_y,
    float shift_x, float shift_y) const {
    return MakeGlyphBitmap(output, FindGlyphIndex(codepoint), out_w, out_h, out_stride,
                           scale_x, scale_y, shift_x, shift_y);
}

inline Error FontView::RasterizeGlyph(int glyph_index,
        float scale_x, float scale_y,
        float shift_x, float shift_y,
        CoverageBitmap& out) const {
    out = CoverageBitmap{};

    GlyphOutline vertices;
    const Error err = GetGlyphShape(glyph_index, vertices);
    if (err != Error::None) return err;
    if (!ResolveTransform(scale_x, scale_y, shift_x, shift_y)) return Error::None;

    const Box box = GetGlyphBitmapBox(glyph_index, scale_x, scale_y, shift_x, shift_y);

    // now we get the size
    out.w = box.Width() > 0 ? box.Width() : 0;
    out.h = box.Height() > 0 ? box.Height() : 0;
    out.stride = out.w;
    out.x_off = box.x0;
    out.y_off = box.y0;

    if (out.w && out.h) {
        out.pixels.assign(static_cast<size_t>(out.w) * static_cast<size_t>(out.h), 0);
        Bitmap bm = out.View();
        Rasterize(bm, TTRASTER_FLATNESS_IN_PIXELS, vertices, scale_x, scale_y,
                  shift_x, shift_y, box.x0, box.y0, true);
    }
    return Error::None;
}

inline Error FontView::RasterizeCodepoint(int codepoint,
        float scale_x, float scale_y,
        float shift_x, float shift_y,
        CoverageBitmap& out) const {
    return RasterizeGlyph(FindGlyphIndex(codepoint), scale_x, scale_y, shift_x, shift_y, out);
}

inline void FontView::Rasterize(Bitmap& out, float flatness_in_pixels,
            const GlyphOutline& vertices,
            float scale_x, float scale_y,
            float shift_x, float shift_y,
              int x_off,   int y_off,
             bool invert) noexcept {
    const float scale = scale_x > scale_y ? scale_y : scale_x;
    ContourSet windings;
    detail::FlattenCurves(vertices, flatness_in_pixels / scale, windings);
    detail::RasterizeContours(out, windings, scale_x, scale_y, shift_x, shift_y,
                              x_off, y_off, invert);
}

// ============================================================================
//                         STATIC   METHODS
// ============================================================================

inline bool FontView::IsFont(const uint8_t* font_buffer, size_t size) noexcept {
    const detail::Buf b{ font_buffer, size };
    // check the version number
    if (b.Tag(0, "1\0\0\0")) return true; // TrueType 1
    if (b.Tag(0, "typ1"))    return true; // TrueType with type 1 font -- we don't support this!
    if (b.Tag(0, "OTTO"))    return true; // OpenType with CFF
    if (b.Tag(0, "\0\1\0\0")) return true; // OpenType 1.0
    if (b.Tag(0, "true"))    return true; // Apple specification for TrueType fonts
    return false;
}

inline int FontView::GetFontOffsetForIndex(const uint8_t* font_buffer, size_t size, int index) noexcept {
    if (!font_buffer) return -1;
    if (IsFont(font_buffer, size)) // if it's just a font, there's only one valid index
        return index == 0 ? 0 : -1;

    const detail::Buf b{ font_buffer, size };
    if (b.Tag(0, "ttcf")) { // check if it's a TTC
        bool ok = true;
        const uint32_t version = b.U32(4, ok);
        if (ok && (version == 0x00010000 || version == 0x00020000)) {
            const int32_t n = static_cast<int32_t>(b.U32(8, ok));
            if (!ok || index < 0 || index >= n) return -1;
            const uint32_t offset = b.U32(12 + static_cast<size_t>(index) * 4, ok);
            if (!ok || offset >= size || offset > 0x7FFFFFFF) return -1;
            return static_cast<int>(offset);
        }
    }
    return -1;
}

} // namespace ttraster

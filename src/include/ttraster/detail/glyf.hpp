#pragma once

#include <math.h>   // sqrt
#include <stddef.h> // size_t
#include <stdint.h> // uint32_t
#include <vector>

#include "../config.hpp"
#include "../error.hpp"
#include "../types.hpp"
#include "buf.hpp"

namespace ttraster {
    namespace detail {

        // The tables the outline decoder reads.
        struct GlyphSource {
            Buf loca;
            Buf glyf;
            int num_glyphs{};
            int index_to_loc_format{};
        };

        // Byte range [begin, end) of a glyph inside `glyf`. An out of range
        // glyph index yields an empty range.
        inline Error GlyphLocation(const GlyphSource& src, int glyph_index,
                                   size_t& begin, size_t& end) noexcept {
            begin = end = 0;
            if (glyph_index < 0 || glyph_index >= src.num_glyphs) return Error::None;
            if (src.index_to_loc_format >= 2 || src.index_to_loc_format < 0)
                return Error::UnknownLocationFormat;

            const size_t g = static_cast<size_t>(glyph_index);
            bool ok = true;
            size_t g1, g2;
            if (src.index_to_loc_format == 0) {
                g1 = static_cast<size_t>(src.loca.U16(g * 2, ok)) * 2;
                g2 = static_cast<size_t>(src.loca.U16(g * 2 + 2, ok)) * 2;
            } else {
                g1 = src.loca.U32(g * 4, ok);
                g2 = src.loca.U32(g * 4 + 4, ok);
            }
            if (!ok || g1 > g2 || g2 > src.glyf.size)
                return Error::Malformed;

            begin = g1;
            end = g2;
            return Error::None;
        }

        // Appends the vertices that close a contour back to its start point.
        inline void CloseShape(GlyphOutline& out, bool was_off, bool start_off,
                int32_t sx, int32_t sy, int32_t scx, int32_t scy,
                int32_t cx, int32_t cy) {
            Vertex v;
            if (start_off) {
                if (was_off) {
                    v.Update(Vertex::Kind::Curve, (cx + scx) >> 1, (cy + scy) >> 1, cx, cy);
                    out.push_back(v);
                }
                v.Update(Vertex::Kind::Curve, sx, sy, scx, scy);
                out.push_back(v);
            } else {
                if (was_off) {
                    v.Update(Vertex::Kind::Curve, sx, sy, cx, cy);
                    out.push_back(v);
                }
                v.Update(Vertex::Kind::Line, sx, sy, 0, 0);
                out.push_back(v);
            }
        }

        inline Error DecodeSimpleGlyph(const Buf& g, int num_contours, GlyphOutline& out) {
            struct RawPoint {
                uint8_t flags;
                int32_t x, y;
            };

            bool ok = true;
            const size_t end_pts = 10;
            const size_t nc = static_cast<size_t>(num_contours);
            const size_t ins = g.U16(end_pts + nc * 2, ok);
            const size_t n = 1 + static_cast<size_t>(g.U16(end_pts + nc * 2 - 2, ok));
            if (!ok) return Error::Malformed;

            Buf points = g.At(end_pts + nc * 2 + 2);
            points.Skip(ins);

            std::vector<RawPoint> raw(n);

            // first load flags
            uint8_t flags = 0, flagcount = 0;
            for (size_t i = 0; i < n; ++i) {
                if (flagcount == 0) {
                    flags = points.Get8();
                    if (flags & 8) flagcount = points.Get8();
                } else {
                    --flagcount;
                }
                raw[i].flags = flags;
            }

            // now load x coordinates
            int32_t x = 0;
            for (size_t i = 0; i < n; ++i) {
                flags = raw[i].flags;
                if (flags & 2) {
                    const int32_t dx = points.Get8();
                    x += (flags & 16) ? dx : -dx;
                } else if (!(flags & 16)) {
                    x += points.GetI16();
                }
                raw[i].x = static_cast<int16_t>(x);
            }

            // now load y coordinates
            int32_t y = 0;
            for (size_t i = 0; i < n; ++i) {
                flags = raw[i].flags;
                if (flags & 4) {
                    const int32_t dy = points.Get8();
                    y += (flags & 32) ? dy : -dy;
                } else if (!(flags & 32)) {
                    y += points.GetI16();
                }
                raw[i].y = static_cast<int16_t>(y);
            }
            if (!points.Ok()) return Error::Malformed;

            // now convert them to our format
            out.reserve(out.size() + n + 2 * nc);
            bool was_off = false, start_off = false;
            int32_t sx = 0, sy = 0, cx = 0, cy = 0, scx = 0, scy = 0;
            size_t next_move = 0, j = 0;
            Vertex v;

            for (size_t i = 0; i < n; ++i) {
                flags = raw[i].flags;
                x = raw[i].x;
                y = raw[i].y;

                if (next_move == i) {
                    if (i != 0)
                        CloseShape(out, was_off, start_off, sx, sy, scx, scy, cx, cy);
                    // now start the new one
                    start_off = !(flags & 1);
                    if (start_off && i + 1 < n) {
                        // if we start off with an off-curve point, then we need to find a point on the curve
                        // where we can start, and we need to save some state for when we wraparound.
                        scx = x;
                        scy = y;
                        if (!(raw[i + 1].flags & 1)) {
                            // next point is also a curve point, so interpolate an on-point curve
                            sx = (x + raw[i + 1].x) >> 1;
                            sy = (y + raw[i + 1].y) >> 1;
                        } else {
                            // otherwise just use the next point as our start point
                            sx = raw[i + 1].x;
                            sy = raw[i + 1].y;
                            ++i; // we're using point i+1 as the starting point, so skip it
                        }
                    } else {
                        // a lone trailing off-curve point starts a degenerate contour at itself
                        start_off = false;
                        sx = x;
                        sy = y;
                    }
                    v.Update(Vertex::Kind::Move, sx, sy, 0, 0);
                    out.push_back(v);
                    was_off = false;
                    next_move = 1 + static_cast<size_t>(g.U16(end_pts + j * 2, ok));
                    if (!ok) return Error::Malformed;
                    ++j;
                } else {
                    if (!(flags & 1)) { // if it's a curve
                        if (was_off) {
                            // two off-curve control points in a row means interpolate an on-curve midpoint
                            v.Update(Vertex::Kind::Curve, (cx + x) >> 1, (cy + y) >> 1, cx, cy);
                            out.push_back(v);
                        }
                        cx = x;
                        cy = y;
                        was_off = true;
                    } else {
                        if (was_off) v.Update(Vertex::Kind::Curve, x, y, cx, cy);
                        else         v.Update(Vertex::Kind::Line,  x, y, 0, 0);
                        out.push_back(v);
                        was_off = false;
                    }
                }
            }
            CloseShape(out, was_off, start_off, sx, sy, scx, scy, cx, cy);
            return Error::None;
        }

        inline Error DecodeGlyph(const GlyphSource& src, int glyph_index,
                                 int depth, GlyphOutline& out);

        inline Error DecodeCompositeGlyph(const GlyphSource& src, const Buf& g,
                                          int depth, GlyphOutline& out) {
            Buf comp = g.At(10);
            bool more = true;
            while (more) {
                float mtx[6] = { 1, 0, 0, 1, 0, 0 };

                const uint16_t flags = comp.Get16();
                const uint16_t gidx = comp.Get16();

                if (flags & 2) { // XY values
                    if (flags & 1) { // shorts
                        mtx[4] = comp.GetI16();
                        mtx[5] = comp.GetI16();
                    } else {
                        mtx[4] = comp.GetI8();
                        mtx[5] = comp.GetI8();
                    }
                } else {
                    // matching points are not supported
                    return Error::Malformed;
                }
                if (flags & (1 << 3)) { // WE_HAVE_A_SCALE
                    mtx[0] = mtx[3] = comp.GetI16() / 16384.0f;
                    mtx[1] = mtx[2] = 0;
                } else if (flags & (1 << 6)) { // WE_HAVE_AN_X_AND_YSCALE
                    mtx[0] = comp.GetI16() / 16384.0f;
                    mtx[1] = mtx[2] = 0;
                    mtx[3] = comp.GetI16() / 16384.0f;
                } else if (flags & (1 << 7)) { // WE_HAVE_A_TWO_BY_TWO
                    mtx[0] = comp.GetI16() / 16384.0f;
                    mtx[1] = comp.GetI16() / 16384.0f;
                    mtx[2] = comp.GetI16() / 16384.0f;
                    mtx[3] = comp.GetI16() / 16384.0f;
                }
                if (!comp.Ok()) return Error::Malformed;

                // Find transformation scales.
                const float m = static_cast<float>(sqrt(mtx[0] * mtx[0] + mtx[1] * mtx[1]));
                const float n = static_cast<float>(sqrt(mtx[2] * mtx[2] + mtx[3] * mtx[3]));

                // Get indexed glyph.
                GlyphOutline comp_verts;
                const Error err = DecodeGlyph(src, gidx, depth + 1, comp_verts);
                if (err != Error::None) return err;

                // Transform vertices.
                for (Vertex& v : comp_verts) {
                    float x = v.x, y = v.y;
                    v.x = static_cast<Vertex::value_t>(m * (mtx[0] * x + mtx[2] * y + mtx[4]));
                    v.y = static_cast<Vertex::value_t>(n * (mtx[1] * x + mtx[3] * y + mtx[5]));
                    x = v.cx; y = v.cy;
                    v.cx = static_cast<Vertex::value_t>(m * (mtx[0] * x + mtx[2] * y + mtx[4]));
                    v.cy = static_cast<Vertex::value_t>(n * (mtx[1] * x + mtx[3] * y + mtx[5]));
                }
                // Append vertices.
                out.insert(out.end(), comp_verts.begin(), comp_verts.end());

                // More components ?
                more = (flags & (1 << 5)) != 0;
            }
            return Error::None;
        }

        // Decodes one glyph into `out`. Whitespace glyphs (zero-length glyf
        // range, index out of range, unknown loca format) decode to nothing.
        inline Error DecodeGlyph(const GlyphSource& src, int glyph_index,
                                 int depth, GlyphOutline& out) {
            out.clear();
            if (depth > TTRASTER_MAX_COMPOSITE_DEPTH)
                return Error::Malformed;

            size_t begin, end;
            const Error loc = GlyphLocation(src, glyph_index, begin, end);
            if (loc == Error::UnknownLocationFormat) return Error::None;
            if (loc != Error::None) return loc;
            if (begin == end) return Error::None;

            const Buf g = src.glyf.Range(begin, end - begin);
            bool ok = true;
            const int16_t num_contours = g.I16(0, ok);
            if (!ok || !g.Fits(0, 10)) return Error::Malformed;

            Error err = Error::None;
            if (num_contours > 0)
                err = DecodeSimpleGlyph(g, num_contours, out);
            else if (num_contours == -1)
                err = DecodeCompositeGlyph(src, g, depth, out);
            else if (num_contours < 0)
                err = Error::Malformed;
            // num_contours == 0, do nothing

            if (err != Error::None) out.clear();
            return err;
        }

    } // namespace detail
} // namespace ttraster

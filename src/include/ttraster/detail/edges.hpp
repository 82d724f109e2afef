#pragma once

#include <math.h>   // fabs
#include <stddef.h> // size_t
#include <stdint.h> // uint8_t
#include <utility>  // std::swap

#include "../config.hpp"
#include "handle_pool.hpp"

namespace ttraster {
    namespace detail {
        // Directed scan edge in bitmap space, y0 < y1. `invert` records that
        // the contour ran the other way before the endpoints were swapped.
        struct Edge {
            float x0, y0, x1, y1;
            uint8_t invert;

            static inline bool TopBefore(const Edge& a, const Edge& b) noexcept {
                return a.y0 < b.y0;
            }
        };


        // Per-row state of an edge that crosses the current scanline.
        struct ActiveEdge {
            Handle next{ kNullHandle };
            float fx{};        // x at the top of the current row
            float fdx{};       // dx/dy
            float fdy{};       // dy/dx, 0 for vertical edges
            float direction{}; // winding sign, +1 or -1
            float sy{};        // first y covered
            float ey{};        // last y covered

            static inline void InitFromEdge(ActiveEdge& z, const Edge& e,
                    int off_x, float start_point) noexcept;

            inline void HandleClipped(float* scanline, int x,
                    float x0, float y0, float x1, float y1) const noexcept;
        }; // struct ActiveEdge

        using ActiveEdgePool = HandlePool<ActiveEdge>;


        inline void ActiveEdge::InitFromEdge(ActiveEdge& z, const Edge& e,
                int off_x, float start_point) noexcept {
            const float slope = (e.x1 - e.x0) / (e.y1 - e.y0);
            z.fdx = slope;
            z.fdy = slope != 0.f ? 1.f / slope : 0.f;
            z.fx = e.x0 + slope * (start_point - e.y0) - static_cast<float>(off_x);
            z.direction = e.invert ? 1.f : -1.f;
            z.sy = e.y0;
            z.ey = e.y1;
            z.next = kNullHandle;
        }

        // Adds the coverage of segment (x0,y0)-(x1,y1), clipped to the edge's
        // y range, to pixel x. The segment must not cross a pixel boundary.
        inline void ActiveEdge::HandleClipped(float* scanline, int x,
                                              float x0, float y0,
                                              float x1, float y1) const noexcept {
            if (y0 == y1) return;
            TTRASTER_assert(y0 < y1);
            TTRASTER_assert(sy <= ey);
            if (y0 > ey || y1 < sy) return;

            if (y0 < sy) {
                x0 += (x1 - x0) * (sy - y0) / (y1 - y0);
                y0 = sy;
            }
            if (y1 > ey) {
                x1 += (x1 - x0) * (ey - y1) / (y1 - y0);
                y1 = ey;
            }

            const float left = static_cast<float>(x);
            const float right = left + 1.f;
            if (x0 <= left && x1 <= left) {
                scanline[x] += direction * (y1 - y0);
            } else if (x0 >= right && x1 >= right) {
                // entirely right of the pixel
            } else {
                TTRASTER_assert(x0 >= left && x0 <= right && x1 >= left && x1 <= right);
                // coverage is 1 minus the mean x offset inside the pixel
                scanline[x] += direction * (y1 - y0) * (1 - ((x0 - left) + (x1 - left)) / 2);
            }
        }


        // Area of the trapezoid between the segment top_x..bottom_x and the
        // right border `right` of its pixel, over `height` rows.
        inline float AreaRightOf(float height, float top_x, float bottom_x, float right) noexcept {
            TTRASTER_assert(right - top_x >= 0 && right - bottom_x >= 0);
            return ((right - top_x) + (right - bottom_x)) / 2.f * height;
        }

        // Vertical edge: one column gets the partial area, the next one starts the fill.
        inline void AccumulateVertical(const ActiveEdge& e, float* scanline, float* fill,
                                       int len, float y_top) noexcept {
            const float x = e.fx;
            const float y_bottom = y_top + 1;
            if (x >= len) return;
            if (x >= 0) {
                e.HandleClipped(scanline, static_cast<int>(x), x, y_top, x, y_bottom);
                e.HandleClipped(fill - 1, static_cast<int>(x + 1), x, y_top, x, y_bottom);
            } else {
                e.HandleClipped(fill - 1, 0, x, y_top, x, y_bottom);
            }
        }

        // Sloped edge whose clipped segment lies within [0, len) on this row.
        // (x_top, sy0) and (x_bottom, sy1) are the clipped end points.
        inline void AccumulateInside(const ActiveEdge& e, float* scanline, float* fill,
                                     float y_top, float x_at_top, float x_at_bottom,
                                     float x_top, float sy0, float x_bottom, float sy1) noexcept {
            const float y_bottom = y_top + 1;
            const int first = static_cast<int>(x_top);
            const int last = static_cast<int>(x_bottom);

            if (first == last) {
                // the whole segment stays in one pixel
                const float height = (sy1 - sy0) * e.direction;
                scanline[first] += AreaRightOf(height, x_top, x_bottom, first + 1.0f);
                fill[first] += height;
                return;
            }

            float dy = e.fdy;
            if (x_top > x_bottom) {
                // mirror the row vertically so the segment runs left to right;
                // the signed area is unchanged
                const float new_sy0 = y_bottom - (sy1 - y_top);
                const float new_sy1 = y_bottom - (sy0 - y_top);
                sy0 = new_sy0;
                sy1 = new_sy1;
                std::swap(x_top, x_bottom);
                std::swap(x_at_top, x_at_bottom);
                dy = -dy;
            }
            TTRASTER_assert(dy >= 0);

            const int x1 = static_cast<int>(x_top);
            const int x2 = static_cast<int>(x_bottom);

            // y where the line leaves pixel x1 and where it enters pixel x2
            float y_crossing = y_top + dy * (x1 + 1 - x_at_top);
            float y_final = y_top + dy * (x2 - x_at_top);

            // x2 right next to x1 can push the crossing out of the row
            if (y_crossing > y_bottom)
                y_crossing = y_bottom;

            const float sign = e.direction;

            // rectangle sy0..y_crossing, of which pixel x1 gets the triangle
            float area = sign * (y_crossing - sy0);
            scanline[x1] += area * (x1 + 1 - x_top) / 2;

            if (y_final > y_bottom) {
                y_final = y_bottom;
                // x2 > x1 + 1 here, otherwise y_final would equal y_crossing
                dy = (y_final - y_crossing) / (x2 - (x1 + 1));
            }

            // pixels strictly between x1 and x2: everything covered so far plus
            // half of this pixel's own increment
            const float step = sign * dy;
            for (int x = x1 + 1; x < x2; ++x) {
                scanline[x] += area + step / 2;
                area += step;
            }
            TTRASTER_assert(fabs(area) <= 1.01f);
            TTRASTER_assert(sy1 > y_final - 0.01f);

            // last pixel: the accumulated rectangle plus the trapezoid right of the line
            scanline[x2] += area + sign * AreaRightOf(sy1 - y_final, static_cast<float>(x2), x_bottom, x2 + 1.0f);
            fill[x2] += sign * (sy1 - sy0);
        }

        // Edge leaving [0, len) during the row. Splits it at every pixel
        // border it crosses, one column at a time.
        inline void AccumulateClipped(const ActiveEdge& e, float* scanline, int len,
                                      float y_top, float x_at_top, float x_at_bottom) noexcept {
            const float y_bottom = y_top + 1;
            const float xa = x_at_top;
            const float xd = x_at_bottom;

            for (int x = 0; x < len; ++x) {
                // the line meets the left border of the pixel at ya, the right one at yb
                const float left = static_cast<float>(x);
                const float right = static_cast<float>(x + 1);
                const float ya = (x - xa) / e.fdx + y_top;
                const float yb = (x + 1 - xa) / e.fdx + y_top;

                if (xa < left && xd > right) {
                    // enters through the left border, leaves through the right
                    e.HandleClipped(scanline, x, xa, y_top, left, ya);
                    e.HandleClipped(scanline, x, left, ya, right, yb);
                    e.HandleClipped(scanline, x, right, yb, xd, y_bottom);
                } else if (xd < left && xa > right) {
                    // enters through the right border, leaves through the left
                    e.HandleClipped(scanline, x, xa, y_top, right, yb);
                    e.HandleClipped(scanline, x, right, yb, left, ya);
                    e.HandleClipped(scanline, x, left, ya, xd, y_bottom);
                } else if ((xa < left && xd > left) || (xd < left && xa > left)) {
                    // crosses the left border only
                    e.HandleClipped(scanline, x, xa, y_top, left, ya);
                    e.HandleClipped(scanline, x, left, ya, xd, y_bottom);
                } else if ((xa < right && xd > right) || (xd < right && xa > right)) {
                    // crosses the right border only
                    e.HandleClipped(scanline, x, xa, y_top, right, yb);
                    e.HandleClipped(scanline, x, right, yb, xd, y_bottom);
                } else {
                    e.HandleClipped(scanline, x, xa, y_top, xd, y_bottom);
                }
            }
        }

        // Accumulates every active edge of the row [y_top, y_top+1) into
        // `scanline` (per-pixel area) and `scanline_fill` (running fill deltas).
        inline void FillActiveEdges(float* scanline, float* scanline_fill, int len,
                ActiveEdgePool& pool, Handle active, float y_top) noexcept {
            const float y_bottom = y_top + 1;

            for (Handle h = active; h != kNullHandle; h = pool[h].next) {
                const ActiveEdge& e = pool[h];
                TTRASTER_assert(e.ey >= y_top);

                if (e.fdx == 0) {
                    AccumulateVertical(e, scanline, scanline_fill, len, y_top);
                    continue;
                }
                TTRASTER_assert(e.sy <= y_bottom && e.ey >= y_top);

                // x of the infinite line at the row borders
                const float x_at_top = e.fx;
                const float x_at_bottom = e.fx + e.fdx;

                // clip the segment to the row
                float x_top = x_at_top, sy0 = y_top;
                if (e.sy > y_top) {
                    x_top = x_at_top + e.fdx * (e.sy - y_top);
                    sy0 = e.sy;
                }
                float x_bottom = x_at_bottom, sy1 = y_bottom;
                if (e.ey < y_bottom) {
                    x_bottom = x_at_top + e.fdx * (e.ey - y_top);
                    sy1 = e.ey;
                }

                if (x_top >= 0 && x_bottom >= 0 && x_top < len && x_bottom < len)
                    AccumulateInside(e, scanline, scanline_fill, y_top, x_at_top, x_at_bottom,
                                     x_top, sy0, x_bottom, sy1);
                else
                    AccumulateClipped(e, scanline, len, y_top, x_at_top, x_at_bottom);
            }
        } // FillActiveEdges


        // Quicksort with a median-of-three pivot. Partitions of 12 or fewer
        // edges are left for SortEdgesInsSort.
        inline void SortEdgesQuicksort(Edge* p, int n) noexcept {
            while (n > 12) {
                const int mid = n >> 1;

                // move the median of p[0], p[mid], p[n-1] to p[mid]
                const bool lo_mid = Edge::TopBefore(p[0], p[mid]);
                const bool mid_hi = Edge::TopBefore(p[mid], p[n - 1]);
                if (lo_mid != mid_hi) {
                    const bool lo_hi = Edge::TopBefore(p[0], p[n - 1]);
                    std::swap(p[lo_hi == mid_hi ? 0 : n - 1], p[mid]);
                }
                // park the pivot at p[0]
                std::swap(p[0], p[mid]);

                int i = 1;
                int j = n - 1;
                for (;;) {
                    // strict comparisons stop on equal keys, so the pivot
                    // bounds both scans
                    while (Edge::TopBefore(p[i], p[0])) ++i;
                    while (Edge::TopBefore(p[0], p[j])) --j;
                    if (i >= j) break;
                    std::swap(p[i], p[j]);
                    ++i;
                    --j;
                }

                // recurse into the smaller part, loop on the larger
                if (j < n - i) {
                    SortEdgesQuicksort(p, j);
                    p += i;
                    n -= i;
                } else {
                    SortEdgesQuicksort(p + i, n - i);
                    n = j;
                }
            }
        }

        inline void SortEdgesInsSort(Edge* p, int n) noexcept {
            for (int i = 1; i < n; ++i) {
                const Edge t = p[i];
                int j = i;
                while (j > 0 && Edge::TopBefore(t, p[j - 1])) {
                    p[j] = p[j - 1];
                    --j;
                }
                if (j != i)
                    p[j] = t;
            }
        }

        // Orders edges by y0.
        inline void SortEdges(Edge* p, int n) noexcept {
            SortEdgesQuicksort(p, n);
            SortEdgesInsSort(p, n);
        }
    } // namespace detail
} // namespace ttraster

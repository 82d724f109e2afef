#pragma once

#include <math.h>   // fabs
#include <string.h> // memset
#include <new>      // std::bad_alloc
#include <vector>

#include "../config.hpp"
#include "../types.hpp"
#include "edges.hpp"
#include "flatten.hpp"

namespace ttraster {
    namespace detail {

        inline void ClearBitmap(Bitmap& out) noexcept {
            if (!out.pixels || out.w <= 0) return;
            for (int row = 0; row < out.h; ++row)
                memset(out.pixels + static_cast<size_t>(row) * out.stride, 0, static_cast<size_t>(out.w));
        }

        // Blows the contours out into explicit edge lists, skipping horizontal
        // edges. `e` receives the edges plus one trailing slot for the sentinel.
        inline void BuildEdges(const ContourSet& contours,
                float scale_x, float scale_y, float shift_x, float shift_y,
                bool invert, std::vector<Edge>& e) {
            const float y_scale_inv = invert ? -scale_y : scale_y;

            e.clear();
            e.reserve(contours.points.size() + 1);

            size_t m = 0;
            for (const int count : contours.lengths) {
                const Point* p = contours.points.data() + m;
                m += static_cast<size_t>(count);
                int j = count - 1;
                for (int k = 0; k < count; j = k++) {
                    int a = k, b = j;
                    // skip the edge if horizontal
                    if (p[j].y == p[k].y)
                        continue;
                    // add edge from j to k to the list
                    Edge edge{};
                    edge.invert = 0;
                    if (invert ? p[j].y > p[k].y : p[j].y < p[k].y) {
                        edge.invert = 1;
                        a = j, b = k;
                    }
                    edge.x0 = p[a].x * scale_x + shift_x;
                    edge.y0 = p[a].y * y_scale_inv + shift_y;
                    edge.x1 = p[b].x * scale_x + shift_x;
                    edge.y1 = p[b].y * y_scale_inv + shift_y;
                    e.push_back(edge);
                }
            }
            e.push_back(Edge{}); // sentinel
        }

        // Sweeps the y-sorted edges row by row. `e[n_edges]` must exist; it is
        // overwritten with the sentinel that stops edge insertion.
        inline void RasterizeSortedEdges(Bitmap& out, Edge* e, int n_edges,
                int off_x, int off_y) noexcept {
            if (out.w <= 0 || out.h <= 0) return;

            ActiveEdgePool pool;
            std::vector<float> scan;
            try {
                scan.assign(static_cast<size_t>(2 * out.w + 1), 0.f);
            } catch (const std::bad_alloc&) {
                ClearBitmap(out);
                return;
            }
            float* scanline = scan.data();            // len out.w
            float* scanline2 = scan.data() + out.w;   // len out.w + 1

            e[n_edges].y0 = static_cast<float>(off_y + out.h) + 1;

            Handle active = kNullHandle;
            int y = off_y;
            int j = 0;
            const Edge* ed = e;

            while (j < out.h) {
                const float scan_y_top    = static_cast<float>(y);
                const float scan_y_bottom = static_cast<float>(y) + 1.0f;

                memset(scanline, 0, (2 * static_cast<size_t>(out.w) + 1) * sizeof(float));

                // remove all active edges that terminate before the top of this scanline
                Handle* step = &active;
                while (*step != kNullHandle) {
                    const Handle h = *step;
                    ActiveEdge& z = pool[h];
                    if (z.ey <= scan_y_top) {
                        *step = z.next; // delete from list
                        TTRASTER_assert(z.direction != 0.f);
                        z.direction = 0.f;
                        pool.Free(h);
                    } else {
                        step = &z.next; // advance through list
                    }
                }

                // insert all edges that start before the bottom of this scanline
                while (ed->y0 <= scan_y_bottom) {
                    // edges ending above the first row cover nothing; they come
                    // from fp rounding or from a glyph box that clips the outline
                    if (ed->y0 != ed->y1 && ed->y1 >= scan_y_top) {
                        const Handle h = pool.Alloc();
                        if (h == kNullHandle) {
                            ClearBitmap(out);
                            return;
                        }
                        ActiveEdge& z = pool[h];
                        ActiveEdge::InitFromEdge(z, *ed, off_x, scan_y_top);
                        TTRASTER_assert(z.ey >= scan_y_top);

                        // insert at front
                        z.next = active;
                        active = h;
                    }
                    ++ed;
                }

                // now process all active edges
                if (active != kNullHandle)
                    FillActiveEdges(scanline, scanline2 + 1, out.w, pool, active, scan_y_top);

                float sum = 0.0f;
                uint8_t* dst = out.pixels + static_cast<size_t>(j) * out.stride;

                // write pixels
                for (int i = 0; i < out.w; ++i) {
                    sum += scanline2[i];
                    const float k = scanline[i] + sum;

                    // clamp to [0..255]
                    int m = static_cast<int>(fabs(k) * 255.0f + 0.5f);
                    if (m > 255) m = 255;
                    dst[i] = static_cast<uint8_t>(m);
                }
                // advance all the edges
                for (Handle h = active; h != kNullHandle; h = pool[h].next)
                    pool[h].fx += pool[h].fdx;

                ++y;
                ++j;
            }
        } // RasterizeSortedEdges

        // Edge build, sort and sweep over already flattened contours.
        inline void RasterizeContours(Bitmap& out, const ContourSet& contours,
                float scale_x, float scale_y, float shift_x, float shift_y,
                int off_x, int off_y, bool invert) noexcept {
            std::vector<Edge> e;
            try {
                BuildEdges(contours, scale_x, scale_y, shift_x, shift_y, invert, e);
            } catch (const std::bad_alloc&) {
                ClearBitmap(out);
                return;
            }
            const int n = static_cast<int>(e.size()) - 1;

            // now sort the edges by their highest point
            SortEdges(e.data(), n);

            // now, traverse the scanlines and find the intersections on each scanline
            RasterizeSortedEdges(out, e.data(), n, off_x, off_y);
        }

    } // namespace detail
} // namespace ttraster

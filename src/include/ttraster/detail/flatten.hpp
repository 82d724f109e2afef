#pragma once

#include <stddef.h> // size_t
#include <new>      // std::bad_alloc

#include "../config.hpp"
#include "../types.hpp"

namespace ttraster {
    namespace detail {

        // Output policies for the two flattening passes. Both receive exactly
        // the same calls, so the counted size is the filled size.
        struct CountSink {
            size_t num_points{};
            int num_contours{};

            inline void BeginContour() noexcept { ++num_contours; }
            inline void AddPoint(float, float) noexcept { ++num_points; }
        };

        struct FillSink {
            Point* points{};
            int* lengths{};
            size_t num_points{};
            int num_contours{};

            inline void BeginContour() noexcept {
                lengths[num_contours++] = 0;
            }
            inline void AddPoint(float x, float y) noexcept {
                points[num_points].x = x;
                points[num_points].y = y;
                ++num_points;
                ++lengths[num_contours - 1];
            }
        };

        template <class Sink>
        inline void TesselateCurve(Sink& sink,
                float x0, float y0, float x1, float y1, float x2, float y2,
                float objspace_flatness_squared, int n) noexcept {
            // midpoint
            const float mx = (x0 + 2*x1 + x2)/4;
            const float my = (y0 + 2*y1 + y2)/4;
            // versus directly drawn line
            const float dx = (x0+x2)/2 - mx;
            const float dy = (y0+y2)/2 - my;
            if (n > TTRASTER_MAX_CURVE_SUBDIVISION) // 65536 segments on one curve better be enough!
                return;

            if (dx*dx + dy*dy > objspace_flatness_squared) {
                TesselateCurve(sink, x0, y0, (x0+x1)/2.f, (y0+y1)/2.f, mx, my, objspace_flatness_squared, n+1);
                TesselateCurve(sink, mx, my, (x1+x2)/2.f, (y1+y2)/2.f, x2, y2, objspace_flatness_squared, n+1);
            } else {
                sink.AddPoint(x2, y2);
            }
        }

        template <class Sink>
        inline void WalkOutline(const GlyphOutline& vertices,
                float objspace_flatness_squared, Sink& sink) noexcept {
            float x = 0, y = 0;
            bool started = false;
            for (const Vertex& v : vertices) {
                switch (v.kind) {
                case Vertex::Kind::Move:
                    // start the next contour
                    sink.BeginContour();
                    started = true;
                    x = v.x, y = v.y;
                    sink.AddPoint(x, y);
                    break;
                case Vertex::Kind::Line:
                    if (!started) break;
                    x = v.x, y = v.y;
                    sink.AddPoint(x, y);
                    break;
                case Vertex::Kind::Curve:
                    if (!started) break;
                    TesselateCurve(sink, x, y, v.cx, v.cy, v.x, v.y,
                                   objspace_flatness_squared, 0);
                    x = v.x, y = v.y;
                    break;
                }
            }
        }

        // Number of points FlattenCurves produces for the same arguments.
        inline size_t CountFlattenedPoints(const GlyphOutline& vertices,
                                           float objspace_flatness) noexcept {
            CountSink count;
            WalkOutline(vertices, objspace_flatness * objspace_flatness, count);
            return count.num_points;
        }

        // Flattens the outline into polylines. Runs one counting pass, allocates
        // exactly, then fills. On allocation failure `out` is left empty.
        inline void FlattenCurves(const GlyphOutline& vertices, float objspace_flatness,
                                  ContourSet& out) noexcept {
            out.points.clear();
            out.lengths.clear();

            const float objspace_flatness_squared = objspace_flatness * objspace_flatness;

            CountSink count;
            WalkOutline(vertices, objspace_flatness_squared, count);
            if (count.num_contours == 0) return;

            try {
                out.points.resize(count.num_points);
                out.lengths.resize(static_cast<size_t>(count.num_contours));
            } catch (const std::bad_alloc&) {
                out.points = std::vector<Point>();
                out.lengths = std::vector<int>();
                return;
            }

            FillSink fill;
            fill.points = out.points.data();
            fill.lengths = out.lengths.data();
            WalkOutline(vertices, objspace_flatness_squared, fill);
            TTRASTER_assert(fill.num_points == count.num_points);
            TTRASTER_assert(fill.num_contours == count.num_contours);
        }

    } // namespace detail
} // namespace ttraster

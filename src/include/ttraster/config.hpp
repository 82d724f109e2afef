#pragma once

// ------------------- Compile-time configuration ----------------------------
//
// Define any of these before including ttraster.hpp to override them.

#if defined(_DEBUG) || !defined(NDEBUG)
#   include <assert.h>
#   define TTRASTER_assert(x) assert(x)
#else
#   define TTRASTER_assert(x) ((void)0)
#endif

// Maximum nesting of composite glyph references. Deeper chains (and cycles)
// fail with Error::Malformed.
#ifndef TTRASTER_MAX_COMPOSITE_DEPTH
#   define TTRASTER_MAX_COMPOSITE_DEPTH 8
#endif

// Flattening tolerance, in output pixels, used by the bitmap entry points.
#ifndef TTRASTER_FLATNESS_IN_PIXELS
#   define TTRASTER_FLATNESS_IN_PIXELS 0.35f
#endif

// Recursion limit for quadratic curve subdivision (2^16 segments per curve).
#ifndef TTRASTER_MAX_CURVE_SUBDIVISION
#   define TTRASTER_MAX_CURVE_SUBDIVISION 16
#endif

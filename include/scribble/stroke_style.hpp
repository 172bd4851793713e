#pragma once

/**
 * @file stroke_style.hpp
 * @brief Stroke appearance shared by every path on a canvas.
 */

#include "scribble/types.hpp"

namespace scribble {

/// @brief Shape drawn at the two open ends of a stroke.
enum class StrokeCap : u8 {
    Butt,    ///< Stroke ends exactly at the end point.
    Round,   ///< Half-disk of radius width/2 around the end point.
    Square,  ///< Stroke extends width/2 past the end point.
};

/// @brief Shape drawn where two segments of a stroke meet.
enum class StrokeJoin : u8 {
    Miter,  ///< Sharp corner, falls back to Bevel beyond the miter limit.
    Round,  ///< Disk of radius width/2 at the vertex.
    Bevel,  ///< Corner cut straight across the outer edge.
};

/// @brief Immutable stroke configuration applied uniformly at render time.
///
/// Defaults are a 10 pixel opaque blue line with round caps and joins.
struct StrokeStyle {
    Color color = {0, 0, 255, 255};      ///< Stroke color.
    f32 width = 10.0f;                   ///< Stroke width in pixels.
    StrokeCap cap = StrokeCap::Round;    ///< End cap.
    StrokeJoin join = StrokeJoin::Round; ///< Segment join.
    f32 miterLimit = 4.0f;               ///< Miter length / half width cutoff.
};

} // namespace scribble

#pragma once

/**
 * @file coordinate_mapping.hpp
 * @brief Conversion from logical input coordinates to device pixel coordinates.
 */

#include "scribble/types.hpp"
#include <optional>

namespace scribble {

/// @brief Check whether a logical canvas size can be mapped from.
/// @param logical Logical canvas size.
/// @return True if both dimensions are finite and positive.
bool isMappable(Size logical);

/// @brief Map a point from logical input units to pixels.
///
/// pixel.x = pixelSize.width * point.x / logicalSize.width, and likewise for y.
/// A canvas that has not been laid out yet (zero logical width or height)
/// has no mapping; the caller should drop the point.
///
/// @param point Point in logical units.
/// @param logicalSize Canvas size in logical units.
/// @param pixelSize Canvas size in pixels.
/// @return The pixel-space point, or std::nullopt if the mapping is undefined
///         or would not be finite.
std::optional<Point> toPixel(Point point, Size logicalSize, Size pixelSize);

} // namespace scribble

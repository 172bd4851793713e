#pragma once

/**
 * @file path.hpp
 * @brief Append-only polyline representing one finger stroke.
 */

#include "scribble/types.hpp"
#include <vector>

namespace scribble {

/// @brief One continuous stroke, stored as its ordered vertices.
///
/// A Path always has its start point. It only grows at the end; existing
/// points are never reordered or edited.
class Path {
public:
    /// @brief Start a path at the given point.
    /// @param start First vertex, in pixel coordinates.
    explicit Path(Point start) { points_.push_back(start); }

    /// @brief Append a line segment from the current end point to p.
    void lineTo(Point p) { points_.push_back(p); }

    /// @brief First vertex.
    Point start() const { return points_.front(); }

    /// @brief Last vertex.
    Point end() const { return points_.back(); }

    /// @brief All vertices in insertion order.
    const std::vector<Point>& points() const { return points_; }

    /// @brief Number of vertices (segments + 1).
    i32 count() const { return static_cast<i32>(points_.size()); }

    /// @brief Number of line segments.
    i32 segmentCount() const { return count() - 1; }

private:
    std::vector<Point> points_;
};

} // namespace scribble

#pragma once

/**
 * @file draw_op_visitor.hpp
 * @brief Visitor interface for traversing recorded draw operations.
 */

#include "scribble/types.hpp"
#include "scribble/stroke_style.hpp"

namespace scribble {

/// @brief Visitor interface for traversing recorded draw operations.
///
/// Implement this interface to process drawing commands dispatched by
/// Recording::accept() or Recording::dispatch().
class DrawOpVisitor {
public:
    virtual ~DrawOpVisitor() = default;

    /// @brief Visit a clear command.
    /// @param color Color written to the whole target.
    virtual void visitClear(Color color) = 0;

    /// @brief Visit a filled rectangle command.
    /// @param rect The rectangle to fill.
    /// @param color Fill color.
    virtual void visitFillRect(Rect rect, Color color) = 0;

    /// @brief Visit a stroked polyline command.
    /// @param points Array of vertices, valid for the duration of the call.
    /// @param count Number of points.
    /// @param style Stroke appearance.
    virtual void visitStrokePath(const Point* points, i32 count, const StrokeStyle& style) = 0;
};

} // namespace scribble

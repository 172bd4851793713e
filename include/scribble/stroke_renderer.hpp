#pragma once

/**
 * @file stroke_renderer.hpp
 * @brief Composites completed and in-progress strokes into a frame.
 */

#include "scribble/types.hpp"
#include "scribble/stroke_style.hpp"
#include "scribble/stroke_tracker.hpp"

namespace scribble {

class Canvas;
class Surface;

/**
 * @brief Draws every tracked stroke with one shared style.
 *
 * A frame is: clear to the background, completed strokes in completion
 * order, then in-progress strokes in ascending touch id order. In-progress
 * strokes are recorded on a higher layer, so they always land on top.
 */
class StrokeRenderer {
public:
    static constexpr u8 kBackgroundLayer = 0;  ///< Layer of the clear.
    static constexpr u8 kCompletedLayer = 1;   ///< Layer of finished strokes.
    static constexpr u8 kInProgressLayer = 2;  ///< Layer of strokes still being drawn.

    /// @brief Construct a renderer.
    /// @param style Stroke style applied to every path.
    /// @param background Color the frame is cleared to.
    explicit StrokeRenderer(const StrokeStyle& style = StrokeStyle(),
                            Color background = {255, 255, 255, 255});

    const StrokeStyle& style() const { return style_; }
    Color background() const { return background_; }

    /// @brief Record one frame into a canvas.
    /// @param canvas Destination canvas (ignored if null).
    /// @param completed Finished strokes, in completion order.
    /// @param inProgress Strokes still being drawn.
    void render(Canvas* canvas,
                const StrokeTracker::CompletedPaths& completed,
                const StrokeTracker::InProgressPaths& inProgress) const;

    /// @brief Render a complete frame of the tracker's current state.
    ///
    /// Runs beginFrame/endFrame/flush on the surface. The tracker is locked
    /// only while the frame is recorded.
    /// @param surface Destination surface (ignored if null).
    /// @param tracker Source of the strokes.
    void render(Surface* surface, const StrokeTracker& tracker) const;

private:
    StrokeStyle style_;
    Color background_;
};

} // namespace scribble

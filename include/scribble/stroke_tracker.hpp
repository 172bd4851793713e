#pragma once

/**
 * @file stroke_tracker.hpp
 * @brief State machine turning per-finger touch events into strokes.
 */

#include "scribble/types.hpp"
#include "scribble/path.hpp"
#include "scribble/touch.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace scribble {

/**
 * @brief Receives "redraw needed" signals from the tracker.
 *
 * Implemented by the host's display loop. Calls are fire-and-forget and may
 * arrive in bursts; the host is free to coalesce them into one frame.
 */
class RedrawTarget {
public:
    virtual ~RedrawTarget() = default;

    /// @brief Schedule a repaint. Must not block.
    virtual void requestRedraw() = 0;
};

/**
 * @brief Tracks one in-progress stroke per active touch and the list of
 *        finished strokes.
 *
 * Event handling per identifier:
 *
 *   - Pressed   starts a stroke at the mapped location, unless one is already
 *               in progress for that id.
 *   - Moved     extends the id's stroke; ignored for untracked ids.
 *   - Released  moves the id's stroke to the end of the completed list.
 *   - Cancelled discards the id's stroke.
 *   - Entered and Exited are ignored.
 *
 * Locations arrive in logical units and are stored in pixels, using the
 * sizes last given to setCanvasSize(). Pressed and Moved are dropped while
 * the logical size is degenerate.
 *
 * All state is guarded by one mutex, so touch handling and rendering may run
 * on different threads. Redraw requests are made after the lock is released.
 */
class StrokeTracker {
public:
    using CompletedPaths = std::vector<Path>;
    using InProgressPaths = std::map<TouchId, Path>;

    /// @brief Construct a tracker.
    /// @param redraw Target notified on every state change (may be null).
    explicit StrokeTracker(RedrawTarget* redraw = nullptr);

    /// @brief Replace the redraw target (may be null).
    void setRedrawTarget(RedrawTarget* redraw);

    /// @brief Update the canvas dimensions used for coordinate mapping.
    /// @param logical Size in input (logical) units.
    /// @param pixel Size of the drawing surface in pixels.
    void setCanvasSize(Size logical, Size pixel);

    /// @brief Current logical canvas size.
    Size logicalSize() const;
    /// @brief Current pixel canvas size.
    Size pixelSize() const;

    /// @brief Process one touch event.
    /// @param id Contact identifier.
    /// @param action What happened to the contact.
    /// @param location Location in logical units.
    /// @return True if the event changed the tracked strokes.
    bool handleTouch(TouchId id, TouchAction action, Point location);

    /// @copydoc handleTouch(TouchId, TouchAction, Point)
    bool handleTouch(const TouchEvent& event);

    /// @brief Discard every completed and in-progress stroke.
    void clear();

    /// @brief Copy of the completed strokes, in completion order.
    CompletedPaths completedPaths() const;

    /// @brief Copy of the in-progress strokes, keyed by touch id.
    InProgressPaths inProgressPaths() const;

    std::size_t completedCount() const;
    std::size_t inProgressCount() const;

    /// @brief Check whether a stroke is in progress for an id.
    bool isTracking(TouchId id) const;

    /**
     * @brief Visit the live state under the tracker's lock.
     *
     * fn is called as fn(const CompletedPaths&, const InProgressPaths&). It
     * must not call back into the tracker.
     */
    template <typename Fn>
    void read(Fn&& fn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(static_cast<const CompletedPaths&>(completed_),
           static_cast<const InProgressPaths&>(inProgress_));
    }

private:
    bool apply(TouchId id, TouchAction action, Point location);
    void notify() const;

    mutable std::mutex mutex_;
    RedrawTarget* redraw_ = nullptr;
    Size logicalSize_;
    Size pixelSize_;
    CompletedPaths completed_;
    InProgressPaths inProgress_;
};

} // namespace scribble

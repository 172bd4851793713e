#include "scribble/stroke_tracker.hpp"
#include "scribble/coordinate_mapping.hpp"
#include <utility>

namespace scribble {

StrokeTracker::StrokeTracker(RedrawTarget* redraw) : redraw_(redraw) {}

void StrokeTracker::setRedrawTarget(RedrawTarget* redraw) {
    std::lock_guard<std::mutex> lock(mutex_);
    redraw_ = redraw;
}

void StrokeTracker::setCanvasSize(Size logical, Size pixel) {
    std::lock_guard<std::mutex> lock(mutex_);
    logicalSize_ = logical;
    pixelSize_ = pixel;
}

Size StrokeTracker::logicalSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return logicalSize_;
}

Size StrokeTracker::pixelSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pixelSize_;
}

bool StrokeTracker::handleTouch(const TouchEvent& event) {
    return handleTouch(event.id, event.action, event.location);
}

bool StrokeTracker::handleTouch(TouchId id, TouchAction action, Point location) {
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = apply(id, action, location);
    }
    if (changed) notify();
    return changed;
}

// Caller holds mutex_.
bool StrokeTracker::apply(TouchId id, TouchAction action, Point location) {
    switch (action) {
    case TouchAction::Pressed: {
        if (inProgress_.count(id)) return false;
        auto start = toPixel(location, logicalSize_, pixelSize_);
        if (!start) return false;
        inProgress_.emplace(id, Path(*start));
        return true;
    }
    case TouchAction::Moved: {
        auto it = inProgress_.find(id);
        if (it == inProgress_.end()) return false;
        auto next = toPixel(location, logicalSize_, pixelSize_);
        if (!next) return false;
        it->second.lineTo(*next);
        return true;
    }
    case TouchAction::Released: {
        auto it = inProgress_.find(id);
        if (it == inProgress_.end()) return false;
        completed_.push_back(std::move(it->second));
        inProgress_.erase(it);
        return true;
    }
    case TouchAction::Cancelled: {
        auto it = inProgress_.find(id);
        if (it == inProgress_.end()) return false;
        inProgress_.erase(it);
        return true;
    }
    case TouchAction::Entered:
    case TouchAction::Exited:
        return false;
    }
    return false;
}

void StrokeTracker::clear() {
    bool changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        changed = !completed_.empty() || !inProgress_.empty();
        completed_.clear();
        inProgress_.clear();
    }
    if (changed) notify();
}

void StrokeTracker::notify() const {
    RedrawTarget* target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = redraw_;
    }
    if (target) target->requestRedraw();
}

StrokeTracker::CompletedPaths StrokeTracker::completedPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

StrokeTracker::InProgressPaths StrokeTracker::inProgressPaths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inProgress_;
}

std::size_t StrokeTracker::completedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_.size();
}

std::size_t StrokeTracker::inProgressCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inProgress_.size();
}

bool StrokeTracker::isTracking(TouchId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inProgress_.count(id) != 0;
}

} // namespace scribble

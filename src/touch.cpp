#include "scribble/touch.hpp"

namespace scribble {

const char* touchActionName(TouchAction action) {
    switch (action) {
    case TouchAction::Entered:   return "Entered";
    case TouchAction::Pressed:   return "Pressed";
    case TouchAction::Moved:     return "Moved";
    case TouchAction::Released:  return "Released";
    case TouchAction::Cancelled: return "Cancelled";
    case TouchAction::Exited:    return "Exited";
    }
    return "Unknown";
}

TouchId TouchIdMap::acquire(i64 device, i64 contact) {
    auto inserted = ids_.emplace(std::make_pair(device, contact), next_);
    if (inserted.second) ++next_;
    return inserted.first->second;
}

std::optional<TouchId> TouchIdMap::find(i64 device, i64 contact) const {
    auto it = ids_.find({device, contact});
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

std::optional<TouchId> TouchIdMap::release(i64 device, i64 contact) {
    auto it = ids_.find({device, contact});
    if (it == ids_.end()) return std::nullopt;
    TouchId id = it->second;
    ids_.erase(it);
    return id;
}

} // namespace scribble

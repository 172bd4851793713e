#pragma once

/**
 * @file touch.hpp
 * @brief Normalized touch events delivered by the host's input layer.
 */

#include "scribble/types.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace scribble {

/// @brief Identifies one contact from press until release or cancel.
using TouchId = i64;

/// @brief What happened to a contact.
enum class TouchAction : u8 {
    Entered,    ///< Pointer moved over the canvas without contact.
    Pressed,    ///< Contact went down.
    Moved,      ///< Contact moved.
    Released,   ///< Contact lifted; the stroke is finished.
    Cancelled,  ///< The platform aborted the contact; the stroke is discarded.
    Exited,     ///< Pointer left the canvas without contact.
};

/// @brief One touch event in logical canvas coordinates.
struct TouchEvent {
    TouchId id = 0;
    TouchAction action = TouchAction::Pressed;
    Point location;
};

/// @brief Human-readable name of an action, for host logging.
const char* touchActionName(TouchAction action);

/**
 * @brief Assigns process-unique TouchIds to platform contacts.
 *
 * Platforms often number contacts per input device, so the same contact
 * number can be live on two devices at once. The map keys each contact by
 * (device, contact) and hands out ids that are never reused. Ids start at 1.
 *
 * Not thread-safe; use it from the thread that receives platform input.
 */
class TouchIdMap {
public:
    /// @brief Id for a contact going down.
    /// @return A fresh id, or the current one if the contact is already mapped.
    TouchId acquire(i64 device, i64 contact);

    /// @brief Id of a live contact, or nullopt if it was never acquired.
    std::optional<TouchId> find(i64 device, i64 contact) const;

    /// @brief Forget a contact that lifted or was cancelled.
    /// @return The id it had, or nullopt if it was not mapped.
    std::optional<TouchId> release(i64 device, i64 contact);

    /// @brief Number of live contacts.
    std::size_t size() const { return ids_.size(); }

private:
    std::map<std::pair<i64, i64>, TouchId> ids_;
    TouchId next_ = 1;
};

} // namespace scribble

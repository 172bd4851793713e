#pragma once

/**
 * @file pixel_data.hpp
 * @brief Non-owning view of a finished frame, for handing pixels to a host.
 */

#include "scribble/types.hpp"
#include "scribble/pixmap.hpp"
#include <cstdint>

namespace scribble {

/// @brief Non-owning view of rendered pixels.
///
/// Hosts use this to upload a frame into a window texture. The view is only
/// valid until the owning surface is resized or destroyed.
struct PixelData {
    const void* data = nullptr;  ///< First byte of row 0
    i32 width = 0;
    i32 height = 0;
    i32 rowBytes = 0;
    PixelFormat format = PixelFormat::BGRA8888;

    PixelData() = default;

    PixelData(const void* pixels, i32 w, i32 h, i32 stride, PixelFormat fmt)
        : data(pixels), width(w), height(h), rowBytes(stride), format(fmt) {}

    /// @brief Check if the view points to displayable pixels.
    bool isValid() const { return data != nullptr && width > 0 && height > 0 && rowBytes > 0; }

    /// @brief Total size of the viewed memory in bytes (height × rowBytes).
    std::int64_t sizeBytes() const { return std::int64_t(height) * rowBytes; }

    /// @brief Pointer to the first pixel of row y.
    const u32* row(i32 y) const {
        return reinterpret_cast<const u32*>(static_cast<const u8*>(data) + std::int64_t(y) * rowBytes);
    }
};

} // namespace scribble

#pragma once

/**
 * @file pixmap.hpp
 * @brief 32-bit pixel buffers that the CPU renderer draws strokes into.
 */

#include "scribble/types.hpp"

namespace scribble {

/// @brief Byte order of a 32-bit pixel in memory.
///
/// Packed u32 values assume a little-endian host.
enum class PixelFormat {
    RGBA8888,  ///< Bytes R, G, B, A.
    BGRA8888,  ///< Bytes B, G, R, A. Matches SDL's ARGB8888 texture format.
};

/// @brief Pack a color into a 32-bit pixel of the given format.
inline u32 PackColor(Color c, PixelFormat fmt) {
    if (fmt == PixelFormat::BGRA8888) {
        return (u32(c.a) << 24) | (u32(c.r) << 16) | (u32(c.g) << 8) | u32(c.b);
    }
    return (u32(c.a) << 24) | (u32(c.b) << 16) | (u32(c.g) << 8) | u32(c.r);
}

/// @brief Unpack a 32-bit pixel of the given format into a color.
inline Color UnpackColor(u32 pixel, PixelFormat fmt) {
    u8 a = u8((pixel >> 24) & 0xFF);
    u8 hi = u8((pixel >> 16) & 0xFF);
    u8 g = u8((pixel >> 8) & 0xFF);
    u8 lo = u8(pixel & 0xFF);
    if (fmt == PixelFormat::BGRA8888) {
        return {hi, g, lo, a};
    }
    return {lo, g, hi, a};
}

/// @brief Size, row pitch and format of a pixel buffer.
struct PixmapInfo {
    i32 width = 0;
    i32 height = 0;
    i32 stride = 0;  ///< Bytes per row, at least width * 4.
    PixelFormat format = PixelFormat::RGBA8888;

    /// @brief Bytes covered by the buffer (stride × height).
    i32 computeByteSize() const { return stride * height; }

    /// @brief Tightly packed buffer of w × h pixels.
    static PixmapInfo Make(i32 w, i32 h, PixelFormat fmt) {
        PixmapInfo info;
        info.width = w;
        info.height = h;
        info.stride = w * 4;
        info.format = fmt;
        return info;
    }

    static PixmapInfo MakeRGBA(i32 w, i32 h) { return Make(w, h, PixelFormat::RGBA8888); }
    static PixmapInfo MakeBGRA(i32 w, i32 h) { return Make(w, h, PixelFormat::BGRA8888); }
};

/**
 * @brief A pixel buffer that either owns its memory or borrows the caller's.
 *
 * Move-only. An owning Pixmap frees its pixels on destruction; a wrapped one
 * never does.
 */
class Pixmap {
public:
    /// @brief Allocate a zero-filled buffer.
    /// @return The pixmap, or an invalid one if the size is empty or too small
    ///         for the stride.
    static Pixmap Alloc(const PixmapInfo& info);

    /// @brief Borrow caller memory laid out as info describes.
    static Pixmap Wrap(const PixmapInfo& info, void* pixels);

    Pixmap() = default;
    ~Pixmap();

    Pixmap(Pixmap&& other) noexcept;
    Pixmap& operator=(Pixmap&& other) noexcept;
    Pixmap(const Pixmap&) = delete;
    Pixmap& operator=(const Pixmap&) = delete;

    void* addr() { return pixels_; }
    const void* addr() const { return pixels_; }
    u8* addr8() { return static_cast<u8*>(pixels_); }
    const u8* addr8() const { return static_cast<const u8*>(pixels_); }
    u32* addr32() { return static_cast<u32*>(pixels_); }
    const u32* addr32() const { return static_cast<const u32*>(pixels_); }

    const PixmapInfo& info() const { return info_; }
    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    i32 stride() const { return info_.stride; }
    PixelFormat format() const { return info_.format; }

    /// @brief True when there are pixels to draw into.
    bool valid() const { return pixels_ != nullptr && info_.width > 0 && info_.height > 0; }

    void* rowAddr(i32 y) { return addr8() + y * info_.stride; }
    const void* rowAddr(i32 y) const { return addr8() + y * info_.stride; }

    /// @brief Read back one pixel as a color.
    /// @return The pixel color, or transparent black when (x, y) is outside.
    Color getColor(i32 x, i32 y) const;

    /// @brief Set every pixel to c.
    void clear(Color c);

    /// @brief Drop the pixels, freeing them if owned.
    void reset();

    /// @brief Replace the buffer with a fresh owned one described by info.
    void reallocate(const PixmapInfo& info);

private:
    Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels);

    PixmapInfo info_;
    void* pixels_ = nullptr;
    bool ownsPixels_ = false;
};

} // namespace scribble

#include "scribble/pixmap.hpp"
#include <cstdlib>
#include <utility>

namespace scribble {

Pixmap::Pixmap(const PixmapInfo& info, void* pixels, bool ownsPixels)
    : info_(info), pixels_(pixels), ownsPixels_(ownsPixels) {
}

Pixmap Pixmap::Alloc(const PixmapInfo& info) {
    if (info.width <= 0 || info.height <= 0 || info.stride < info.width * 4) {
        return Pixmap();
    }
    void* pixels = std::calloc(size_t(info.computeByteSize()), 1);
    if (!pixels) return Pixmap();
    return Pixmap(info, pixels, true);
}

Pixmap Pixmap::Wrap(const PixmapInfo& info, void* pixels) {
    return Pixmap(info, pixels, false);
}

Pixmap::~Pixmap() {
    reset();
}

Pixmap::Pixmap(Pixmap&& other) noexcept
    : info_(other.info_), pixels_(other.pixels_), ownsPixels_(other.ownsPixels_) {
    other.info_ = {};
    other.pixels_ = nullptr;
    other.ownsPixels_ = false;
}

Pixmap& Pixmap::operator=(Pixmap&& other) noexcept {
    if (this != &other) {
        reset();
        info_ = other.info_;
        pixels_ = other.pixels_;
        ownsPixels_ = other.ownsPixels_;
        other.info_ = {};
        other.pixels_ = nullptr;
        other.ownsPixels_ = false;
    }
    return *this;
}

Color Pixmap::getColor(i32 x, i32 y) const {
    if (!valid() || x < 0 || x >= info_.width || y < 0 || y >= info_.height) {
        return {0, 0, 0, 0};
    }
    const u32* row = static_cast<const u32*>(rowAddr(y));
    return UnpackColor(row[x], info_.format);
}

void Pixmap::clear(Color c) {
    if (!valid()) return;
    u32 pixel = PackColor(c, info_.format);
    for (i32 y = 0; y < info_.height; ++y) {
        u32* row = static_cast<u32*>(rowAddr(y));
        for (i32 x = 0; x < info_.width; ++x) {
            row[x] = pixel;
        }
    }
}

void Pixmap::reset() {
    if (ownsPixels_) {
        std::free(pixels_);
    }
    pixels_ = nullptr;
    ownsPixels_ = false;
    info_ = {};
}

void Pixmap::reallocate(const PixmapInfo& info) {
    // Wrapped memory cannot grow; the pixmap takes ownership of a fresh buffer.
    Pixmap fresh = Alloc(info);
    *this = std::move(fresh);
}

} // namespace scribble

#include "scribble/surface.hpp"
#include "scribble/canvas.hpp"
#include "scribble/device.hpp"
#include "scribble/draw_pass.hpp"
#include "cpu_renderer.hpp"

namespace scribble {

Surface::Surface(std::unique_ptr<Renderer> renderer, std::unique_ptr<Pixmap> pixmap, i32 w, i32 h)
    : device_(),
      renderer_(std::move(renderer)),
      pixmap_(std::move(pixmap)),
      width_(w),
      height_(h) {
    canvas_ = std::make_unique<Canvas>(&device_);
}

Surface::~Surface() = default;

std::unique_ptr<Surface> Surface::MakeRaster(i32 w, i32 h, PixelFormat fmt) {
    PixmapInfo info = PixmapInfo::Make(w, h, fmt);
    auto pixmap = std::make_unique<Pixmap>(Pixmap::Alloc(info));
    if (!pixmap->valid()) return nullptr;
    auto renderer = std::make_unique<CpuRenderer>(pixmap.get());
    return std::unique_ptr<Surface>(new Surface(std::move(renderer), std::move(pixmap), w, h));
}

std::unique_ptr<Surface> Surface::MakeRasterDirect(const PixmapInfo& info, void* pixels) {
    auto pixmap = std::make_unique<Pixmap>(Pixmap::Wrap(info, pixels));
    if (!pixmap->valid()) return nullptr;
    auto renderer = std::make_unique<CpuRenderer>(pixmap.get());
    return std::unique_ptr<Surface>(
        new Surface(std::move(renderer), std::move(pixmap), info.width, info.height));
}

std::unique_ptr<Surface> Surface::MakeRecording(i32 w, i32 h) {
    if (w <= 0 || h <= 0) return nullptr;
    return std::unique_ptr<Surface>(new Surface(nullptr, nullptr, w, h));
}

void Surface::resize(i32 w, i32 h) {
    if (w == width_ && h == height_) return;
    width_ = w;
    height_ = h;
    if (pixmap_) {
        PixmapInfo info = PixmapInfo::Make(w, h, pixmap_->format());
        pixmap_->reallocate(info);
    }
    if (renderer_) {
        renderer_->resize(w, h);
    }
}

void Surface::beginFrame(Color clearColor) {
    device_.beginFrame();
    if (renderer_) {
        renderer_->beginFrame(clearColor);
    }
}

void Surface::endFrame() {
    device_.endFrame();
    if (renderer_) {
        renderer_->endFrame();
    }
}

void Surface::flush() {
    if (!renderer_) return;
    auto recording = device_.finishRecording();
    if (!recording) return;

    DrawPass pass = DrawPass::create(*recording);
    renderer_->execute(*recording, pass);
}

Pixmap* Surface::peekPixels() {
    return pixmap_.get();
}

const Pixmap* Surface::peekPixels() const {
    return pixmap_.get();
}

PixelData Surface::getPixelData() const {
    if (pixmap_ && pixmap_->valid()) {
        const auto& info = pixmap_->info();
        return PixelData(pixmap_->addr(), info.width, info.height,
                         info.stride, info.format);
    }
    return PixelData();
}

std::unique_ptr<Recording> Surface::takeRecording() {
    return device_.finishRecording();
}

} // namespace scribble

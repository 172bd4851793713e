#include "scribble/device.hpp"

namespace scribble {

void Device::beginFrame() {
    recorder_.reset();
    recording_.reset();
}

void Device::endFrame() {
    recording_ = recorder_.finish();
}

void Device::clear(Color c) {
    recorder_.clear(c);
}

void Device::fillRect(Rect r, Color c) {
    recorder_.fillRect(r, c);
}

void Device::strokePath(const Point* pts, i32 count, const StrokeStyle& style) {
    recorder_.strokePath(pts, count, style);
}

void Device::setLayer(u8 layer) {
    recorder_.setLayer(layer);
}

u8 Device::layer() const {
    return recorder_.layer();
}

std::unique_ptr<Recording> Device::finishRecording() {
    return std::move(recording_);
}

}

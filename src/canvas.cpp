#include "scribble/canvas.hpp"
#include "scribble/device.hpp"
#include "scribble/path.hpp"

namespace scribble {

Canvas::Canvas(Device* device) : device_(device) {}

void Canvas::clear(Color c) {
    device_->clear(c);
}

void Canvas::fillRect(Rect r, Color c) {
    if (r.w <= 0 || r.h <= 0) return;
    device_->fillRect(r, c);
}

void Canvas::drawPath(const Path& path, const StrokeStyle& style) {
    strokePolyline(path.points().data(), path.count(), style);
}

void Canvas::strokePolyline(const Point* pts, i32 count, const StrokeStyle& style) {
    if (!pts || count <= 0) return;
    if (style.width <= 0 || style.color.a == 0) return;
    device_->strokePath(pts, count, style);
}

void Canvas::setLayer(u8 layer) {
    device_->setLayer(layer);
}

u8 Canvas::layer() const {
    return device_->layer();
}

}

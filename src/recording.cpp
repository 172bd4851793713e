#include "scribble/recording.hpp"
#include "scribble/draw_op_visitor.hpp"
#include "scribble/draw_pass.hpp"

namespace scribble {

// --- DrawOpArena ---

DrawOpArena::DrawOpArena(size_t initialCapacity) {
    data_.reserve(initialCapacity);
}

u32 DrawOpArena::allocate(size_t bytes) {
    u32 offset = static_cast<u32>(data_.size());
    data_.resize(data_.size() + bytes);
    return offset;
}

u32 DrawOpArena::storePoints(const Point* pts, i32 count) {
    size_t bytes = size_t(count) * sizeof(Point);
    u32 offset = allocate(bytes);
    if (bytes > 0) {
        std::memcpy(data_.data() + offset, pts, bytes);
    }
    return offset;
}

const Point* DrawOpArena::getPoints(u32 offset) const {
    return reinterpret_cast<const Point*>(data_.data() + offset);
}

void DrawOpArena::reset() {
    data_.clear();
}

// --- Recording ---

Recording::Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena)
    : ops_(std::move(ops)), arena_(std::move(arena)) {
}

void Recording::dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const {
    switch (op.type) {
        case DrawOp::Type::Clear:
            visitor.visitClear(op.color);
            break;
        case DrawOp::Type::FillRect:
            visitor.visitFillRect(op.data.fill.rect, op.color);
            break;
        case DrawOp::Type::StrokePath:
            visitor.visitStrokePath(
                arena_.getPoints(op.data.path.offset),
                static_cast<i32>(op.data.path.count),
                op.strokeStyle());
            break;
    }
}

void Recording::accept(DrawOpVisitor& visitor) const {
    for (const auto& op : ops_) {
        dispatchOp(op, visitor);
    }
}

void Recording::dispatch(DrawOpVisitor& visitor, const DrawPass& pass) const {
    for (u32 idx : pass.sortedIndices()) {
        dispatchOp(ops_[idx], visitor);
    }
}

// --- Recorder ---

void Recorder::reset() {
    ops_.clear();
    arena_.reset();
    layer_ = 0;
}

CompactDrawOp Recorder::makeOp(DrawOp::Type type) const {
    CompactDrawOp op{};
    op.type = type;
    op.layer = layer_;
    return op;
}

void Recorder::clear(Color c) {
    CompactDrawOp op = makeOp(DrawOp::Type::Clear);
    op.color = c;
    ops_.push_back(op);
}

void Recorder::fillRect(Rect r, Color c) {
    CompactDrawOp op = makeOp(DrawOp::Type::FillRect);
    op.color = c;
    op.data.fill.rect = r;
    ops_.push_back(op);
}

void Recorder::strokePath(const Point* pts, i32 count, const StrokeStyle& style) {
    if (!pts || count <= 0) return;

    CompactDrawOp op = makeOp(DrawOp::Type::StrokePath);
    op.color = style.color;
    op.width = style.width;
    op.data.path.offset = arena_.storePoints(pts, count);
    op.data.path.count = static_cast<u32>(count);
    op.data.path.miterLimit = style.miterLimit;
    op.data.path.cap = style.cap;
    op.data.path.join = style.join;
    ops_.push_back(op);
}

std::unique_ptr<Recording> Recorder::finish() {
    auto recording = std::make_unique<Recording>(std::move(ops_), std::move(arena_));
    ops_.clear();
    arena_.reset();
    return recording;
}

}

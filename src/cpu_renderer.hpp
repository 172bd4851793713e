#pragma once

#include "scribble/renderer.hpp"
#include "scribble/draw_op_visitor.hpp"
#include "scribble/pixmap.hpp"
#include "scribble/recording.hpp"
#include "scribble/draw_pass.hpp"

namespace scribble {

/**
 * CpuRenderer - Software rasterization into a Pixmap.
 *
 * Pixels are sampled at their centers without anti-aliasing. Each stroke is
 * first built as a coverage mask (segment bodies, caps and joins) and then
 * blended once, so a translucent stroke never darkens where its own pieces
 * overlap.
 *
 * The Pixmap is owned by the Surface; the renderer only writes into it.
 */
class CpuRenderer : public Renderer, public DrawOpVisitor {
public:
    explicit CpuRenderer(Pixmap* target) : target_(target) {}

    // Renderer interface
    void beginFrame(Color clearColor) override {
        if (target_ && target_->valid()) target_->clear(clearColor);
    }

    void endFrame() override {}

    void resize(i32, i32) override {
        // Pixmap resize is managed by Surface
    }

    void execute(const Recording& recording, const DrawPass& pass) override {
        recording.dispatch(*this, pass);
    }

    // DrawOpVisitor interface
    void visitClear(Color c) override {
        if (target_ && target_->valid()) target_->clear(c);
    }

    void visitFillRect(Rect r, Color c) override;
    void visitStrokePath(const Point* pts, i32 count, const StrokeStyle& style) override;

private:
    Pixmap* target_ = nullptr;

    void blendPixel(i32 x, i32 y, Color c);
};

} // namespace scribble

#include "scribble/stroke_renderer.hpp"
#include "scribble/canvas.hpp"
#include "scribble/surface.hpp"

namespace scribble {

StrokeRenderer::StrokeRenderer(const StrokeStyle& style, Color background)
    : style_(style), background_(background) {
}

void StrokeRenderer::render(Canvas* canvas,
                            const StrokeTracker::CompletedPaths& completed,
                            const StrokeTracker::InProgressPaths& inProgress) const {
    if (!canvas) return;

    u8 savedLayer = canvas->layer();

    canvas->setLayer(kBackgroundLayer);
    canvas->clear(background_);

    canvas->setLayer(kCompletedLayer);
    for (const Path& path : completed) {
        canvas->drawPath(path, style_);
    }

    canvas->setLayer(kInProgressLayer);
    for (const auto& entry : inProgress) {
        canvas->drawPath(entry.second, style_);
    }

    canvas->setLayer(savedLayer);
}

void StrokeRenderer::render(Surface* surface, const StrokeTracker& tracker) const {
    if (!surface) return;

    surface->beginFrame(background_);
    tracker.read([&](const StrokeTracker::CompletedPaths& completed,
                     const StrokeTracker::InProgressPaths& inProgress) {
        render(surface->canvas(), completed, inProgress);
    });
    surface->endFrame();
    surface->flush();
}

} // namespace scribble

#include <gtest/gtest.h>
#include <scribble/scribble.hpp>

#include <vector>

using namespace scribble;

// --- Visitor that records stroke start points in dispatch order ---

class StrokeLog : public DrawOpVisitor {
public:
    std::vector<Point> starts;
    std::vector<StrokeStyle> styles;
    int clears = 0;
    Color lastClear;

    void visitClear(Color c) override {
        ++clears;
        lastClear = c;
    }
    void visitFillRect(Rect, Color) override {}
    void visitStrokePath(const Point* pts, i32, const StrokeStyle& style) override {
        starts.push_back(pts[0]);
        styles.push_back(style);
    }
};

static void makeIdentity(StrokeTracker& t, f32 w, f32 h) {
    t.setCanvasSize({w, h}, {w, h});
}

// Helper: record a frame of the tracker on a recording surface, then replay
// it in execution order.
static StrokeLog replay(const StrokeRenderer& renderer, const StrokeTracker& tracker) {
    auto surface = Surface::MakeRecording(100, 100);
    renderer.render(surface.get(), tracker);
    auto recording = surface->takeRecording();

    StrokeLog log;
    if (recording) {
        DrawPass pass = DrawPass::create(*recording);
        recording->dispatch(log, pass);
    }
    return log;
}

// --- Construction ---

TEST(StrokeRenderer, DefaultsToBlueOnWhite) {
    StrokeRenderer r;
    EXPECT_EQ(r.style().color.b, 255);
    EXPECT_FLOAT_EQ(r.style().width, 10.0f);
    EXPECT_EQ(r.background().r, 255);
    EXPECT_EQ(r.background().g, 255);
    EXPECT_EQ(r.background().b, 255);
}

// --- Frame contents ---

TEST(StrokeRenderer, EmptyTrackerClearsOnly) {
    StrokeTracker t;
    StrokeLog log = replay(StrokeRenderer(), t);
    EXPECT_EQ(log.clears, 1);
    EXPECT_EQ(log.lastClear.r, 255);
    EXPECT_TRUE(log.starts.empty());
}

TEST(StrokeRenderer, CompletedThenInProgress) {
    StrokeTracker t;
    makeIdentity(t, 100, 100);

    // P1 completes first, then P2; P3 is still down.
    t.handleTouch(3, TouchAction::Pressed, {30, 30});
    t.handleTouch(1, TouchAction::Pressed, {10, 10});
    t.handleTouch(1, TouchAction::Released, {});
    t.handleTouch(2, TouchAction::Pressed, {20, 20});
    t.handleTouch(2, TouchAction::Moved, {25, 25});
    t.handleTouch(2, TouchAction::Released, {});

    StrokeLog log = replay(StrokeRenderer(), t);
    ASSERT_EQ(log.starts.size(), 3u);
    EXPECT_FLOAT_EQ(log.starts[0].x, 10.0f);
    EXPECT_FLOAT_EQ(log.starts[1].x, 20.0f);
    EXPECT_FLOAT_EQ(log.starts[2].x, 30.0f);
}

TEST(StrokeRenderer, InProgressOrderedByTouchId) {
    StrokeTracker t;
    makeIdentity(t, 100, 100);
    t.handleTouch(8, TouchAction::Pressed, {80, 80});
    t.handleTouch(2, TouchAction::Pressed, {20, 20});
    t.handleTouch(5, TouchAction::Pressed, {50, 50});

    StrokeLog log = replay(StrokeRenderer(), t);
    ASSERT_EQ(log.starts.size(), 3u);
    EXPECT_FLOAT_EQ(log.starts[0].x, 20.0f);
    EXPECT_FLOAT_EQ(log.starts[1].x, 50.0f);
    EXPECT_FLOAT_EQ(log.starts[2].x, 80.0f);
}

TEST(StrokeRenderer, EveryPathUsesConfiguredStyle) {
    StrokeStyle style;
    style.color = {200, 10, 10, 255};
    style.width = 3.0f;
    style.cap = StrokeCap::Square;

    StrokeTracker t;
    makeIdentity(t, 100, 100);
    t.handleTouch(1, TouchAction::Pressed, {1, 1});
    t.handleTouch(1, TouchAction::Released, {});
    t.handleTouch(2, TouchAction::Pressed, {2, 2});

    StrokeLog log = replay(StrokeRenderer(style), t);
    ASSERT_EQ(log.styles.size(), 2u);
    for (const StrokeStyle& s : log.styles) {
        EXPECT_EQ(s.color.r, 200);
        EXPECT_FLOAT_EQ(s.width, 3.0f);
        EXPECT_EQ(s.cap, StrokeCap::Square);
    }
}

TEST(StrokeRenderer, CanvasRenderUsesLayers) {
    Device device;
    Canvas canvas(&device);
    device.beginFrame();

    StrokeTracker::CompletedPaths completed;
    completed.emplace_back(Point{1, 1});
    StrokeTracker::InProgressPaths inProgress;
    inProgress.emplace(4, Path(Point{4, 4}));

    canvas.setLayer(7);
    StrokeRenderer().render(&canvas, completed, inProgress);
    EXPECT_EQ(canvas.layer(), 7);

    device.endFrame();
    auto rec = device.finishRecording();
    ASSERT_EQ(rec->ops().size(), 3u);
    EXPECT_EQ(rec->ops()[0].type, DrawOp::Type::Clear);
    EXPECT_EQ(rec->ops()[0].layer, StrokeRenderer::kBackgroundLayer);
    EXPECT_EQ(rec->ops()[1].layer, StrokeRenderer::kCompletedLayer);
    EXPECT_EQ(rec->ops()[2].layer, StrokeRenderer::kInProgressLayer);
}

// --- Raster output ---

TEST(StrokeRenderer, RasterFrameShowsStrokes) {
    StrokeTracker t;
    t.setCanvasSize({50, 50}, {100, 100});
    t.handleTouch(1, TouchAction::Pressed, {10, 25});
    t.handleTouch(1, TouchAction::Moved, {40, 25});

    auto surface = Surface::MakeRaster(100, 100);
    StrokeRenderer renderer;
    renderer.render(surface.get(), t);

    const Pixmap* pm = surface->peekPixels();
    // Stroke runs from (20,50) to (80,50) in pixels.
    Color on = pm->getColor(50, 50);
    EXPECT_EQ(on.r, 0);
    EXPECT_EQ(on.g, 0);
    EXPECT_EQ(on.b, 255);

    Color off = pm->getColor(50, 10);
    EXPECT_EQ(off.r, 255);
    EXPECT_EQ(off.g, 255);
    EXPECT_EQ(off.b, 255);
}

TEST(StrokeRenderer, OverlappingStrokesBlendSeparately) {
    StrokeStyle translucent;
    translucent.color = {0, 0, 0, 128};

    StrokeTracker t;
    makeIdentity(t, 40, 40);
    t.handleTouch(2, TouchAction::Pressed, {20, 0});
    t.handleTouch(2, TouchAction::Moved, {20, 40});
    t.handleTouch(1, TouchAction::Pressed, {0, 20});
    t.handleTouch(1, TouchAction::Moved, {40, 20});
    t.handleTouch(1, TouchAction::Released, {});

    auto surface = Surface::MakeRaster(40, 40);
    StrokeRenderer(translucent).render(surface.get(), t);

    const Pixmap* pm = surface->peekPixels();
    EXPECT_EQ(pm->getColor(20, 5).r, 127);
    EXPECT_EQ(pm->getColor(5, 20).r, 127);
    EXPECT_EQ(pm->getColor(20, 20).r, 63);
}

TEST(StrokeRenderer, ClearedTrackerRendersBackground) {
    StrokeTracker t;
    makeIdentity(t, 10, 10);
    t.handleTouch(1, TouchAction::Pressed, {5, 5});
    t.handleTouch(1, TouchAction::Released, {});
    t.clear();

    auto surface = Surface::MakeRaster(10, 10);
    StrokeRenderer(StrokeStyle(), {1, 2, 3, 255}).render(surface.get(), t);
    Color c = surface->peekPixels()->getColor(5, 5);
    EXPECT_EQ(c.r, 1);
    EXPECT_EQ(c.g, 2);
    EXPECT_EQ(c.b, 3);
}

// --- Null safety ---

TEST(StrokeRenderer, NullTargetsAreIgnored) {
    StrokeTracker t;
    StrokeRenderer r;
    r.render(static_cast<Surface*>(nullptr), t);
    r.render(static_cast<Canvas*>(nullptr), t.completedPaths(), t.inProgressPaths());
    SUCCEED();
}

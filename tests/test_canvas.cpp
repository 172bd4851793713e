#include <gtest/gtest.h>
#include <scribble/scribble.hpp>

#include <functional>

using namespace scribble;

// Helper: run canvas operations, finish recording, return the recording.
static std::unique_ptr<Recording> record(std::function<void(Canvas&)> fn) {
    Device device;
    device.beginFrame();
    Canvas canvas(&device);
    fn(canvas);
    device.endFrame();
    return device.finishRecording();
}

// Helper: count ops of a given type in a recording.
static int countOps(const Recording& rec, DrawOp::Type type) {
    int n = 0;
    for (const auto& op : rec.ops()) {
        if (op.type == type) ++n;
    }
    return n;
}

// --- clear / fillRect ---

TEST(Canvas, ClearRecordsClear) {
    auto rec = record([](Canvas& c) { c.clear({255, 255, 255, 255}); });
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(countOps(*rec, DrawOp::Type::Clear), 1);
}

TEST(Canvas, FillRectSkipsEmptyRect) {
    auto rec = record([](Canvas& c) {
        c.fillRect({0, 0, 0, 10}, {255, 0, 0, 255});
        c.fillRect({0, 0, 10, -1}, {255, 0, 0, 255});
        c.fillRect({0, 0, 10, 10}, {255, 0, 0, 255});
    });
    EXPECT_EQ(countOps(*rec, DrawOp::Type::FillRect), 1);
}

// --- drawPath ---

TEST(Canvas, DrawPathRecordsEveryVertex) {
    Path path({1, 2});
    path.lineTo({3, 4});
    path.lineTo({5, 6});

    auto rec = record([&](Canvas& c) { c.drawPath(path, StrokeStyle()); });
    ASSERT_EQ(rec->ops().size(), 1u);

    const auto& op = rec->ops()[0];
    EXPECT_EQ(op.type, DrawOp::Type::StrokePath);
    ASSERT_EQ(op.data.path.count, 3u);
    const Point* pts = rec->arena().getPoints(op.data.path.offset);
    EXPECT_FLOAT_EQ(pts[0].x, 1.0f);
    EXPECT_FLOAT_EQ(pts[2].y, 6.0f);
}

TEST(Canvas, DrawPathCarriesStyle) {
    Path path({0, 0});
    path.lineTo({10, 0});
    StrokeStyle style;
    style.width = 3.0f;
    style.cap = StrokeCap::Butt;

    auto rec = record([&](Canvas& c) { c.drawPath(path, style); });
    ASSERT_EQ(rec->ops().size(), 1u);
    StrokeStyle back = rec->ops()[0].strokeStyle();
    EXPECT_FLOAT_EQ(back.width, 3.0f);
    EXPECT_EQ(back.cap, StrokeCap::Butt);
    EXPECT_EQ(back.color.b, 255);
}

TEST(Canvas, SinglePointPathIsRecorded) {
    Path tap({5, 5});
    auto rec = record([&](Canvas& c) { c.drawPath(tap, StrokeStyle()); });
    ASSERT_EQ(rec->ops().size(), 1u);
    EXPECT_EQ(rec->ops()[0].data.path.count, 1u);
}

// --- strokePolyline degenerate input ---

TEST(Canvas, StrokePolylineSkipsDegenerateInput) {
    Point pts[] = {{0, 0}, {10, 10}};
    StrokeStyle zeroWidth;
    zeroWidth.width = 0.0f;
    StrokeStyle invisible;
    invisible.color = {0, 0, 255, 0};

    auto rec = record([&](Canvas& c) {
        c.strokePolyline(nullptr, 2, StrokeStyle());
        c.strokePolyline(pts, 0, StrokeStyle());
        c.strokePolyline(pts, 2, zeroWidth);
        c.strokePolyline(pts, 2, invisible);
    });
    EXPECT_EQ(rec->ops().size(), 0u);
}

// --- Layers ---

TEST(Canvas, SetLayerTagsFollowingOps) {
    auto rec = record([](Canvas& c) {
        EXPECT_EQ(c.layer(), 0);
        c.clear({0, 0, 0, 255});
        c.setLayer(2);
        EXPECT_EQ(c.layer(), 2);
        c.fillRect({0, 0, 1, 1}, {0, 0, 0, 255});
    });
    ASSERT_EQ(rec->ops().size(), 2u);
    EXPECT_EQ(rec->ops()[0].layer, 0);
    EXPECT_EQ(rec->ops()[1].layer, 2);
}

TEST(Canvas, BeginFrameResetsLayer) {
    Device device;
    Canvas canvas(&device);
    device.beginFrame();
    canvas.setLayer(4);
    device.endFrame();
    device.beginFrame();
    EXPECT_EQ(canvas.layer(), 0);
}

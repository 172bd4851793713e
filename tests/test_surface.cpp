#include <gtest/gtest.h>
#include <scribble/surface.hpp>

#include <vector>

using namespace scribble;

// Helper: read a single pixel from a pixmap at (x, y)
static u32 readPixel(const Pixmap* pm, i32 x, i32 y) {
    const u32* row = static_cast<const u32*>(pm->rowAddr(y));
    return row[x];
}

// --- Factory: MakeRaster ---

TEST(Surface, MakeRasterCreatesPixmap) {
    auto surface = Surface::MakeRaster(32, 64);
    ASSERT_NE(surface, nullptr);
    EXPECT_NE(surface->canvas(), nullptr);
    EXPECT_EQ(surface->width(), 32);
    EXPECT_EQ(surface->height(), 64);

    Pixmap* pm = surface->peekPixels();
    ASSERT_NE(pm, nullptr);
    EXPECT_TRUE(pm->valid());
    EXPECT_EQ(pm->width(), 32);
    EXPECT_EQ(pm->height(), 64);
    EXPECT_EQ(pm->format(), PixelFormat::BGRA8888);
}

TEST(Surface, MakeRasterHonorsFormat) {
    auto surface = Surface::MakeRaster(4, 4, PixelFormat::RGBA8888);
    ASSERT_NE(surface, nullptr);
    EXPECT_EQ(surface->peekPixels()->format(), PixelFormat::RGBA8888);
}

TEST(Surface, MakeRasterRejectsEmptySize) {
    EXPECT_EQ(Surface::MakeRaster(0, 10), nullptr);
    EXPECT_EQ(Surface::MakeRaster(10, 0), nullptr);
    EXPECT_EQ(Surface::MakeRaster(-1, -1), nullptr);

    EXPECT_EQ(Surface::MakeRecording(0, 10), nullptr);
    EXPECT_EQ(Surface::MakeRecording(10, 0), nullptr);
    EXPECT_EQ(Surface::MakeRecording(-1, -1), nullptr);
}

// --- Factory: MakeRasterDirect ---

TEST(Surface, MakeRasterDirectDrawsIntoCallerBuffer) {
    const i32 W = 8, H = 8;
    PixmapInfo info = PixmapInfo::Make(W, H, PixelFormat::BGRA8888);
    std::vector<u32> buffer(W * H, 0);

    auto surface = Surface::MakeRasterDirect(info, buffer.data());
    ASSERT_NE(surface, nullptr);
    EXPECT_EQ(surface->peekPixels()->addr(), buffer.data());

    surface->beginFrame({0, 255, 0, 255});
    surface->endFrame();
    surface->flush();

    EXPECT_EQ(buffer[0], PackColor({0, 255, 0, 255}, PixelFormat::BGRA8888));
    EXPECT_EQ(buffer[W * H - 1], PackColor({0, 255, 0, 255}, PixelFormat::BGRA8888));
}

TEST(Surface, MakeRasterDirectRejectsNullPixels) {
    EXPECT_EQ(Surface::MakeRasterDirect(PixmapInfo::MakeBGRA(4, 4), nullptr), nullptr);
}

// --- Factory: MakeRecording ---

TEST(Surface, MakeRecordingHasNoPixmap) {
    auto surface = Surface::MakeRecording(16, 16);
    ASSERT_NE(surface, nullptr);
    EXPECT_NE(surface->canvas(), nullptr);
    EXPECT_EQ(surface->peekPixels(), nullptr);

    const Surface* cs = surface.get();
    EXPECT_EQ(cs->peekPixels(), nullptr);
    EXPECT_FALSE(surface->getPixelData().isValid());
}

// --- beginFrame ---

TEST(Surface, BeginFrameClearsToColor) {
    auto surface = Surface::MakeRaster(4, 4);
    surface->beginFrame({10, 20, 30, 255});
    surface->endFrame();
    surface->flush();

    Color c = surface->peekPixels()->getColor(3, 3);
    EXPECT_EQ(c.r, 10);
    EXPECT_EQ(c.g, 20);
    EXPECT_EQ(c.b, 30);
}

TEST(Surface, BeginFrameDefaultsToOpaqueBlack) {
    auto surface = Surface::MakeRaster(2, 2);
    surface->peekPixels()->clear({255, 255, 255, 255});
    surface->beginFrame();
    Color c = surface->peekPixels()->getColor(0, 0);
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.a, 255);
}

// --- Flush writes pixels ---

TEST(Surface, FlushWritesPixelsToPixmap) {
    const i32 W = 4, H = 4;
    auto surface = Surface::MakeRaster(W, H);

    Color red{255, 0, 0, 255};
    surface->beginFrame();
    surface->canvas()->fillRect({0, 0, f32(W), f32(H)}, red);
    surface->endFrame();
    surface->flush();

    const Pixmap* pm = surface->peekPixels();
    u32 expected = PackColor(red, PixelFormat::BGRA8888);
    for (i32 y = 0; y < H; ++y) {
        for (i32 x = 0; x < W; ++x) {
            EXPECT_EQ(readPixel(pm, x, y), expected)
                << "Mismatch at (" << x << ", " << y << ")";
        }
    }
}

TEST(Surface, FlushWithoutFrameDoesNothing) {
    auto surface = Surface::MakeRaster(2, 2);
    surface->peekPixels()->clear({1, 2, 3, 255});
    surface->flush();
    EXPECT_EQ(surface->peekPixels()->getColor(0, 0).r, 1);
}

TEST(Surface, SecondFlushDoesNotReplay) {
    auto surface = Surface::MakeRaster(2, 2);
    surface->beginFrame({0, 0, 0, 255});
    surface->canvas()->fillRect({0, 0, 2, 2}, {255, 0, 0, 255});
    surface->endFrame();
    surface->flush();

    surface->peekPixels()->clear({0, 0, 255, 255});
    surface->flush();
    EXPECT_EQ(surface->peekPixels()->getColor(0, 0).b, 255);
}

// --- resize ---

TEST(Surface, ResizeChangesPixmapDimensions) {
    auto surface = Surface::MakeRaster(8, 8);
    surface->resize(16, 32);

    EXPECT_EQ(surface->width(), 16);
    EXPECT_EQ(surface->height(), 32);
    Pixmap* pm = surface->peekPixels();
    ASSERT_NE(pm, nullptr);
    EXPECT_EQ(pm->width(), 16);
    EXPECT_EQ(pm->height(), 32);
    EXPECT_EQ(pm->stride(), 16 * 4);
}

TEST(Surface, ResizeToSameSizeKeepsBuffer) {
    auto surface = Surface::MakeRaster(8, 8);
    void* before = surface->peekPixels()->addr();
    surface->resize(8, 8);
    EXPECT_EQ(surface->peekPixels()->addr(), before);
}

TEST(Surface, ResizedSurfaceStillRenders) {
    auto surface = Surface::MakeRaster(4, 4);
    surface->resize(6, 3);
    surface->beginFrame({9, 9, 9, 255});
    surface->endFrame();
    surface->flush();
    EXPECT_EQ(surface->peekPixels()->getColor(5, 2).r, 9);
}

// --- takeRecording ---

TEST(Surface, TakeRecordingFromRecordingSurface) {
    auto surface = Surface::MakeRecording(10, 10);
    surface->beginFrame();
    surface->canvas()->fillRect({0, 0, 10, 10}, {0, 255, 0, 255});
    surface->endFrame();
    surface->flush();

    auto recording = surface->takeRecording();
    ASSERT_NE(recording, nullptr);
    EXPECT_EQ(recording->ops().size(), 1u);
    EXPECT_EQ(surface->takeRecording(), nullptr);
}

// --- getPixelData ---

TEST(Surface, GetPixelDataDescribesPixmap) {
    const i32 W = 10, H = 7;
    auto surface = Surface::MakeRaster(W, H);

    PixelData pd = surface->getPixelData();
    EXPECT_TRUE(pd.isValid());
    EXPECT_EQ(pd.width, W);
    EXPECT_EQ(pd.height, H);
    EXPECT_EQ(pd.rowBytes, W * 4);
    EXPECT_EQ(pd.data, surface->peekPixels()->addr());
    EXPECT_EQ(pd.format, PixelFormat::BGRA8888);
}

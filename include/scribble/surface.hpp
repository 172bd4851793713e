#pragma once

/**
 * @file surface.hpp
 * @brief Drawing target that a StrokeRenderer paints frames into.
 */

#include "scribble/types.hpp"
#include "scribble/pixmap.hpp"
#include "scribble/canvas.hpp"
#include "scribble/device.hpp"
#include "scribble/pixel_data.hpp"
#include "scribble/renderer.hpp"
#include <memory>

namespace scribble {

/**
 * @brief Owns a Canvas, its recording Device and, for raster surfaces, a
 *        CpuRenderer with its Pixmap.
 *
 * One frame is beginFrame(), drawing through canvas(), endFrame(), flush().
 * Recording surfaces skip the rasterization and keep the commands for
 * takeRecording().
 */
class Surface {
public:
    /// @brief Raster surface with its own zeroed pixel buffer.
    /// @return The surface, or null if w or h is not positive.
    static std::unique_ptr<Surface> MakeRaster(i32 w, i32 h,
                                                PixelFormat fmt = PixelFormat::BGRA8888);

    /// @brief Raster surface drawing straight into caller memory.
    /// @return The surface, or null if pixels is null or info is empty.
    static std::unique_ptr<Surface> MakeRasterDirect(const PixmapInfo& info, void* pixels);

    /// @brief Surface that only records; flush() draws nothing.
    /// @return The surface, or null if w or h is not positive.
    static std::unique_ptr<Surface> MakeRecording(i32 w, i32 h);

    ~Surface();

    Canvas* canvas() const { return canvas_.get(); }

    i32 width() const { return width_; }
    i32 height() const { return height_; }

    /// @brief Change the pixel size.
    ///
    /// Raster surfaces get a new owned buffer, so a MakeRasterDirect()
    /// surface stops writing to the caller's memory. Pixels are not kept.
    void resize(i32 w, i32 h);

    /// @brief Start recording a frame. Raster targets are cleared to clearColor.
    void beginFrame(Color clearColor = {0, 0, 0, 255});

    /// @brief Stop recording the current frame.
    void endFrame();

    /// @brief Rasterize the finished frame in layer order.
    void flush();

    /// @brief Pixels of a raster surface, or null for a recording surface.
    Pixmap* peekPixels();
    const Pixmap* peekPixels() const;

    /// @brief View of the current pixels for uploading to a window.
    PixelData getPixelData() const;

    /// @brief Hand over the finished frame's commands.
    /// @return The recording, or null if there is none or flush() consumed it.
    std::unique_ptr<Recording> takeRecording();

private:
    Surface(std::unique_ptr<Renderer> renderer, std::unique_ptr<Pixmap> pixmap, i32 w, i32 h);

    Device device_;
    std::unique_ptr<Canvas> canvas_;
    std::unique_ptr<Renderer> renderer_;
    std::unique_ptr<Pixmap> pixmap_;
    i32 width_ = 0;
    i32 height_ = 0;
};

} // namespace scribble

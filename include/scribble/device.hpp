#pragma once

/**
 * @file device.hpp
 * @brief Recording device that converts Canvas commands into low-level draw operations.
 */

#include "scribble/types.hpp"
#include "scribble/recording.hpp"
#include <memory>

namespace scribble {

/**
 * @brief The single recording device.
 *
 * Device converts Canvas high-level commands into low-level Recording ops.
 * All Surfaces use the same Device. It always records and never draws directly.
 * The actual rendering is done by a Renderer that consumes the Recording.
 */
class Device {
public:
    Device() = default;
    ~Device() = default;

    /// @brief Begin recording a new frame (resets the recorder).
    void beginFrame();
    /// @brief End the current frame recording.
    void endFrame();

    /// @name Drawing commands
    /// @{

    /// @brief Replace every pixel with a color.
    void clear(Color c);

    /// @brief Fill a rectangle with a solid color.
    /// @param r The rectangle to fill.
    /// @param c Fill color.
    void fillRect(Rect r, Color c);

    /// @brief Stroke a connected series of line segments.
    /// @param pts Array of vertices.
    /// @param count Number of points.
    /// @param style Stroke appearance.
    void strokePath(const Point* pts, i32 count, const StrokeStyle& style);

    /// @}

    /// @brief Set the layer for subsequent commands.
    void setLayer(u8 layer);
    /// @brief Get the current layer.
    u8 layer() const;

    /// @brief Finish recording and return the immutable Recording.
    /// @return Unique pointer to the completed Recording, or null if none is pending.
    std::unique_ptr<Recording> finishRecording();

private:
    Recorder recorder_;
    std::unique_ptr<Recording> recording_;
};

}

#pragma once

/**
 * @file canvas.hpp
 * @brief User-facing drawing API.
 */

#include "scribble/types.hpp"
#include "scribble/stroke_style.hpp"

namespace scribble {

class Device;
class Path;

/// @brief User-facing drawing API.
///
/// Canvas provides high-level drawing commands that are recorded through a
/// Device. Commands are tagged with the current layer; see DrawPass for how
/// layers order the frame.
class Canvas {
public:
    /// @brief Construct a Canvas that records into a device.
    /// @param device The device to record drawing commands into.
    explicit Canvas(Device* device);

    /// @brief Replace the whole target with a color.
    void clear(Color c);

    /// @brief Fill a rectangle with a solid color.
    void fillRect(Rect r, Color c);

    /// @brief Stroke a path.
    /// @param path The path to stroke.
    /// @param style Stroke appearance.
    void drawPath(const Path& path, const StrokeStyle& style);

    /// @brief Stroke a connected series of line segments.
    /// @param pts Array of vertices.
    /// @param count Number of points.
    /// @param style Stroke appearance.
    void strokePolyline(const Point* pts, i32 count, const StrokeStyle& style);

    /// @brief Set the layer for subsequent commands.
    void setLayer(u8 layer);

    /// @brief Get the current layer.
    u8 layer() const;

private:
    Device* device_ = nullptr;
};

}

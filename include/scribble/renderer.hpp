#pragma once

/**
 * @file renderer.hpp
 * @brief Abstract rendering interface for raster backends.
 */

#include "scribble/types.hpp"

namespace scribble {

class Recording;
class DrawPass;

/**
 * @brief Abstract rendering interface.
 *
 * Implemented by backends that execute recorded drawing commands. This
 * abstraction allows Surface to work with any backend through a unified
 * interface.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    /// @brief Begin a new frame, clearing the render target.
    /// @param clearColor The color to clear the render target to.
    virtual void beginFrame(Color clearColor) = 0;

    /// @brief End the current frame.
    virtual void endFrame() = 0;

    /// @brief Execute recorded drawing commands in the order defined by a draw pass.
    /// @param recording The recorded drawing commands.
    /// @param pass The draw pass defining execution order.
    virtual void execute(const Recording& recording, const DrawPass& pass) = 0;

    /// @brief Resize the render target.
    /// @param w New width in pixels.
    /// @param h New height in pixels.
    virtual void resize(i32 w, i32 h) = 0;
};

} // namespace scribble

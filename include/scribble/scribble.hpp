#pragma once

/**
 * Scribble - Multi-touch finger painting on a 2D raster canvas
 *
 * Usage:
 *
 *   #include <scribble/scribble.hpp>
 *
 *   scribble::StrokeTracker tracker(&host);        // host implements RedrawTarget
 *   tracker.setCanvasSize({400, 300}, {800, 600}); // logical, pixel
 *   tracker.handleTouch(1, scribble::TouchAction::Pressed, {10, 10});
 *
 *   auto surface = scribble::Surface::MakeRaster(800, 600);
 *   scribble::StrokeRenderer renderer;
 *   renderer.render(surface.get(), tracker);
 */

// Version
#include "scribble/version.hpp"

// Core types
#include "scribble/types.hpp"

// Pixel data
#include "scribble/pixmap.hpp"
#include "scribble/pixel_data.hpp"

// Recording and commands
#include "scribble/recording.hpp"
#include "scribble/draw_op_visitor.hpp"
#include "scribble/draw_pass.hpp"

// Device (recording device)
#include "scribble/device.hpp"

// Canvas (user-facing drawing API)
#include "scribble/canvas.hpp"

// Surface (top-level rendering target)
#include "scribble/surface.hpp"

// Strokes
#include "scribble/stroke_style.hpp"
#include "scribble/path.hpp"
#include "scribble/coordinate_mapping.hpp"
#include "scribble/touch.hpp"
#include "scribble/stroke_tracker.hpp"
#include "scribble/stroke_renderer.hpp"

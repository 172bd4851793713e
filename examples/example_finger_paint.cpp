/**
 * example_finger_paint.cpp - Multi-touch finger painting with scribble, displayed via SDL2
 *
 * Demonstrates:
 *   - Feeding SDL touch and mouse events into a StrokeTracker, with finger ids
 *     made unique across touch devices by a TouchIdMap
 *   - Coalescing redraw requests into one frame per loop iteration
 *   - Rendering with StrokeRenderer into a raster Surface and uploading it
 *     to a streaming SDL texture
 *   - Keeping logical (window) and pixel (drawable) sizes in sync on resize
 *
 * Controls:
 *   - Draw with any number of fingers, or with the left mouse button
 *   - C clears the canvas
 *   - ESC or closing the window quits
 *
 * Build:
 *   cmake -B build -DSCRIBBLE_BUILD_EXAMPLES=ON && cmake --build build
 *   ./build/example_finger_paint
 */

#include <scribble/scribble.hpp>
#include <atomic>
#include <cstdio>

#include <SDL2/SDL.h>

namespace {

// Left mouse button acts as one more contact. TouchIdMap ids start at 1.
constexpr scribble::TouchId kMouseTouchId = -1;

class DirtyFlag : public scribble::RedrawTarget {
public:
    void requestRedraw() override { dirty_.store(true, std::memory_order_release); }

    bool consume() { return dirty_.exchange(false, std::memory_order_acq_rel); }

private:
    std::atomic<bool> dirty_{true};
};

struct Window {
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture* texture = nullptr;
    int logicalW = 0, logicalH = 0;
    int pixelW = 0, pixelH = 0;

    ~Window() {
        if (texture) SDL_DestroyTexture(texture);
        if (renderer) SDL_DestroyRenderer(renderer);
        if (window) SDL_DestroyWindow(window);
    }
};

// Re-reads window and drawable sizes and rebuilds the texture to match.
bool syncSizes(Window& w, scribble::Surface& surface, scribble::StrokeTracker& tracker) {
    SDL_GetWindowSize(w.window, &w.logicalW, &w.logicalH);
    if (SDL_GetRendererOutputSize(w.renderer, &w.pixelW, &w.pixelH) != 0) {
        std::fprintf(stderr, "SDL_GetRendererOutputSize failed: %s\n", SDL_GetError());
        return false;
    }

    tracker.setCanvasSize({float(w.logicalW), float(w.logicalH)},
                          {float(w.pixelW), float(w.pixelH)});

    if (w.pixelW <= 0 || w.pixelH <= 0) return true;  // minimized
    surface.resize(w.pixelW, w.pixelH);

    if (w.texture) SDL_DestroyTexture(w.texture);
    w.texture = SDL_CreateTexture(w.renderer, SDL_PIXELFORMAT_ARGB8888,
                                  SDL_TEXTUREACCESS_STREAMING, w.pixelW, w.pixelH);
    if (!w.texture) {
        std::fprintf(stderr, "SDL_CreateTexture failed: %s\n", SDL_GetError());
        return false;
    }
    return true;
}

scribble::Point fingerLocation(const SDL_TouchFingerEvent& f, const Window& w) {
    // SDL reports fingers normalized to [0, 1] across the window.
    return {f.x * float(w.logicalW), f.y * float(w.logicalH)};
}

void dispatch(scribble::StrokeTracker& tracker, scribble::TouchId id,
              scribble::TouchAction action, scribble::Point location) {
    if (!tracker.handleTouch(id, action, location)) return;
    if (action == scribble::TouchAction::Moved) return;
    std::printf("touch %lld %s (%zu active, %zu done)\n",
                static_cast<long long>(id), scribble::touchActionName(action),
                tracker.inProgressCount(), tracker.completedCount());
}

int run(int W, int H) {
    int exitCode = 0;
    {
        Window w;
        w.window = SDL_CreateWindow("scribble - Finger Paint",
                                    SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                    W, H,
                                    SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE |
                                        SDL_WINDOW_ALLOW_HIGHDPI);
        if (!w.window) {
            std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
            return 1;
        }

        w.renderer = SDL_CreateRenderer(w.window, -1, SDL_RENDERER_ACCELERATED);
        if (!w.renderer) {
            std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
            return 1;
        }

        DirtyFlag redraw;
        scribble::StrokeTracker tracker(&redraw);
        scribble::StrokeRenderer strokeRenderer;
        scribble::TouchIdMap fingerIds;

        auto surface = scribble::Surface::MakeRaster(W, H);
        if (!surface || !syncSizes(w, *surface, tracker)) {
            std::fprintf(stderr, "Failed to create drawing surface\n");
            return 1;
        }

        std::printf("scribble %s finger paint\n", scribble::version());
        std::printf("Touch devices: %d\n", SDL_GetNumTouchDevices());
        std::printf("Canvas: %dx%d logical, %dx%d pixels\n",
                    w.logicalW, w.logicalH, w.pixelW, w.pixelH);
        std::printf("Draw with fingers or the left mouse button, C to clear, ESC to exit\n");

        bool running = true;
        while (running) {
            SDL_Event event;
            if (!SDL_WaitEventTimeout(&event, 16)) {
                event.type = SDL_FIRSTEVENT;
            }

            do {
                switch (event.type) {
                case SDL_QUIT:
                    running = false;
                    break;
                case SDL_KEYDOWN:
                    if (event.key.keysym.sym == SDLK_ESCAPE) running = false;
                    if (event.key.keysym.sym == SDLK_c) tracker.clear();
                    break;
                case SDL_WINDOWEVENT:
                    if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                        if (!syncSizes(w, *surface, tracker)) {
                            running = false;
                            exitCode = 1;
                        }
                        redraw.requestRedraw();
                    } else if (event.window.event == SDL_WINDOWEVENT_LEAVE) {
                        dispatch(tracker, kMouseTouchId, scribble::TouchAction::Cancelled, {});
                    } else if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                        redraw.requestRedraw();
                    }
                    break;
                case SDL_FINGERDOWN:
                    dispatch(tracker,
                             fingerIds.acquire(event.tfinger.touchId, event.tfinger.fingerId),
                             scribble::TouchAction::Pressed, fingerLocation(event.tfinger, w));
                    break;
                case SDL_FINGERMOTION:
                    if (auto id = fingerIds.find(event.tfinger.touchId, event.tfinger.fingerId)) {
                        dispatch(tracker, *id, scribble::TouchAction::Moved,
                                 fingerLocation(event.tfinger, w));
                    }
                    break;
                case SDL_FINGERUP:
                    if (auto id = fingerIds.release(event.tfinger.touchId, event.tfinger.fingerId)) {
                        dispatch(tracker, *id, scribble::TouchAction::Released,
                                 fingerLocation(event.tfinger, w));
                    }
                    break;
                case SDL_MOUSEBUTTONDOWN:
                    if (event.button.which == SDL_TOUCH_MOUSEID) break;
                    if (event.button.button == SDL_BUTTON_LEFT) {
                        dispatch(tracker, kMouseTouchId, scribble::TouchAction::Pressed,
                                 {float(event.button.x), float(event.button.y)});
                    }
                    break;
                case SDL_MOUSEMOTION:
                    if (event.motion.which == SDL_TOUCH_MOUSEID) break;
                    dispatch(tracker, kMouseTouchId, scribble::TouchAction::Moved,
                             {float(event.motion.x), float(event.motion.y)});
                    break;
                case SDL_MOUSEBUTTONUP:
                    if (event.button.which == SDL_TOUCH_MOUSEID) break;
                    if (event.button.button == SDL_BUTTON_LEFT) {
                        dispatch(tracker, kMouseTouchId, scribble::TouchAction::Released,
                                 {float(event.button.x), float(event.button.y)});
                    }
                    break;
                default:
                    break;
                }
            } while (running && SDL_PollEvent(&event));

            if (!running || !redraw.consume()) continue;
            if (!w.texture) continue;

            strokeRenderer.render(surface.get(), tracker);

            scribble::PixelData frame = surface->getPixelData();
            if (!frame.isValid()) continue;

            // BGRA8888 in memory is SDL's ARGB8888 on little-endian hosts.
            if (SDL_UpdateTexture(w.texture, nullptr, frame.data, frame.rowBytes) != 0) {
                std::fprintf(stderr, "SDL_UpdateTexture failed: %s\n", SDL_GetError());
                continue;
            }
            SDL_RenderClear(w.renderer);
            SDL_RenderCopy(w.renderer, w.texture, nullptr, nullptr);
            SDL_RenderPresent(w.renderer);
        }

        std::printf("Strokes: %zu completed, %zu in progress\n",
                    tracker.completedCount(), tracker.inProgressCount());
    }
    return exitCode;
}

} // namespace

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    // Touches arrive as finger events only; mouse input stays mouse input.
    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");
    SDL_SetHint(SDL_HINT_MOUSE_TOUCH_EVENTS, "0");

    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    int exitCode = run(800, 600);

    SDL_Quit();
    return exitCode;
}

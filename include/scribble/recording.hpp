#pragma once

/**
 * @file recording.hpp
 * @brief Recorded frame commands: compact ops plus a point arena.
 */

#include "scribble/types.hpp"
#include "scribble/stroke_style.hpp"
#include <vector>
#include <memory>
#include <cstring>

namespace scribble {

class DrawOpVisitor;

/// @brief Kinds of recorded command.
struct DrawOp {
    enum class Type : u8 {
        Clear,       ///< Replace every pixel with a color.
        FillRect,    ///< Fill an axis-aligned rectangle.
        StrokePath,  ///< Stroke a polyline with cap and join styling.
    };
};

/// @brief Growable byte store holding the vertices of recorded strokes.
///
/// Ops refer to their points by byte offset, so growing the arena never
/// invalidates them.
class DrawOpArena {
public:
    explicit DrawOpArena(size_t initialCapacity = 4096);

    /// @brief Append uninitialized storage and return its offset.
    u32 allocate(size_t bytes);

    /// @brief Copy count points in and return their offset.
    u32 storePoints(const Point* pts, i32 count);

    /// @brief Points stored at an offset from storePoints().
    const Point* getPoints(u32 offset) const;

    size_t size() const { return data_.size(); }

    void reset();

private:
    std::vector<u8> data_;
};

/// @brief One recorded command, packed into 28 bytes.
struct CompactDrawOp {
    DrawOp::Type type;      ///< Command kind (1 byte).
    u8 layer;               ///< Draw layer, lower layers paint first (1 byte).
    u8 padding[2];          ///< Alignment padding (2 bytes).
    Color color;            ///< Clear, fill or stroke color (4 bytes).
    f32 width;              ///< Stroke width (4 bytes).

    union Data {
        struct { Rect rect; } fill;                     ///< FillRect data.
        struct {
            u32 offset;         ///< Arena offset of the points.
            u32 count;          ///< Number of points.
            f32 miterLimit;     ///< Miter limit.
            StrokeCap cap;      ///< End cap.
            StrokeJoin join;    ///< Segment join.
        } path;                                         ///< StrokePath data.

        Data() : fill{{}} {}
    } data;                 ///< Payload selected by type (16 bytes).

    /// @brief Rebuild the stroke style of a StrokePath op.
    StrokeStyle strokeStyle() const {
        StrokeStyle style;
        style.color = color;
        style.width = width;
        style.cap = data.path.cap;
        style.join = data.path.join;
        style.miterLimit = data.path.miterLimit;
        return style;
    }
};

/// @brief A finished frame of commands, produced by Recorder::finish().
///
/// Owns its points, so it stays valid after the paths it was recorded from
/// change. accept() replays in recorded order, dispatch() in layer order.
class Recording {
public:
    Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena);

    const std::vector<CompactDrawOp>& ops() const { return ops_; }
    const DrawOpArena& arena() const { return arena_; }

    /// @brief Replay every op in the order it was recorded.
    void accept(DrawOpVisitor& visitor) const;

    /// @brief Replay every op in the order given by a DrawPass.
    void dispatch(DrawOpVisitor& visitor, const class DrawPass& pass) const;

private:
    void dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const;
    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
};

/// @brief Accumulates ops for one frame, each tagged with the current layer.
class Recorder {
public:
    /// @brief Drop pending ops and points and go back to layer 0.
    void reset();

    /// @brief Set the layer for subsequently recorded operations.
    void setLayer(u8 layer) { layer_ = layer; }
    /// @brief Get the current layer.
    u8 layer() const { return layer_; }

    /// @brief Record a clear operation.
    /// @param c Color written to every pixel.
    void clear(Color c);

    void fillRect(Rect r, Color c);

    /// @brief Record a stroked polyline. Points are copied; null or empty
    ///        input records nothing.
    void strokePath(const Point* pts, i32 count, const StrokeStyle& style);

    /// @brief Move the pending ops out into a Recording and start empty.
    std::unique_ptr<Recording> finish();

private:
    CompactDrawOp makeOp(DrawOp::Type type) const;

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    u8 layer_ = 0;
};

}

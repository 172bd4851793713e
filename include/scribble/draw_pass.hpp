#pragma once

/**
 * @file draw_pass.hpp
 * @brief Sort key and draw pass defining the execution order of draw operations.
 */

#include "scribble/types.hpp"
#include "scribble/recording.hpp"
#include <vector>

namespace scribble {

/// @brief 64-bit sort key for DrawOp ordering.
///
/// Layout: [63:56] layer, [55:32] reserved, [31:0] sequence.
struct SortKey {
    u64 key;      ///< The packed 64-bit sort key.
    u32 opIndex;  ///< Index into the Recording's operation list.

    /// @brief Construct a sort key from draw operation attributes.
    /// @param layer Draw layer of the operation.
    /// @param seq Recording sequence number.
    /// @param idx Index of the operation in the Recording.
    /// @return A new SortKey.
    static SortKey make(u8 layer, u32 seq, u32 idx) {
        u64 k = 0;
        k |= (u64(layer) << 56);
        k |= u64(seq);
        return {k, idx};
    }

    /// @brief Compare sort keys for ordering.
    bool operator<(const SortKey& o) const { return key < o.key; }
};

/// @brief Orders recorded draw operations for execution.
///
/// Operations run layer by layer, lowest first. Within a layer they keep
/// painter's order, so a stroke recorded later is always drawn on top.
class DrawPass {
public:
    /// @brief Create a DrawPass for the operations in a recording.
    /// @param recording The recording to order.
    /// @return A new DrawPass with sorted indices.
    static DrawPass create(const Recording& recording);

    /// @brief Get the sorted operation indices.
    /// @return Indices into Recording::ops() in execution order.
    const std::vector<u32>& sortedIndices() const { return sortedIndices_; }

private:
    std::vector<u32> sortedIndices_;
};

}

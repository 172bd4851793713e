#include "scribble/draw_pass.hpp"
#include <algorithm>

namespace scribble {

DrawPass DrawPass::create(const Recording& recording) {
    const auto& ops = recording.ops();

    std::vector<SortKey> keys;
    keys.reserve(ops.size());
    for (u32 i = 0; i < static_cast<u32>(ops.size()); ++i) {
        keys.push_back(SortKey::make(ops[i].layer, i, i));
    }

    // Sequence numbers are unique, so the order is total.
    std::sort(keys.begin(), keys.end());

    DrawPass pass;
    pass.sortedIndices_.reserve(keys.size());
    for (const SortKey& k : keys) {
        pass.sortedIndices_.push_back(k.opIndex);
    }
    return pass;
}

}

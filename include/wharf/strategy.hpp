#pragma once

#include <cstddef>

namespace wharf {

enum class Strategy {
    Clone,                  // no candidates: clone to the well-known path
    PickAny,                // no revision requested: any candidate as-is
    PickAndFastForward,     // pick among forwardable candidates, fast-forward
    PickAndStashCheckout,   // pick among all candidates, stash and check out
};

const char* strategy_name(Strategy s);

Strategy select_strategy(bool has_revision, size_t candidates, size_t forwardable);

} // namespace wharf

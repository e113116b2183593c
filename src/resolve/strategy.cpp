#include <wharf/strategy.hpp>

namespace wharf {

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::Clone:                return "clone";
        case Strategy::PickAny:              return "pick";
        case Strategy::PickAndFastForward:   return "fast-forward";
        case Strategy::PickAndStashCheckout: return "stash-and-checkout";
    }
    return "unknown";
}

Strategy select_strategy(bool has_revision, size_t candidates, size_t forwardable) {
    if (candidates == 0) return Strategy::Clone;
    if (!has_revision) return Strategy::PickAny;
    if (forwardable > 0) return Strategy::PickAndFastForward;
    return Strategy::PickAndStashCheckout;
}

} // namespace wharf

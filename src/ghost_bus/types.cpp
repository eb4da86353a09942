#include "ghost_bus/types.hpp"

namespace ghost_bus {

EpochSeconds wall_clock_now_s() {
    const Duration since_epoch = WallClock::now().time_since_epoch();
    return since_epoch.count();
}

}  // namespace ghost_bus

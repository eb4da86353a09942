// === Version Metadata ========================================================
//
// Exposes the service's semantic version string used in logs.

#pragma once

#include <string_view>

namespace ghost_bus {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace ghost_bus

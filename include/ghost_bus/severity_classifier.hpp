// === Severity Classifier =====================================================
//
// Collapses a tag set into a single severity. Critical tags are checked
// before warning tags.

#pragma once

#include "ghost_bus/anomaly.hpp"

namespace ghost_bus {

/** @brief Map @p tags to Info, Warning or Critical. */
[[nodiscard]] Severity classify_severity(const AnomalyTagSet& tags);

/** @brief A vehicle is a ghost as soon as any tag fires. */
[[nodiscard]] inline bool is_ghost(const AnomalyTagSet& tags) noexcept {
    return !tags.empty();
}

}  // namespace ghost_bus

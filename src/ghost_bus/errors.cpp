#include "ghost_bus/errors.hpp"

#include <utility>

namespace ghost_bus {

ValidationError::ValidationError(std::string field, const std::string& message)
    : Error("invalid field '" + field + "': " + message),
      str_field_(std::move(field)) {}

const std::string& ValidationError::field() const noexcept {
    return str_field_;
}

NotFoundError::NotFoundError(const std::string& vehicle_id)
    : Error("vehicle not found: " + vehicle_id) {}

}  // namespace ghost_bus

// === Error Types =============================================================
//
// Exception hierarchy shared by the ingestion, query, subscription, and
// collaborator layers. Pure classification code never throws; these types
// only surface at the edges of the core.

#pragma once

#include <stdexcept>
#include <string>

namespace ghost_bus {

/** @brief Root of every exception raised by the service. */
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Inbound report rejected before it reached the state store. */
class ValidationError final : public Error {
  public:
    ValidationError(std::string field, const std::string& message);

    /** @brief Name of the offending field. */
    [[nodiscard]] const std::string& field() const noexcept;

  private:
    std::string str_field_;
};

/** @brief Query for a vehicle identifier the store has never seen. */
class NotFoundError final : public Error {
  public:
    explicit NotFoundError(const std::string& vehicle_id);
};

/** @brief Durable store or reference loader could not be reached. */
class CollaboratorUnavailable final : public Error {
  public:
    using Error::Error;
};

/** @brief A message could not be handed to an observer sink. */
class DeliveryFailure final : public Error {
  public:
    using Error::Error;
};

}  // namespace ghost_bus

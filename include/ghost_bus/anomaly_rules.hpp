// === Anomaly Rules ===========================================================
//
// Independent predicates evaluated against an incoming report and the
// vehicle's history window (already updated with that report). Every rule runs
// on every report, so a single report can carry several tags. Rules are pure:
// the only input besides the report and window is the captured "now".

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "ghost_bus/anomaly.hpp"
#include "ghost_bus/history_window.hpp"
#include "ghost_bus/position_report.hpp"
#include "ghost_bus/types.hpp"

namespace ghost_bus {

/**
 * @brief Thresholds for the built-in rules.
 *
 * Populated by ConfigurationLoader at startup and treated as immutable while
 * the service runs.
 */
struct DetectorConfig final {
    double stale_threshold_s{120.0};            /**< Max tolerated report age. */
    double stationary_threshold_s{60.0};        /**< Min time span to call a vehicle stationary. */
    double stationary_distance_m{20.0};         /**< Max path distance over that span. */
    std::size_t stationary_sample_span{5};      /**< Samples examined by the stationary rule. */
    std::size_t stationary_min_samples{3};      /**< Samples required before it may fire. */
    std::size_t speed_min_samples{5};           /**< Speed readings required for the speed rule. */
    double speed_spike_factor{3.0};             /**< Spike when speed > factor x mean. */
    double speed_drop_factor{0.3};              /**< Drop when speed < factor x mean. */
    double speed_drop_min_mean{10.0};           /**< Drop only considered above this mean. */
    GeoBoundingBox service_area{};              /**< Coarse geofence. */
};

/** @brief Inputs available to a rule for one evaluation. */
struct RuleContext final {
    const PositionReport& report;
    const HistoryWindow& window;
    EpochSeconds now_s;
};

/** @brief A single anomaly predicate yielding at most one tag. */
class AnomalyRule {
  public:
    virtual ~AnomalyRule() = default;

    /** @brief Short identifier used in logs. */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::optional<AnomalyTag> evaluate(const RuleContext& context) const = 0;
};

using AnomalyRulePtr = std::unique_ptr<AnomalyRule>;

/** @brief Tags reports whose timestamp lags "now" by more than the threshold. */
class StaleDataRule final : public AnomalyRule {
  public:
    explicit StaleDataRule(double stale_threshold_s);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::optional<AnomalyTag> evaluate(const RuleContext& context) const override;

  private:
    double stale_threshold_s_;
};

/**
 * @brief Tags vehicles that barely moved across their most recent samples.
 *
 * Stop proximity is not consulted: the rule fires on the distance/time
 * condition alone, wherever the vehicle happens to be.
 */
class StationaryRule final : public AnomalyRule {
  public:
    StationaryRule(double threshold_s, double max_distance_m, std::size_t sample_span, std::size_t min_samples);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::optional<AnomalyTag> evaluate(const RuleContext& context) const override;

  private:
    double threshold_s_;
    double max_distance_m_;
    std::size_t sample_span_;
    std::size_t min_samples_;
};

/** @brief Compares the current speed against the mean of prior readings. */
class SpeedAnomalyRule final : public AnomalyRule {
  public:
    SpeedAnomalyRule(std::size_t min_samples, double spike_factor, double drop_factor, double drop_min_mean);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::optional<AnomalyTag> evaluate(const RuleContext& context) const override;

  private:
    std::size_t min_samples_;
    double spike_factor_;
    double drop_factor_;
    double drop_min_mean_;
};

/** @brief Tags positions outside the service-area bounding box. */
class GeofenceRule final : public AnomalyRule {
  public:
    explicit GeofenceRule(GeoBoundingBox service_area);

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] std::optional<AnomalyTag> evaluate(const RuleContext& context) const override;

  private:
    GeoBoundingBox service_area_;
};

/** @brief Ordered collection of rules evaluated without short-circuiting. */
class RuleSet final {
  public:
    RuleSet() = default;
    /** @brief Build the four built-in rules from @p config. */
    explicit RuleSet(const DetectorConfig& config);

    void add_rule(AnomalyRulePtr rule);
    [[nodiscard]] std::size_t rule_count() const noexcept;

    /** @brief Run every rule and collect the tags they emit. */
    [[nodiscard]] AnomalyTagSet evaluate(const PositionReport& report, const HistoryWindow& window, EpochSeconds now_s) const;

  private:
    std::vector<AnomalyRulePtr> list_rules_;
};

}  // namespace ghost_bus

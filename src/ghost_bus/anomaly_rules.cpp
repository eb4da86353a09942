#include "ghost_bus/anomaly_rules.hpp"

#include <stdexcept>
#include <utility>

namespace ghost_bus {

StaleDataRule::StaleDataRule(double stale_threshold_s)
    : stale_threshold_s_(stale_threshold_s) {}

std::string_view StaleDataRule::name() const noexcept {
    return "stale_data";
}

std::optional<AnomalyTag> StaleDataRule::evaluate(const RuleContext& context) const {
    const double age_s = context.now_s - context.report.timestamp_s;
    if (age_s > stale_threshold_s_) {
        return AnomalyTag::StaleData;
    }
    return std::nullopt;
}

StationaryRule::StationaryRule(double threshold_s, double max_distance_m, std::size_t sample_span, std::size_t min_samples)
    : threshold_s_(threshold_s),
      max_distance_m_(max_distance_m),
      sample_span_(sample_span),
      min_samples_(min_samples) {}

std::string_view StationaryRule::name() const noexcept {
    return "stationary_non_stop";
}

std::optional<AnomalyTag> StationaryRule::evaluate(const RuleContext& context) const {
    if (context.window.size() < min_samples_) {
        return std::nullopt;
    }
    const std::vector<HistorySample> recent = context.window.tail(sample_span_);
    if (recent.empty() || recent.size() < min_samples_) {
        return std::nullopt;
    }

    const double moved_m = path_distance_m(recent);
    const double span_s = recent.back().timestamp_s - recent.front().timestamp_s;
    if (moved_m < max_distance_m_ && span_s > threshold_s_) {
        return AnomalyTag::StationaryNonStop;
    }
    return std::nullopt;
}

SpeedAnomalyRule::SpeedAnomalyRule(std::size_t min_samples, double spike_factor, double drop_factor, double drop_min_mean)
    : min_samples_(min_samples),
      spike_factor_(spike_factor),
      drop_factor_(drop_factor),
      drop_min_mean_(drop_min_mean) {}

std::string_view SpeedAnomalyRule::name() const noexcept {
    return "speed_anomaly";
}

std::optional<AnomalyTag> SpeedAnomalyRule::evaluate(const RuleContext& context) const {
    if (!context.report.speed.has_value()) {
        return std::nullopt;
    }
    if (context.window.speed_sample_count() < min_samples_) {
        return std::nullopt;
    }
    const std::optional<double> baseline = context.window.mean_speed_before_latest();
    if (!baseline.has_value()) {
        return std::nullopt;
    }

    const double current = *context.report.speed;
    const double mean = *baseline;
    if (mean > 0.0 && current > mean * spike_factor_) {
        return AnomalyTag::SpeedSpike;
    }
    if (mean > drop_min_mean_ && current < mean * drop_factor_) {
        return AnomalyTag::SpeedDrop;
    }
    return std::nullopt;
}

GeofenceRule::GeofenceRule(GeoBoundingBox service_area)
    : service_area_(service_area) {}

std::string_view GeofenceRule::name() const noexcept {
    return "off_route";
}

std::optional<AnomalyTag> GeofenceRule::evaluate(const RuleContext& context) const {
    if (service_area_.contains(context.report.coordinate())) {
        return std::nullopt;
    }
    return AnomalyTag::OffRoute;
}

RuleSet::RuleSet(const DetectorConfig& config) {
    add_rule(std::make_unique<StaleDataRule>(config.stale_threshold_s));
    add_rule(std::make_unique<StationaryRule>(
        config.stationary_threshold_s,
        config.stationary_distance_m,
        config.stationary_sample_span,
        config.stationary_min_samples
    ));
    add_rule(std::make_unique<SpeedAnomalyRule>(
        config.speed_min_samples,
        config.speed_spike_factor,
        config.speed_drop_factor,
        config.speed_drop_min_mean
    ));
    add_rule(std::make_unique<GeofenceRule>(config.service_area));
}

void RuleSet::add_rule(AnomalyRulePtr rule) {
    if (rule == nullptr) {
        throw std::invalid_argument("RuleSet::add_rule requires a rule");
    }
    list_rules_.push_back(std::move(rule));
}

std::size_t RuleSet::rule_count() const noexcept {
    return list_rules_.size();
}

AnomalyTagSet RuleSet::evaluate(const PositionReport& report, const HistoryWindow& window, EpochSeconds now_s) const {
    const RuleContext context{report, window, now_s};
    AnomalyTagSet tags;
    for (const AnomalyRulePtr& rule : list_rules_) {
        if (const std::optional<AnomalyTag> tag = rule->evaluate(context); tag.has_value()) {
            tags.insert(*tag);
        }
    }
    return tags;
}

}  // namespace ghost_bus

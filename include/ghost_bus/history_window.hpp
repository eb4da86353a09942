// === History Window ==========================================================
//
// Bounded FIFO of recent samples for a single vehicle. Insertion order is
// arrival order; producers are not trusted to be monotonic so samples are
// never reordered. Once capacity is exceeded the oldest samples are evicted.

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "ghost_bus/position_report.hpp"

namespace ghost_bus {

inline constexpr std::size_t k_default_history_capacity{60};

/** @brief Capacity-bounded, arrival-ordered sample buffer for one vehicle. */
class HistoryWindow final {
  public:
    explicit HistoryWindow(std::size_t capacity = k_default_history_capacity);

    /** @brief Append @p sample, evicting from the front down to capacity. */
    void record(const HistorySample& sample);

    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    /** @brief Samples in arrival order, most recent last. */
    [[nodiscard]] const std::deque<HistorySample>& samples() const noexcept;
    /** @brief Most recently recorded sample; requires a non-empty window. */
    [[nodiscard]] const HistorySample& latest() const;
    /** @brief Copy of the last @p count samples (fewer if the window is shorter). */
    [[nodiscard]] std::vector<HistorySample> tail(std::size_t count) const;

    /** @brief Number of samples carrying a speed value. */
    [[nodiscard]] std::size_t speed_sample_count() const noexcept;
    /** @brief Mean over samples that carry a speed; nullopt when none do. */
    [[nodiscard]] std::optional<double> mean_speed() const;
    /**
     * @brief Mean speed over every sample except the most recent one.
     *
     * Baseline used to judge the newest reading against its predecessors.
     */
    [[nodiscard]] std::optional<double> mean_speed_before_latest() const;
    /** @brief Sum of haversine distances between consecutive samples. */
    [[nodiscard]] double cumulative_distance_m() const;

  private:
    std::size_t capacity_;
    std::deque<HistorySample> deque_samples_;
};

/** @brief Sum of consecutive-pair haversine distances over @p samples. */
[[nodiscard]] double path_distance_m(const std::vector<HistorySample>& samples);

}  // namespace ghost_bus

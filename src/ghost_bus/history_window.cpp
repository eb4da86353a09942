#include "ghost_bus/history_window.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>

#include "ghost_bus/geo_math.hpp"

namespace ghost_bus {

namespace {
template <typename Iterator>
double sum_path_distance_m(Iterator first, Iterator last) {
    double total_m = 0.0;
    if (first == last) {
        return total_m;
    }
    for (Iterator previous = first++; first != last; previous = first++) {
        total_m += haversine_distance_m(previous->coordinate(), first->coordinate());
    }
    return total_m;
}

template <typename Iterator>
std::optional<double> mean_of_speeds(Iterator first, Iterator last) {
    double sum = 0.0;
    std::size_t count = 0;
    for (; first != last; ++first) {
        if (first->speed.has_value()) {
            sum += *first->speed;
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(count);
}
}  // namespace

HistoryWindow::HistoryWindow(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("HistoryWindow capacity must be positive");
    }
}

void HistoryWindow::record(const HistorySample& sample) {
    deque_samples_.push_back(sample);
    while (deque_samples_.size() > capacity_) {
        deque_samples_.pop_front();
    }
}

std::size_t HistoryWindow::capacity() const noexcept {
    return capacity_;
}

std::size_t HistoryWindow::size() const noexcept {
    return deque_samples_.size();
}

bool HistoryWindow::empty() const noexcept {
    return deque_samples_.empty();
}

const std::deque<HistorySample>& HistoryWindow::samples() const noexcept {
    return deque_samples_;
}

const HistorySample& HistoryWindow::latest() const {
    if (deque_samples_.empty()) {
        throw std::logic_error("HistoryWindow::latest called on an empty window");
    }
    return deque_samples_.back();
}

std::vector<HistorySample> HistoryWindow::tail(std::size_t count) const {
    const std::size_t take = std::min(count, deque_samples_.size());
    return std::vector<HistorySample>(deque_samples_.end() - static_cast<std::ptrdiff_t>(take), deque_samples_.end());
}

std::size_t HistoryWindow::speed_sample_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(deque_samples_.begin(), deque_samples_.end(), [](const HistorySample& sample) {
        return sample.speed.has_value();
    }));
}

std::optional<double> HistoryWindow::mean_speed() const {
    return mean_of_speeds(deque_samples_.begin(), deque_samples_.end());
}

std::optional<double> HistoryWindow::mean_speed_before_latest() const {
    if (deque_samples_.empty()) {
        return std::nullopt;
    }
    return mean_of_speeds(deque_samples_.begin(), std::prev(deque_samples_.end()));
}

double HistoryWindow::cumulative_distance_m() const {
    return sum_path_distance_m(deque_samples_.begin(), deque_samples_.end());
}

double path_distance_m(const std::vector<HistorySample>& samples) {
    return sum_path_distance_m(samples.begin(), samples.end());
}

}  // namespace ghost_bus

#pragma once

#include <cstddef>
#include <map>
#include <vector>
#include <utility>

#include "cr/model.hpp"

namespace cr {

struct Aggregation {
    double min{};
    double avg{};
    double max{};
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

// min/avg/max and nearest-rank percentiles pctl (0..100) of times
Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl);

struct CaptureSummary {
    std::size_t        triggers{};
    std::size_t        succeeded{};
    std::size_t        saved{};           // bytes persisted (200 and 415)
    std::map<int, std::size_t> by_status; // http status -> count
    Aggregation        fetch_ms;          // over triggers that reached the device
    std::size_t        timed{};           // samples behind fetch_ms
};

CaptureSummary summarize(const std::vector<TriggerResult>& results, const std::vector<int>& pctl);

} // namespace cr

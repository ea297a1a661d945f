#include "cr/aggregate.hpp"

#include <algorithm>
#include <numeric>

namespace cr {

Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl)
{
    Aggregation ag{};
    if (times.empty()) return ag;

    auto [min_it, max_it] = std::minmax_element(times.begin(), times.end());
    ag.min = *min_it;
    ag.max = *max_it;
    ag.avg = std::accumulate(times.begin(), times.end(), 0.0) /
             static_cast<double>(times.size());

    std::vector<double> sorted = times;
    std::ranges::sort(sorted);
    auto pct_value = [&](int p) -> double
    {
        size_t n  = sorted.size();
        int    pc = std::clamp(p, 0, 100);
        size_t rank = (static_cast<size_t>(pc) * n + 100 - 1) / 100; // ceil
        rank = std::clamp<size_t>(rank, 1, n);
        return sorted[rank - 1];
    };

    ag.percentiles.reserve(pctl.size());
    for (int p : pctl) ag.percentiles.emplace_back(p, pct_value(p));
    return ag;
}

CaptureSummary summarize(const std::vector<TriggerResult>& results, const std::vector<int>& pctl)
{
    CaptureSummary s{};
    std::vector<double> times;
    times.reserve(results.size());
    for (const auto& r : results)
    {
        ++s.triggers;
        ++s.by_status[r.http_status];
        if (r.ok()) ++s.succeeded;
        if (r.saved) ++s.saved;
        // the not-discovered short-circuit never touched the network
        if (r.record) times.push_back(r.record->duration_ms);
    }
    s.timed = times.size();
    s.fetch_ms = aggregate_times(times, pctl);
    return s;
}

} // namespace cr

#include "cr/output.hpp"

#include <sstream>
#include <iomanip>

#include "cr/aggregate.hpp"
#include "cr/model.hpp"
#include "cr/options.hpp"

namespace cr {

std::string format_header_text(const Options& opt)
{
    std::ostringstream os;
    os << "Target: " << opt.hostname << ".local"
       << "  Service: " << opt.service_type << '\n';
    os << "Interface: " << (opt.interface_addr.empty() ? "(any)" : opt.interface_addr.c_str())
       << "  Output: " << opt.output_dir << '\n';
    os << "Captures: ";
    if (opt.captures == 0) os << "interactive";
    else os << opt.captures;
    os << "  Concurrency: " << opt.concurrency
       << "  Interval: " << opt.interval_ms << " ms"
       << "  Wait: " << opt.wait_ms << " ms\n";
    os << "Timeouts: fetch=" << opt.fetch_timeout_ms
       << " resolve=" << opt.resolve_timeout_ms
       << " poll=" << opt.poll_interval_ms
       << " join=" << opt.join_timeout_ms << " (ms)\n";
    return os.str();
}

std::string format_status_text(const ServiceStatus& st)
{
    std::ostringstream os;
    if (st.discovered)
        os << "status: discovered " << st.target_hostname << " at " << st.url << '\n';
    else
        os << "status: not discovered (waiting for " << st.target_hostname << ")\n";
    return os.str();
}

std::string format_trigger_text(int t, const TriggerResult& r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "capture " << t << ": " << r.http_status << ' ' << error_kind_str(r.kind);
    if (r.record) os << " - " << r.record->duration_ms << " ms";
    os << '\n';
    os << "  " << r.message << '\n';
    if (!r.filename.empty())
    {
        os << "  file: " << r.filename;
        if (r.record) os << " (" << r.record->size_bytes << " bytes)";
        if (!r.saved) os << " [not saved]";
        os << '\n';
    }
    return os.str();
}

std::string format_summary_text(const CaptureSummary& s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "summary: " << s.succeeded << '/' << s.triggers << " captured, "
       << s.saved << " saved";
    if (!s.by_status.empty())
    {
        os << " (";
        bool first = true;
        for (const auto& [status, count] : s.by_status)
        {
            if (!first) os << ", ";
            first = false;
            os << status << 'x' << count;
        }
        os << ')';
    }
    os << '\n';
    if (s.timed)
    {
        os << "fetch: min=" << s.fetch_ms.min
           << " ms, avg=" << s.fetch_ms.avg
           << " ms, max=" << s.fetch_ms.max
           << " ms (" << s.timed << " fetches)\n";
    }
    return os.str();
}

std::string format_percentiles_text(const std::vector<std::pair<int,double>>& pctl_values)
{
    if (pctl_values.empty()) return {};
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "percentiles: ";
    for (size_t i = 0; i < pctl_values.size(); ++i)
    {
        if (i) os << ", ";
        os << 'p' << pctl_values[i].first << '=' << pctl_values[i].second;
    }
    os << '\n';
    return os.str();
}

} // namespace cr

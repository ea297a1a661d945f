#include "cr/output.hpp"

#include <sstream>
#include <iomanip>

#include "cr/aggregate.hpp"
#include "cr/json.hpp"
#include "cr/model.hpp"
#include "cr/options.hpp"
#include "cr/timefmt.hpp"

namespace cr
{
static void write_status_fields(std::ostringstream &os, const ServiceStatus &st)
{
    os << R"("status":")" << (st.discovered ? "discovered" : "not_discovered") << R"(")";
    if (st.discovered) os << R"(,"url":")" << json_escape(st.url) << R"(")";
    else os << R"(,"target_hostname":")" << json_escape(st.target_hostname) << R"(")";
}

static void write_trigger_fields(std::ostringstream &os, const TriggerResult &r)
{
    os << R"("http_status":)" << r.http_status
            << R"(,"outcome":")" << error_kind_str(r.kind) << R"(")";
    // both "message" and "error" carry the same text on the wire
    os << (r.ok() ? R"(,"message":")" : R"(,"error":")")
            << json_escape(r.message) << R"(")";
    if (!r.filename.empty())
        os << R"(,"filename":")" << json_escape(r.filename) << R"(")";
    os << R"(,"saved":)" << (r.saved ? "true" : "false");
    if (r.record)
    {
        const auto &rec = *r.record;
        os << R"(,"record":{"capture_id":)" << rec.capture_id
                << R"(,"timestamp":")" << json_escape(format_iso_timestamp(rec.timestamp))
                << R"(","size_bytes":)" << rec.size_bytes
                << R"(,"fetch_ms":)" << rec.duration_ms
                << R"(,"url":")" << json_escape(rec.endpoint_url) << R"("})";
    }
}

std::string build_ndjson_status(const ServiceStatus &st)
{
    std::ostringstream os;
    os << "{";
    write_status_fields(os, st);
    os << "}";
    return os.str();
}

std::string build_ndjson_trigger(int t, const TriggerResult &r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{\"capture\":" << t << ",";
    write_trigger_fields(os, r);
    os << "}";
    return os.str();
}

std::string build_final_json(const Options &opt,
                             const ServiceStatus &st,
                             const CaptureSummary &s,
                             const std::vector<TriggerResult> &results)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("hostname":")" << json_escape(opt.hostname) << R"(",)";
    os << R"("service_type":")" << json_escape(opt.service_type) << R"(",)";
    os << R"("output_dir":")" << json_escape(opt.output_dir) << R"(",)";
    os << R"("concurrency":)" << opt.concurrency << ",";
    os << R"("fetch_timeout_ms":)" << opt.fetch_timeout_ms << ",";
    os << "\"discovery\":{";
    write_status_fields(os, st);
    os << "},";
    os << R"("summary":{"triggers":)" << s.triggers
            << R"(,"succeeded":)" << s.succeeded
            << R"(,"saved":)" << s.saved
            << R"(,"by_status":{)";
    bool first = true;
    for (const auto &[status, count]: s.by_status)
    {
        if (!first) os << ",";
        first = false;
        os << R"(")" << status << R"(":)" << count;
    }
    os << "}";
    if (s.timed)
    {
        os << R"(,"fetch_ms":{"min":)" << s.fetch_ms.min
                << R"(,"avg":)" << s.fetch_ms.avg
                << R"(,"max":)" << s.fetch_ms.max
                << R"(,"count":)" << s.timed << "}";
    }
    os << "},";
    if (!s.fetch_ms.percentiles.empty())
    {
        os << R"("percentiles":{)";
        for (size_t i = 0; i < s.fetch_ms.percentiles.size(); ++i)
        {
            if (i) os << ",";
            os << R"("p)" << s.fetch_ms.percentiles[i].first << R"(":)"
                    << s.fetch_ms.percentiles[i].second;
        }
        os << "},";
    }
    os << R"("captures":[)";
    for (size_t i = 0; i < results.size(); ++i)
    {
        if (i) os << ",";
        os << "{\"capture\":" << (i + 1) << ",";
        write_trigger_fields(os, results[i]);
        os << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}
} // namespace cr

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cr
{
struct Options;
struct ServiceStatus;
struct TriggerResult;
struct CaptureSummary;

// Text formatting (complete text blocks with trailing newlines)
std::string format_header_text(const Options &opt);

std::string format_status_text(const ServiceStatus &st);

std::string format_trigger_text(int t, const TriggerResult &r);

std::string format_summary_text(const CaptureSummary &s);

std::string format_percentiles_text(
    const std::vector<std::pair<int, double> > &pctl_values);

// NDJSON builders (single-line JSON strings without trailing newline)
std::string build_ndjson_status(const ServiceStatus &st);

std::string build_ndjson_trigger(int t, const TriggerResult &r);

// Final JSON (single object string without trailing newline)
std::string build_final_json(const Options &opt,
                             const ServiceStatus &st,
                             const CaptureSummary &s,
                             const std::vector<TriggerResult> &results);
} // namespace cr

#pragma once

#include <string>
#include <vector>

namespace cr
{
struct Options
{
    // discovery
    std::string hostname = "esp32-cam-project"; // target mDNS hostname label
    std::string service_type = "_http._tcp.local.";
    std::string interface_addr;  // IPv4 address of the NIC to join on; empty = any
    int resolve_timeout_ms = 2000;
    int poll_interval_ms = 500;  // discovery loop cancellation poll
    int join_timeout_ms = 5000;  // discovery shutdown bound
    // capture
    int fetch_timeout_ms = 20000;
    std::string output_dir = "output";
    int captures = 1;            // 0 = interactive
    int concurrency = 1;         // parallel triggers per batch
    int interval_ms = 0;         // pause between batches
    int wait_ms = 10000;         // wait for discovery before the first batch
    // output
    bool json = false;           // final JSON summary
    bool ndjson = false;         // one JSON line per trigger
    std::vector<int> pctl;       // requested percentiles (0..100)
    std::string log_level = "info";
};
} // namespace cr

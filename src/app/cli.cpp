#include "cr/cli.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

using namespace std::string_view_literals;

namespace cr {

void print_usage(const char *prog)
{
    fmt::print("Camera capture relay (mDNS discovery + HTTP capture)\n");
    fmt::print("Usage: {} [options]\n", prog);
    fmt::print("Options:\n");
    fmt::print("  --hostname H       Device hostname label (default: esp32-cam-project)\n");
    fmt::print("  --service T        DNS-SD service type (default: _http._tcp.local.)\n");
    fmt::print("  --interface IP     IPv4 address of the interface to browse on\n");
    fmt::print("  --output DIR       Output directory (default: output)\n");
    fmt::print("  --captures N       Captures to take; 0 = interactive (default: 1)\n");
    fmt::print("  --concurrency K    Parallel captures per batch (default: 1)\n");
    fmt::print("  --interval MS      Pause between batches (default: 0)\n");
    fmt::print("  --wait MS          Wait for discovery before capturing (default: 10000)\n");
    fmt::print("  --fetch-timeout MS Capture request timeout (default: 20000)\n");
    fmt::print("  --resolve-timeout MS  Service resolve timeout (default: 2000)\n");
    fmt::print("  --poll MS          Discovery cancellation poll (default: 500)\n");
    fmt::print("  --join-timeout MS  Discovery shutdown bound (default: 5000)\n");
    fmt::print("  --json             Print a final JSON summary\n");
    fmt::print("  --ndjson           Print each capture as a single JSON line\n");
    fmt::print("  --pctl LIST        Comma-separated fetch-time percentiles (e.g., 50,90,99)\n");
    fmt::print("  --log-level L      trace|debug|info|warn|error|off (default: info)\n");
    fmt::print("  -h, --help         Show this help\n");
    fmt::print("\n");
    fmt::print("Interactive commands: capture, status, quit\n");
    fmt::print("\n");
    fmt::print("Examples:\n");
    fmt::print("  {} --hostname my-esp32-cam --captures 5 --interval 1000\n", prog);
    fmt::print("  {} --captures 0 --log-level debug\n", prog);
}

// Accepts "--name value" and "--name=value". Returns false on a usage error.
static bool option_value(std::string_view a, std::string_view name,
                         int &i, int argc, char **argv, std::string &val)
{
    if (a == name)
    {
        if (i + 1 >= argc)
        {
            fmt::print("missing value for {}\n", name);
            return false;
        }
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    fmt::print("invalid {} usage\n", name);
    return false;
}

static bool matches(std::string_view a, std::string_view name)
{
    return a == name || (a.rfind(name, 0) == 0 && a.size() > name.size() && a[name.size()] == '=');
}

static bool parse_int(std::string_view name, const std::string &val, int min, int &out)
{
    try
    {
        size_t used = 0;
        const int v = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        if (v < min)
        {
            fmt::print("{} must be >= {}: {}\n", name, min, v);
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        fmt::print("invalid {} value: {}\n", name, val);
        return false;
    }
}

static bool parse_pctl(const std::string &val, std::vector<int> &out)
{
    std::string num;
    auto flush = [&]() -> bool
    {
        if (num.empty()) return true;
        int p = 0;
        if (!parse_int("--pctl", num, 0, p)) return false;
        if (p > 100)
        {
            fmt::print("percentile out of range: {}\n", p);
            return false;
        }
        out.push_back(p);
        num.clear();
        return true;
    };
    for (char ch: val)
    {
        if (ch == ',')
        {
            if (!flush()) return false;
        }
        else if (ch >= '0' && ch <= '9')
        {
            num.push_back(ch);
        }
        else
        {
            fmt::print("invalid --pctl character: {}\n", ch);
            return false;
        }
    }
    if (!flush()) return false;
    std::ranges::sort(out);
    out.erase(std::ranges::unique(out).begin(), out.end());
    return true;
}

bool parse_args(int argc, char **argv, Options &opt)
{
    static constexpr std::string_view kLevels[] = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        std::string val;
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }
        if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (matches(a, "--hostname"))
        {
            if (!option_value(a, "--hostname", i, argc, argv, val)) return false;
            if (val.empty())
            {
                fmt::print("--hostname must not be empty\n");
                return false;
            }
            // accept "name.local" as well as the bare label
            if (val.size() > 6 && val.ends_with(".local")) val.resize(val.size() - 6);
            opt.hostname = std::move(val);
        }
        else if (matches(a, "--service"))
        {
            if (!option_value(a, "--service", i, argc, argv, val)) return false;
            if (val.empty())
            {
                fmt::print("--service must not be empty\n");
                return false;
            }
            opt.service_type = std::move(val);
        }
        else if (matches(a, "--interface"))
        {
            if (!option_value(a, "--interface", i, argc, argv, opt.interface_addr)) return false;
        }
        else if (matches(a, "--output"))
        {
            if (!option_value(a, "--output", i, argc, argv, val)) return false;
            if (val.empty())
            {
                fmt::print("--output must not be empty\n");
                return false;
            }
            opt.output_dir = std::move(val);
        }
        else if (matches(a, "--captures"))
        {
            if (!option_value(a, "--captures", i, argc, argv, val) ||
                !parse_int("--captures", val, 0, opt.captures)) return false;
        }
        else if (matches(a, "--concurrency"))
        {
            if (!option_value(a, "--concurrency", i, argc, argv, val) ||
                !parse_int("--concurrency", val, 1, opt.concurrency)) return false;
        }
        else if (matches(a, "--interval"))
        {
            if (!option_value(a, "--interval", i, argc, argv, val) ||
                !parse_int("--interval", val, 0, opt.interval_ms)) return false;
        }
        else if (matches(a, "--wait"))
        {
            if (!option_value(a, "--wait", i, argc, argv, val) ||
                !parse_int("--wait", val, 0, opt.wait_ms)) return false;
        }
        else if (matches(a, "--fetch-timeout"))
        {
            if (!option_value(a, "--fetch-timeout", i, argc, argv, val) ||
                !parse_int("--fetch-timeout", val, 1, opt.fetch_timeout_ms)) return false;
        }
        else if (matches(a, "--resolve-timeout"))
        {
            if (!option_value(a, "--resolve-timeout", i, argc, argv, val) ||
                !parse_int("--resolve-timeout", val, 1, opt.resolve_timeout_ms)) return false;
        }
        else if (matches(a, "--poll"))
        {
            if (!option_value(a, "--poll", i, argc, argv, val) ||
                !parse_int("--poll", val, 1, opt.poll_interval_ms)) return false;
        }
        else if (matches(a, "--join-timeout"))
        {
            if (!option_value(a, "--join-timeout", i, argc, argv, val) ||
                !parse_int("--join-timeout", val, 0, opt.join_timeout_ms)) return false;
        }
        else if (matches(a, "--pctl"))
        {
            std::vector<int> out;
            if (!option_value(a, "--pctl", i, argc, argv, val) || !parse_pctl(val, out)) return false;
            opt.pctl = std::move(out);
        }
        else if (matches(a, "--log-level"))
        {
            if (!option_value(a, "--log-level", i, argc, argv, val)) return false;
            if (std::ranges::find(kLevels, std::string_view(val)) == std::end(kLevels))
            {
                fmt::print("unknown log level: {}\n", val);
                return false;
            }
            opt.log_level = std::move(val);
        }
        else
        {
            fmt::print("unknown option: {}\n", a);
            return false;
        }
    }
    return true;
}

} // namespace cr

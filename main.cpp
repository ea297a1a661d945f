#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cr/aggregate.hpp"
#include "cr/cli.hpp"
#include "cr/concurrency.hpp"
#include "cr/discovery.hpp"
#include "cr/fetcher.hpp"
#include "cr/mdns.hpp"
#include "cr/model.hpp"
#include "cr/options.hpp"
#include "cr/orchestrator.hpp"
#include "cr/output.hpp"
#include "cr/registry.hpp"
#include "cr/runner.hpp"
#include "cr/service.hpp"
#include "cr/storage.hpp"

using namespace cr;

namespace
{
volatile std::sig_atomic_t g_signal = 0;

extern "C" void on_signal(int sig)
{
    g_signal = sig;
}

void install_signal_handlers()
{
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: a blocking stdin read returns on ^C
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

bool interrupted()
{
    return g_signal != 0;
}

// Sleeps in short steps so a signal ends the wait early.
void sleep_interruptible(int ms)
{
    using namespace std::chrono;
    const auto until = steady_clock::now() + milliseconds(ms);
    while (!interrupted() && steady_clock::now() < until)
    {
        std::this_thread::sleep_for(std::min(milliseconds(50),
                                             duration_cast<milliseconds>(until - steady_clock::now())));
    }
}

bool wait_for_discovery(const CaptureService &svc, int wait_ms)
{
    using namespace std::chrono;
    const auto until = steady_clock::now() + milliseconds(wait_ms);
    while (!interrupted())
    {
        if (svc.get_status().discovered) return true;
        if (steady_clock::now() >= until) return false;
        std::this_thread::sleep_for(milliseconds(100));
    }
    return false;
}

class ResultPrinter
{
public:
    explicit ResultPrinter(const Options &opt)
        : opt_(opt)
    {}

    void trigger(int t, const TriggerResult &r)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (opt_.ndjson) fmt::print("{}\n", build_ndjson_trigger(t, r));
        else if (!opt_.json) fmt::print("{}", format_trigger_text(t, r));
        std::fflush(stdout);
    }

    void status(const ServiceStatus &st)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (opt_.ndjson) fmt::print("{}\n", build_ndjson_status(st));
        else if (!opt_.json) fmt::print("{}", format_status_text(st));
        std::fflush(stdout);
    }

private:
    const Options &opt_;
    std::mutex     mtx_;
};

void run_batches(const Options &opt, CaptureService &svc, ResultPrinter &printer,
                 std::vector<TriggerResult> &results)
{
    results.assign(opt.captures, TriggerResult{});
    std::vector<bool> done(opt.captures, false);
    Cancellation cancel;
    std::mutex done_mtx;

    int next = 1;
    while (next <= opt.captures && !interrupted())
    {
        const int batch = std::min(opt.concurrency, opt.captures - (next - 1));
        for_each_index_batched_cancelable(
            batch, batch,
            [&](int k, const std::atomic<bool> &)
            {
                const int t = next + k - 1;
                auto r = svc.trigger_capture();
                printer.trigger(t, r);
                std::lock_guard<std::mutex> lk(done_mtx);
                results[t - 1] = std::move(r);
                done[t - 1] = true;
            },
            &cancel);
        next += batch;
        if (next <= opt.captures && opt.interval_ms > 0) sleep_interruptible(opt.interval_ms);
    }

    // drop slots a signal prevented from running
    std::vector<TriggerResult> ran;
    ran.reserve(results.size());
    for (size_t i = 0; i < results.size(); ++i)
        if (done[i]) ran.push_back(std::move(results[i]));
    results = std::move(ran);
}

void run_interactive(CaptureService &svc, ResultPrinter &printer,
                     std::vector<TriggerResult> &results)
{
    fmt::print(stderr, "commands: capture | status | quit\n");
    std::string line;
    while (!interrupted() && std::getline(std::cin, line))
    {
        std::string_view cmd = line;
        while (!cmd.empty() && (cmd.back() == ' ' || cmd.back() == '\r')) cmd.remove_suffix(1);
        while (!cmd.empty() && cmd.front() == ' ') cmd.remove_prefix(1);
        if (cmd.empty()) continue;
        if (cmd == "capture" || cmd == "c")
        {
            results.push_back(svc.trigger_capture());
            printer.trigger(static_cast<int>(results.size()), results.back());
        }
        else if (cmd == "status" || cmd == "s")
        {
            printer.status(svc.get_status());
        }
        else if (cmd == "quit" || cmd == "q" || cmd == "exit")
        {
            break;
        }
        else
        {
            fmt::print(stderr, "unknown command: {}\n", cmd);
        }
    }
}
} // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
    }

    Options opt;
    if (!parse_args(argc, argv, opt))
    {
        fmt::print("try '{} --help'\n", argv[0]);
        return 2;
    }

    // diagnostics on stderr, results on stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("camrelay"));
    spdlog::set_level(spdlog::level::from_str(opt.log_level));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    install_signal_handlers();

    if (!opt.json && !opt.ndjson) fmt::print("{}", format_header_text(opt));

    const std::filesystem::path out_dir = opt.output_dir;
    ImageStore store(out_dir / "uploads");
    CaptureLog capture_log(out_dir / kCaptureLogFileName);
    {
        std::string err;
        if (!store.prepare(err) || !capture_log.open(err))
        {
            spdlog::error("cannot prepare output directory: {}", err);
            return 1;
        }
    }
    spdlog::info("saving images to {}", store.root().string());

    // shared with the discovery task, which may outlive this scope after a
    // timed-out stop
    auto registry = std::make_shared<EndpointRegistry>();
    CurlFetcher fetcher(opt.fetch_timeout_ms);
    CaptureOrchestrator orchestrator(
        *registry,
        [&fetcher](const std::string &url) { return fetcher.fetch(url); },
        [&store](const std::vector<std::uint8_t> &bytes, const std::string &name)
        {
            return store.write(bytes, name);
        },
        [&capture_log](const CaptureRecord &rec) { capture_log.append(rec); });
    CaptureService svc(*registry, orchestrator, opt.hostname);

    auto listener = std::make_shared<DiscoveryListener>(registry, opt.hostname, opt.resolve_timeout_ms);
    MdnsOptions mopt;
    mopt.interface_addr = opt.interface_addr;
    DiscoveryRunner runner(
        [mopt]() -> std::unique_ptr<DiscoveryTransport>
        {
            return std::make_unique<MdnsTransport>(mopt);
        },
        listener,
        opt.service_type,
        opt.poll_interval_ms);

    if (!runner.start())
    {
        spdlog::error("discovery did not start");
        return 1;
    }

    ResultPrinter printer(opt);
    std::vector<TriggerResult> results;
    int rc = 0;
    try
    {
        if (opt.captures == 0)
        {
            run_interactive(svc, printer, results);
        }
        else
        {
            if (!wait_for_discovery(svc, opt.wait_ms) && !interrupted())
                spdlog::warn("{}.local not discovered after {} ms, capturing anyway",
                             opt.hostname, opt.wait_ms);
            if (!opt.json) printer.status(svc.get_status());
            run_batches(opt, svc, printer, results);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("capture run failed: {}", e.what());
        rc = 1;
    }

    if (interrupted()) spdlog::info("signal {} received, shutting down", static_cast<int>(g_signal));
    if (!runner.stop(opt.join_timeout_ms))
        spdlog::warn("discovery did not stop within {} ms", opt.join_timeout_ms);

    const auto summary = summarize(results, opt.pctl);
    if (opt.json)
    {
        fmt::print("{}\n", build_final_json(opt, svc.get_status(), summary, results));
    }
    else if (!opt.ndjson && !results.empty())
    {
        fmt::print("{}", format_summary_text(summary));
        fmt::print("{}", format_percentiles_text(summary.fetch_ms.percentiles));
    }

    if (summary.succeeded != summary.triggers) rc = 1;
    return rc;
}

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "cr/runner.hpp"

using namespace cr;
using namespace std::chrono_literals;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

// Counters outlive the transports the runner creates and destroys.
struct TransportCounters {
    std::atomic<int>  created{0};
    std::atomic<int>  opened{0};
    std::atomic<int>  browsed{0};
    std::atomic<int>  closed{0};
    std::atomic<bool> fail_open{false};
    std::atomic<bool> throw_on_browse{false};
    std::atomic<bool> healthy{true};
    std::atomic<int>  close_delay_ms{0};
    std::atomic<bool> notify_on_close{false};
    std::string       browsed_type;
};

class CountingTransport final : public DiscoveryTransport {
public:
    explicit CountingTransport(TransportCounters &p) : p_(p) { ++p_.created; }

    bool open(std::string &error) override
    {
        ++p_.opened;
        if (p_.fail_open.load())
        {
            error = "bind refused";
            return false;
        }
        return true;
    }
    void browse(const std::string &type, ServiceListener &listener) override
    {
        if (p_.throw_on_browse.load()) throw std::runtime_error("browse exploded");
        p_.browsed_type = type;
        listener_ = &listener;
        ++p_.browsed;
    }
    ResolveResult resolve(const std::string &, const std::string &, int) override { return {}; }
    bool healthy() const override { return p_.healthy.load(); }
    void close() override
    {
        if (p_.close_delay_ms.load() > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(p_.close_delay_ms.load()));
        // a late event drained while closing
        if (p_.notify_on_close.load() && listener_)
            listener_->on_removed(*this, p_.browsed_type, "cam._http._tcp.local.");
        ++p_.closed;
    }

private:
    TransportCounters           &p_;
    ServiceListener *listener_{};
};

class NullListener final : public ServiceListener {
public:
    void on_added(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_updated(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_removed(DiscoveryTransport &, const std::string &, const std::string &) override {}
};

// Records callbacks and whether it was still alive when they arrived.
struct ListenerLog {
    std::atomic<int>  removed{0};
    std::atomic<bool> destroyed{false};
    std::atomic<bool> called_after_destroy{false};
};

class LoggingListener final : public ServiceListener {
public:
    explicit LoggingListener(ListenerLog &log) : log_(log) {}
    ~LoggingListener() override { log_.destroyed = true; }

    void on_added(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_updated(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_removed(DiscoveryTransport &, const std::string &, const std::string &) override
    {
        if (log_.destroyed.load()) log_.called_after_destroy = true;
        ++log_.removed;
    }

private:
    ListenerLog &log_;
};

static TransportFactory factory_for(TransportCounters &p)
{
    return [&p]() -> std::unique_ptr<DiscoveryTransport> { return std::make_unique<CountingTransport>(p); };
}

static bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds limit = 2000ms)
{
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until)
    {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

static void test_start_browse_stop_closes()
{
    TransportCounters p;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.state() == RunnerState::Idle, "idle before start");
    assert_true(r.start(), "start ok");
    assert_true(wait_until([&] { return p.browsed.load() == 1; }), "transport browsed");
    assert_true(p.browsed_type == "_http._tcp.local.", "service type passed");
    assert_true(r.state() == RunnerState::Running, "running");

    const auto t0 = std::chrono::steady_clock::now();
    assert_true(r.stop(1000), "stop within timeout");
    assert_true(std::chrono::steady_clock::now() - t0 < 1000ms, "stop observed within a poll or so");
    assert_true(p.closed.load() == 1, "transport closed exactly once");
    assert_true(r.state() == RunnerState::Stopped, "stopped");
}

static void test_start_twice_is_rejected()
{
    TransportCounters p;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.start(), "first start");
    assert_true(!r.start(), "second start rejected while running");
    assert_true(r.stop(1000), "stop");
    assert_true(p.created.load() == 1, "one transport only");
}

static void test_stop_is_idempotent_and_safe_before_start()
{
    TransportCounters p;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.stop(100), "stop before start is a no-op");
    assert_true(r.start(), "start");
    assert_true(r.stop(1000), "first stop");
    assert_true(r.stop(1000), "second stop");
    assert_true(p.closed.load() == 1, "closed once");
}

static void test_restart_after_stop()
{
    TransportCounters p;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.start() && r.stop(1000), "first run");
    assert_true(r.start(), "restart after stop");
    assert_true(wait_until([&] { return p.browsed.load() == 2; }), "second transport browsed");
    assert_true(r.stop(1000), "second stop");
    assert_true(p.created.load() == 2 && p.closed.load() == 2, "fresh transport per run");
}

static void test_open_failure_ends_task_and_closes()
{
    TransportCounters p;
    p.fail_open = true;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.start(), "start");
    assert_true(wait_until([&] { return r.state() == RunnerState::Stopped; }), "task ends on its own");
    assert_true(p.browsed.load() == 0, "never browsed");
    assert_true(p.closed.load() == 1, "closed after failed open");
    assert_true(r.stop(100), "stop after self-termination");
}

static void test_exception_in_task_is_contained()
{
    TransportCounters p;
    p.throw_on_browse = true;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 20);
    assert_true(r.start(), "start");
    assert_true(wait_until([&] { return r.state() == RunnerState::Stopped; }), "task ends after exception");
    assert_true(p.closed.load() == 1, "transport closed on exception path");
}

static void test_unhealthy_transport_ends_task()
{
    TransportCounters p;
    auto l = std::make_shared<NullListener>();
    DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 10);
    assert_true(r.start(), "start");
    assert_true(wait_until([&] { return p.browsed.load() == 1; }), "browsing");
    p.healthy = false;
    assert_true(wait_until([&] { return r.state() == RunnerState::Stopped; }), "task ends when transport fails");
    assert_true(p.closed.load() == 1, "closed");
}

static void test_stop_timeout_returns_false()
{
    TransportCounters p;
    p.close_delay_ms = 400;
    auto l = std::make_shared<NullListener>();
    {
        DiscoveryRunner r(factory_for(p), l, "_http._tcp.local.", 10);
        assert_true(r.start(), "start");
        assert_true(wait_until([&] { return p.browsed.load() == 1; }), "browsing");
        assert_true(!r.stop(50), "slow close exceeds the join timeout");
    }
    // the detached task still finishes its cleanup
    assert_true(wait_until([&] { return p.closed.load() == 1; }), "transport eventually closed");
    std::this_thread::sleep_for(50ms);
}

static void test_detached_task_keeps_listener_alive()
{
    TransportCounters p;
    p.close_delay_ms = 300;
    p.notify_on_close = true;
    ListenerLog log;
    auto l = std::make_shared<LoggingListener>(log);
    std::weak_ptr<LoggingListener> watch = l;
    {
        auto r = std::make_unique<DiscoveryRunner>(factory_for(p), l, "_http._tcp.local.", 10);
        l.reset();
        assert_true(r->start(), "start");
        assert_true(wait_until([&] { return p.browsed.load() == 1; }), "browsing");
        assert_true(!r->stop(20), "slow close exceeds the join timeout");
        assert_true(!watch.expired(), "listener held while the task closes");
    }
    assert_true(wait_until([&] { return watch.expired(); }), "listener released once the task exits");
    assert_true(log.removed.load() == 1, "late callback delivered");
    assert_true(!log.called_after_destroy.load(), "no callback into a destroyed listener");
    assert_true(p.closed.load() == 1, "transport closed");
}

int main()
{
    spdlog::set_level(spdlog::level::err);
    test_start_browse_stop_closes();
    test_start_twice_is_rejected();
    test_stop_is_idempotent_and_safe_before_start();
    test_restart_after_stop();
    test_open_failure_ends_task_and_closes();
    test_exception_in_task_is_contained();
    test_unhealthy_transport_ends_task();
    test_stop_timeout_returns_false();
    test_detached_task_keeps_listener_alive();
    std::cout << "discovery runner tests: OK" << std::endl;
    return 0;
}

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "cr/discovery.hpp"
#include "cr/registry.hpp"

using namespace cr;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_str(const std::string &a, const std::string &b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b << " actual=" << a << std::endl;
        std::exit(1);
    }
}

static const std::string kType = "_http._tcp.local.";

// Answers resolve() from a table; unknown names time out.
class TableTransport final : public DiscoveryTransport {
public:
    std::map<std::string, ResolveResult> table;
    std::vector<std::string> resolved;
    int last_timeout_ms = -1;

    void add(const std::string &name, const std::string &server, Ipv4Bytes ip, std::uint16_t port)
    {
        ResolveResult rr{};
        rr.service.server = server;
        rr.service.addresses.push_back(ip);
        rr.service.port = port;
        table[name] = rr;
    }

    bool open(std::string &) override { return true; }
    void browse(const std::string &, ServiceListener &) override {}
    ResolveResult resolve(const std::string &, const std::string &name, int timeout_ms) override
    {
        resolved.push_back(name);
        last_timeout_ms = timeout_ms;
        auto it = table.find(name);
        if (it != table.end()) return it->second;
        ResolveResult rr{};
        rr.rc = -1;
        rr.kind = ResolveErrorKind::Timeout;
        rr.error = "timeout";
        return rr;
    }
    bool healthy() const override { return true; }
    void close() override {}
};

static void test_helpers()
{
    assert_eq_str(host_label("ESP32-Cam-Project.local."), "esp32-cam-project", "label lower-cased, domain cut");
    assert_eq_str(host_label("bare"), "bare", "label without dots");
    assert_eq_str(ipv4_str({192, 168, 4, 1}), "192.168.4.1", "dotted quad");
    assert_eq_str(event_kind_str(DiscoveryEventKind::Removed), "removed", "event kind name");
}

static void test_added_matching_host_sets_registry()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("cam._http._tcp.local.", "esp32-cam-project.local.", {192, 168, 1, 50}, 80);
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_added(tr, kType, "cam._http._tcp.local.");
    assert_eq_str(reg->snapshot().capture_url, "http://192.168.1.50:80/capture", "registry set from resolve");
    assert_true(tr.last_timeout_ms == 2000, "resolve timeout passed through");
}

static void test_target_match_is_case_insensitive()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("cam._http._tcp.local.", "ESP32-CAM-PROJECT.local.", {10, 0, 0, 5}, 8080);
    DiscoveryListener l(reg, "Esp32-Cam-Project", 2000);

    l.on_added(tr, kType, "cam._http._tcp.local.");
    assert_eq_str(reg->snapshot().capture_url, "http://10.0.0.5:8080/capture", "case-insensitive label match");
}

static void test_other_host_is_ignored()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("printer._http._tcp.local.", "office-printer.local.", {10, 0, 0, 9}, 631);
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_added(tr, kType, "printer._http._tcp.local.");
    assert_true(!reg->snapshot().known(), "non-target host leaves registry empty");
}

static void test_resolve_failure_is_swallowed()
{
    auto reg = std::make_shared<EndpointRegistry>();
    reg->set("10.0.0.5", 80);
    TableTransport tr;
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_added(tr, kType, "ghost._http._tcp.local.");
    ResolveResult bad{};
    bad.rc = -1;
    bad.kind = ResolveErrorKind::BadType;
    bad.error = "bad type";
    tr.table["weird._ipp._tcp.local."] = bad;
    l.on_updated(tr, kType, "weird._ipp._tcp.local.");
    assert_eq_str(reg->snapshot().capture_url, "http://10.0.0.5:80/capture", "failures do not touch registry");
}

static void test_incomplete_info_is_ignored()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("noport._http._tcp.local.", "esp32-cam-project.local.", {10, 0, 0, 5}, 0);
    ResolveResult noaddr{};
    noaddr.service.server = "esp32-cam-project.local.";
    noaddr.service.port = 80;
    tr.table["noaddr._http._tcp.local."] = noaddr;
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_added(tr, kType, "noport._http._tcp.local.");
    l.on_added(tr, kType, "noaddr._http._tcp.local.");
    assert_true(!reg->snapshot().known(), "port 0 / no address -> no update");
}

static void test_updated_reresolves_new_address()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("cam._http._tcp.local.", "esp32-cam-project.local.", {10, 0, 0, 5}, 80);
    DiscoveryListener l(reg, "esp32-cam-project", 2000);
    l.on_added(tr, kType, "cam._http._tcp.local.");

    tr.add("cam._http._tcp.local.", "esp32-cam-project.local.", {10, 0, 0, 6}, 80);
    l.on_updated(tr, kType, "cam._http._tcp.local.");
    assert_eq_str(reg->snapshot().capture_url, "http://10.0.0.6:80/capture", "update moves endpoint");
    assert_true(tr.resolved.size() == 2, "resolved once per event");
}

static void test_removed_matching_name_clears()
{
    auto reg = std::make_shared<EndpointRegistry>();
    reg->set("10.0.0.5", 80);
    TableTransport tr;
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_removed(tr, kType, "ESP32-Cam-Project Web._http._tcp.local.");
    assert_true(!reg->snapshot().known(), "removed with target label clears registry");
    assert_true(tr.resolved.empty(), "removal does not resolve");
}

static void test_removed_other_name_keeps()
{
    auto reg = std::make_shared<EndpointRegistry>();
    reg->set("10.0.0.5", 80);
    TableTransport tr;
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    l.on_removed(tr, kType, "printer._http._tcp.local.");
    assert_true(reg->snapshot().known(), "unrelated removal keeps registry");
}

static void test_dispatch_event_routes_by_kind()
{
    auto reg = std::make_shared<EndpointRegistry>();
    TableTransport tr;
    tr.add("cam._http._tcp.local.", "esp32-cam-project.local.", {10, 0, 0, 5}, 80);
    DiscoveryListener l(reg, "esp32-cam-project", 2000);

    dispatch_event(l, tr, DiscoveryEvent{DiscoveryEventKind::Added, kType, "cam._http._tcp.local."});
    assert_true(reg->snapshot().known(), "Added routed to on_added");
    dispatch_event(l, tr, DiscoveryEvent{DiscoveryEventKind::Removed, kType, "esp32-cam-project._http._tcp.local."});
    assert_true(!reg->snapshot().known(), "Removed routed to on_removed");
}

int main()
{
    spdlog::set_level(spdlog::level::err);
    test_helpers();
    test_added_matching_host_sets_registry();
    test_target_match_is_case_insensitive();
    test_other_host_is_ignored();
    test_resolve_failure_is_swallowed();
    test_incomplete_info_is_ignored();
    test_updated_reresolves_new_address();
    test_removed_matching_name_clears();
    test_removed_other_name_keeps();
    test_dispatch_event_routes_by_kind();
    std::cout << "discovery listener tests: OK" << std::endl;
    return 0;
}

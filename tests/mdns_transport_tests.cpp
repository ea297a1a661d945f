#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <ldns/ldns.h>
#include <spdlog/spdlog.h>

#include "cr/mdns.hpp"
#include "cr/registry.hpp"

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

static void assert_eq_int(long long a, long long b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b << " actual=" << a << std::endl;
        std::exit(1);
    }
}

static const std::string kType = "_http._tcp.local.";
static const std::string kCam = "esp32-cam-project._http._tcp.local.";
static const std::string kHost = "esp32-cam-project.local.";

// Loopback only: no multicast route is needed.
static MdnsOptions loopback_options()
{
    MdnsOptions o;
    o.multicast = false;
    o.recv_timeout_ms = 50;
    o.resolve_resend_ms = 100;
    return o;
}

static std::vector<std::uint8_t> response(const std::vector<std::string> &records)
{
    ldns_pkt *pkt = ldns_pkt_new();
    assert_true(pkt != nullptr, "ldns_pkt_new");
    ldns_pkt_set_qr(pkt, true);
    ldns_pkt_set_aa(pkt, true);
    for (const auto &text : records)
    {
        ldns_rr *rr = nullptr;
        assert_true(ldns_rr_new_frm_str(&rr, text.c_str(), 0, nullptr, nullptr) == LDNS_STATUS_OK && rr,
                    "record parses");
        assert_true(ldns_pkt_push_rr(pkt, LDNS_SECTION_ANSWER, rr), "record pushed");
    }
    uint8_t *wire = nullptr;
    size_t size = 0;
    assert_true(ldns_pkt2wire(&wire, pkt, &size) == LDNS_STATUS_OK, "encode");
    std::vector<std::uint8_t> out(wire, wire + size);
    LDNS_FREE(wire);
    ldns_pkt_free(pkt);
    return out;
}

static std::vector<std::uint8_t> announcement(int ttl = 120)
{
    const std::string t = std::to_string(ttl);
    return response({kType + " " + t + " IN PTR " + kCam,
                     kCam + " " + t + " IN SRV 0 0 8080 " + kHost,
                     kHost + " " + t + " IN A 127.0.0.1"});
}

// Plays the camera's responder: sends one datagram to the transport's port.
static void send_to(std::uint16_t port, const std::vector<std::uint8_t> &wire)
{
    const int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    assert_true(s >= 0, "sender socket");
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(port);
    dst.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    const ssize_t n = ::sendto(s, wire.data(), wire.size(), 0, reinterpret_cast<const sockaddr *>(&dst),
                               sizeof(dst));
    ::close(s);
    assert_true(n == static_cast<ssize_t>(wire.size()), "datagram sent");
}

static bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds limit = 3000ms)
{
    const auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until)
    {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

class NullListener final : public ServiceListener {
public:
    void on_added(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_updated(DiscoveryTransport &, const std::string &, const std::string &) override {}
    void on_removed(DiscoveryTransport &, const std::string &, const std::string &) override {}
};

static void test_resolve_rejects_foreign_names()
{
    MdnsTransport t(loopback_options());
    auto r = t.resolve(kType, "printer._ipp._tcp.local.", 100);
    assert_true(r.rc == -1 && r.kind == ResolveErrorKind::BadType, "other service type");
    r = t.resolve(kType, kType, 100);
    assert_true(r.kind == ResolveErrorKind::BadType, "bare type is not an instance");
    r = t.resolve(kType, "." + kType, 100);
    assert_true(r.kind == ResolveErrorKind::BadType, "empty instance label");
    r = t.resolve(kType, "cam_http._tcp.local.", 100);
    assert_true(r.kind == ResolveErrorKind::BadType, "type must follow a dot");
    assert_true(!r.error.empty(), "error text set");
}

static void test_resolve_without_browse_is_closed()
{
    MdnsTransport t(loopback_options());
    auto r = t.resolve(kType, kCam, 100);
    assert_true(r.rc == -1 && r.kind == ResolveErrorKind::Closed, "not open");

    std::string err;
    assert_true(t.open(err), "open");
    r = t.resolve(kType, kCam, 100);
    assert_true(r.kind == ResolveErrorKind::Closed, "open but not browsing");
}

static void test_close_is_idempotent()
{
    MdnsTransport t(loopback_options());
    t.close();
    t.close();
    assert_eq_int(t.local_port(), 0, "no port before open");

    std::string err;
    assert_true(t.open(err), "open");
    assert_true(t.unicast_fallback(), "multicast disabled -> ephemeral port");
    assert_true(t.local_port() != 0, "bound");
    NullListener l;
    t.browse(kType, l);
    t.close();
    t.close();
    assert_eq_int(t.local_port(), 0, "socket released");
    assert_true(t.resolve(kType, kCam, 100).kind == ResolveErrorKind::Closed, "closed after close");
    assert_true(t.healthy(), "a clean close is not a failure");
}

static void test_browse_before_open_is_ignored()
{
    MdnsTransport t(loopback_options());
    NullListener l;
    t.browse(kType, l);
    assert_true(t.resolve(kType, kCam, 100).kind == ResolveErrorKind::Closed, "browse ignored");

    std::string err;
    assert_true(t.open(err), "open");
    t.browse(kType, l);
    assert_true(t.resolve("_ipp._tcp.local.", "printer._ipp._tcp.local.", 100).kind == ResolveErrorKind::BadType,
                "only the browsed type resolves");
}

static void test_resolve_times_out()
{
    MdnsTransport t(loopback_options());
    std::string err;
    assert_true(t.open(err), "open");
    NullListener l;
    t.browse(kType, l);
    auto r = t.resolve(kType, kCam, 150);
    assert_true(r.rc == -1 && r.kind == ResolveErrorKind::Timeout, "nobody answers");
    assert_true(r.ms >= 100.0, "waited for the timeout");
}

static void test_resolve_wakes_on_answer()
{
    MdnsTransport t(loopback_options());
    std::string err;
    assert_true(t.open(err), "open");
    NullListener l;
    t.browse(kType, l);

    ResolveResult r{};
    std::thread waiter([&] { r = t.resolve(kType, kCam, 3000); });
    std::this_thread::sleep_for(50ms);
    send_to(t.local_port(), response({kCam + " 120 IN SRV 0 0 8080 " + kHost, kHost + " 120 IN A 127.0.0.1"}));
    waiter.join();

    assert_eq_int(r.rc, 0, "resolved");
    assert_true(r.ms < 2000.0, "woken by the answer, not the timeout");
    assert_true(r.service.server == kHost, "server");
    assert_eq_int(r.service.port, 8080, "port");
    assert_true(r.service.addresses.size() == 1 && ipv4_str(r.service.addresses[0]) == "127.0.0.1", "address");
}

static void test_close_unblocks_resolve()
{
    MdnsTransport t(loopback_options());
    std::string err;
    assert_true(t.open(err), "open");
    NullListener l;
    t.browse(kType, l);

    ResolveResult r{};
    std::thread waiter([&] { r = t.resolve(kType, kCam, 5000); });
    std::this_thread::sleep_for(50ms);
    const auto t0 = std::chrono::steady_clock::now();
    t.close();
    waiter.join();
    assert_true(r.kind == ResolveErrorKind::Closed, "resolve ends with the transport");
    assert_true(std::chrono::steady_clock::now() - t0 < 2000ms, "without waiting out its timeout");
}

static void test_announcement_reaches_registry()
{
    auto registry = std::make_shared<EndpointRegistry>();
    DiscoveryListener listener(registry, "esp32-cam-project", 1000);
    MdnsTransport t(loopback_options());
    std::string err;
    assert_true(t.open(err), "open");
    t.browse(kType, listener);

    send_to(t.local_port(), announcement());
    assert_true(wait_until([&] { return registry->snapshot().known(); }), "endpoint discovered");
    assert_true(registry->snapshot().capture_url == "http://127.0.0.1:8080/capture", "capture url");

    // goodbye packet
    send_to(t.local_port(), response({kType + " 0 IN PTR " + kCam}));
    assert_true(wait_until([&] { return !registry->snapshot().known(); }), "endpoint cleared on goodbye");

    // junk on the socket is dropped without hurting the transport
    send_to(t.local_port(), {0x00, 0x01, 0x84});
    std::this_thread::sleep_for(100ms);
    assert_true(t.healthy(), "still healthy");
    t.close();
}

int main()
{
    spdlog::set_level(spdlog::level::err);
    test_resolve_rejects_foreign_names();
    test_resolve_without_browse_is_closed();
    test_close_is_idempotent();
    test_browse_before_open_is_ignored();
    test_resolve_times_out();
    test_resolve_wakes_on_answer();
    test_close_unblocks_resolve();
    test_announcement_reaches_registry();
    std::cout << "mdns transport tests: OK" << std::endl;
    return 0;
}

#include "cr/mdns.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

// POSIX networking
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <ldns/ldns.h>
#include <spdlog/spdlog.h>

#include "cr/concurrency.hpp"

namespace cr
{
static std::string errno_str(int e)
{
    return std::string(std::strerror(e));
}

static void set_reuse(int s)
{
    int yes = 1;
    (void) setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    (void) setsockopt(s, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
}

static bool bind_port(int s, std::uint16_t port)
{
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_port = htons(port);
    a.sin_addr.s_addr = htonl(INADDR_ANY);
    return ::bind(s, reinterpret_cast<sockaddr *>(&a), sizeof(a)) == 0;
}

// Joins the mDNS group on s; errno is set on failure.
static bool join_group(int s, const in_addr &ifa)
{
    ip_mreq m{};
    m.imr_multiaddr.s_addr = inet_addr(kMdnsAddr4);
    m.imr_interface = ifa;
    return setsockopt(s, IPPROTO_IP, IP_ADD_MEMBERSHIP, &m, sizeof(m)) == 0;
}

MdnsTransport::MdnsTransport(MdnsOptions opt)
    : opt_(std::move(opt))
{}

MdnsTransport::~MdnsTransport()
{
    close();
}

bool MdnsTransport::open(std::string &error)
{
    std::lock_guard<std::mutex> sl(send_mtx_);
    if (sock_ >= 0) return true;

    in_addr ifa{};
    ifa.s_addr = htonl(INADDR_ANY);
    if (!opt_.interface_addr.empty() &&
        inet_pton(AF_INET, opt_.interface_addr.c_str(), &ifa) != 1)
    {
        error = "invalid interface address: " + opt_.interface_addr;
        return false;
    }

    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0)
    {
        error = "socket: " + errno_str(errno);
        return false;
    }
    set_reuse(s);
    unicast_fallback_ = false;
    std::string why;
    if (!opt_.multicast)
        why = "multicast disabled";
    else if (!bind_port(s, kMdnsPort))
        why = "bind UDP/5353: " + errno_str(errno);
    else if (!join_group(s, ifa))
        why = "IP_ADD_MEMBERSHIP: " + errno_str(errno);

    if (!why.empty())
    {
        // 5353 is owned exclusively by another responder, or there is no
        // multicast route: send from an ephemeral port and take legacy
        // unicast replies instead.
        if (opt_.multicast)
            spdlog::warn("mDNS: {}, using unicast-response fallback", why);
        ::close(s);
        s = ::socket(AF_INET, SOCK_DGRAM, 0);
        if (s < 0)
        {
            error = "socket: " + errno_str(errno);
            return false;
        }
        if (!bind_port(s, 0))
        {
            error = "bind: " + errno_str(errno);
            ::close(s);
            return false;
        }
        unicast_fallback_ = true;
    }

    if (!opt_.interface_addr.empty())
        (void) setsockopt(s, IPPROTO_IP, IP_MULTICAST_IF, &ifa, sizeof(ifa));
    unsigned char ttl = 255;
    (void) setsockopt(s, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    unsigned char loop = 1;
    (void) setsockopt(s, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    timeval tv{
        .tv_sec = opt_.recv_timeout_ms / 1000,
        .tv_usec = (opt_.recv_timeout_ms % 1000) * 1000
    };
    if (setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        error = "SO_RCVTIMEO: " + errno_str(errno);
        ::close(s);
        return false;
    }

    sock_ = s;
    stop_.store(false);
    failed_.store(false);
    dispatcher_ = std::make_unique<ThreadPool>(1, "mdns-dispatch");
    spdlog::info("mDNS: socket ready ({})",
                 unicast_fallback_ ? "ephemeral port, unicast replies" : "UDP/5353 multicast");
    return true;
}

void MdnsTransport::browse(const std::string &service_type, ServiceListener &listener)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (sock_ < 0 || rx_thread_.joinable())
        {
            spdlog::warn("mDNS: browse ignored (transport {})",
                         sock_ < 0 ? "not open" : "already browsing");
            return;
        }
        browse_type_ = canonical_name(service_type);
        cache_ = std::make_unique<MdnsRecordCache>(browse_type_);
        listener_ = &listener;
    }
    rx_thread_ = std::thread([this] { receive_loop(); });
}

void MdnsTransport::send_query(const std::string &name, int qtype)
{
    const auto wire = build_mdns_query(name, qtype);
    if (wire.empty())
    {
        spdlog::debug("mDNS: cannot encode query for {}", name);
        return;
    }
    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(kMdnsPort);
    dst.sin_addr.s_addr = inet_addr(kMdnsAddr4);

    std::lock_guard<std::mutex> sl(send_mtx_);
    if (sock_ < 0) return;
    if (::sendto(sock_, wire.data(), wire.size(), 0,
                 reinterpret_cast<const sockaddr *>(&dst), sizeof(dst)) < 0)
    {
        spdlog::debug("mDNS: sendto failed for {}: {}", name, errno_str(errno));
    }
}

void MdnsTransport::deliver(std::vector<DiscoveryEvent> events)
{
    ServiceListener *listener = nullptr;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        listener = listener_;
    }
    if (!listener || !dispatcher_) return;
    for (auto &ev: events)
    {
        spdlog::debug("mDNS: {} {}", event_kind_str(ev.kind), ev.service_name);
        dispatcher_->submit([this, listener, ev = std::move(ev)]
        {
            dispatch_event(*listener, *this, ev);
        });
    }
}

void MdnsTransport::receive_loop()
{
    using Clock = std::chrono::steady_clock;
    auto gap = std::chrono::milliseconds(opt_.first_query_ms);
    const auto max_gap = std::chrono::milliseconds(opt_.max_query_ms);
    auto next_query = Clock::now();
    std::vector<std::uint8_t> buf(9000);

    while (!stop_.load())
    {
        if (Clock::now() >= next_query)
        {
            send_query(browse_type_, LDNS_RR_TYPE_PTR);
            next_query = Clock::now() + gap;
            gap = std::min(gap * 2, max_gap);
        }

        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(sock_, buf.data(), buf.size(), 0,
                                     reinterpret_cast<sockaddr *>(&src), &slen);
        const int err = errno;

        std::vector<DiscoveryEvent> events;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            const auto now = Clock::now();
            if (n > 0)
            {
                events = cache_->ingest(buf.data(), static_cast<std::size_t>(n), now);
            }
            auto gone = cache_->expire(now);
            events.insert(events.end(), gone.begin(), gone.end());
        }
        if (n > 0) cache_cv_.notify_all();

        if (n < 0 && err != EAGAIN && err != EWOULDBLOCK && err != EINTR)
        {
            spdlog::error("mDNS: receive failed: {}", errno_str(err));
            failed_.store(true);
            cache_cv_.notify_all();
            break;
        }
        if (!events.empty()) deliver(std::move(events));
    }
}

ResolveResult MdnsTransport::resolve(const std::string &service_type,
                                     const std::string &service_name,
                                     int timeout_ms)
{
    using Clock = std::chrono::steady_clock;
    ResolveResult out{};
    const auto t0 = Clock::now();
    auto finish = [&](ResolveErrorKind kind, std::string error)
    {
        out.ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
        out.rc = kind == ResolveErrorKind::None ? 0 : -1;
        out.kind = kind;
        out.error = std::move(error);
        return out;
    };

    const std::string type = canonical_name(service_type);
    const std::string inst = canonical_name(service_name);
    if (inst.size() <= type.size() + 1 ||
        inst.compare(inst.size() - type.size(), type.size(), type) != 0 ||
        inst[inst.size() - type.size() - 1] != '.')
    {
        return finish(ResolveErrorKind::BadType,
                      "service name '" + service_name + "' is not of type '" + service_type + "'");
    }

    const auto deadline = t0 + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0);
    const auto resend = std::chrono::milliseconds(opt_.resolve_resend_ms);
    auto next_send = t0;

    std::unique_lock<std::mutex> lk(mtx_);
    if (!cache_ || stop_.load())
        return finish(ResolveErrorKind::Closed, "transport is not browsing");
    if (type != browse_type_)
        return finish(ResolveErrorKind::BadType, "not browsing '" + service_type + "'");

    for (;;)
    {
        // close() may have dropped the cache while we waited
        if (stop_.load() || !cache_) return finish(ResolveErrorKind::Closed, "transport closed");
        const auto now = Clock::now();
        if (auto svc = cache_->lookup(inst, now))
        {
            out.service = std::move(*svc);
            return finish(ResolveErrorKind::None, {});
        }
        if (failed_.load()) return finish(ResolveErrorKind::Transport, "transport failed");
        if (now >= deadline)
            return finish(ResolveErrorKind::Timeout,
                          "no SRV/A answer within " + std::to_string(timeout_ms) + " ms");
        if (now >= next_send)
        {
            const auto target = cache_->srv_target(inst, now);
            lk.unlock();
            send_query(inst, LDNS_RR_TYPE_SRV);
            if (target) send_query(*target, LDNS_RR_TYPE_A);
            lk.lock();
            next_send = now + resend;
        }
        cache_cv_.wait_until(lk, std::min(deadline, next_send));
    }
}

std::uint16_t MdnsTransport::local_port() const
{
    std::lock_guard<std::mutex> sl(send_mtx_);
    if (sock_ < 0) return 0;
    sockaddr_in a{};
    socklen_t len = sizeof(a);
    if (::getsockname(sock_, reinterpret_cast<sockaddr *>(&a), &len) != 0) return 0;
    return ntohs(a.sin_port);
}

bool MdnsTransport::healthy() const
{
    return !failed_.load();
}

void MdnsTransport::close()
{
    stop_.store(true);
    cache_cv_.notify_all();
    if (rx_thread_.joinable()) rx_thread_.join();
    if (dispatcher_)
    {
        // pending callbacks run now and see a stopped transport
        dispatcher_->shutdown();
        dispatcher_.reset();
    }
    {
        std::lock_guard<std::mutex> sl(send_mtx_);
        if (sock_ >= 0)
        {
            ::close(sock_);
            sock_ = -1;
            spdlog::info("mDNS: socket closed");
        }
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (cache_) cache_->clear();
    cache_.reset();
    listener_ = nullptr;
}
} // namespace cr

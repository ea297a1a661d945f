#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cr/discovery.hpp"

namespace cr {

inline constexpr std::uint16_t kMdnsPort = 5353;
inline constexpr const char*   kMdnsAddr4 = "224.0.0.251";

// Lower-case and make sure the name ends with a dot.
std::string canonical_name(const std::string& name);

// Builds a one-question mDNS query (id 0, no RD). qtype is an ldns_rr_type value.
// Returns an empty buffer on encode failure.
std::vector<std::uint8_t> build_mdns_query(const std::string& name, int qtype);

// Record store fed with raw mDNS packets. Not thread-safe.
class MdnsRecordCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit MdnsRecordCache(std::string browse_type);

    // Decodes one packet and returns the events it implies for the browsed type.
    // Packets that do not decode, or are queries, are dropped.
    std::vector<DiscoveryEvent> ingest(const std::uint8_t* data, std::size_t len, Clock::time_point now);

    // Drops records whose TTL elapsed; instances that expire yield Removed.
    std::vector<DiscoveryEvent> expire(Clock::time_point now);

    // Complete SRV + A data for instance, if cached. Addresses come most
    // recently announced first.
    std::optional<ResolvedService> lookup(const std::string& instance, Clock::time_point now) const;

    // SRV target of instance, if cached.
    std::optional<std::string> srv_target(const std::string& instance, Clock::time_point now) const;

    bool has_instance(const std::string& instance) const;
    std::size_t malformed_packets() const { return malformed_; }
    const std::string& browse_type() const { return browse_type_; }

    void clear();

private:
    struct Srv {
        std::string       target;
        std::uint16_t     port{};
        Clock::time_point expires;
    };
    struct Addr {
        Ipv4Bytes         ip{};
        Clock::time_point expires;
        Clock::time_point received;
    };

    static constexpr std::chrono::seconds kCacheFlushGrace{1};

    void on_ptr(const std::string& owner, const std::string& instance, std::uint32_t ttl,
                Clock::time_point now, std::vector<DiscoveryEvent>& out);
    void on_srv(const std::string& owner, const std::string& target, std::uint16_t port, std::uint32_t ttl,
                Clock::time_point now, std::vector<DiscoveryEvent>& out);
    void on_a(const std::string& owner, const Ipv4Bytes& ip, std::uint32_t ttl, bool flush,
              Clock::time_point now, std::vector<DiscoveryEvent>& out);

    DiscoveryEvent make_event(DiscoveryEventKind kind, const std::string& instance) const;

    std::string                                    browse_type_;
    std::map<std::string, Clock::time_point>       instances_; // instance -> PTR expiry
    std::map<std::string, Srv>                     srv_;
    std::map<std::string, std::vector<Addr>>       addrs_;     // host -> A records
    std::size_t                                    malformed_{};
};

class ThreadPool;

struct MdnsOptions {
    std::string interface_addr;          // empty = INADDR_ANY
    int         recv_timeout_ms = 250;   // receive loop wake-up
    int         first_query_ms  = 1000;  // browse re-query starts here and doubles
    int         max_query_ms    = 60000;
    int         resolve_resend_ms = 250;
    bool        multicast = true;        // false: ephemeral port, unicast replies only
};

// mDNS/DNS-SD binding over an IPv4 UDP socket. Packets are decoded with ldns.
class MdnsTransport final : public DiscoveryTransport {
public:
    explicit MdnsTransport(MdnsOptions opt = {});
    ~MdnsTransport() override;

    MdnsTransport(const MdnsTransport&) = delete;
    MdnsTransport& operator=(const MdnsTransport&) = delete;

    bool open(std::string& error) override;
    void browse(const std::string& service_type, ServiceListener& listener) override;
    ResolveResult resolve(const std::string& service_type,
                          const std::string& service_name,
                          int timeout_ms) override;
    bool healthy() const override;
    void close() override;

    bool unicast_fallback() const { return unicast_fallback_; }
    // Bound UDP port, 0 when not open.
    std::uint16_t local_port() const;

private:
    void receive_loop();
    void send_query(const std::string& name, int qtype);
    void deliver(std::vector<DiscoveryEvent> events);

    MdnsOptions                      opt_;
    int                              sock_{-1};
    bool                             unicast_fallback_{};
    std::atomic<bool>                stop_{false};
    std::atomic<bool>                failed_{false};
    std::thread                      rx_thread_;
    std::unique_ptr<ThreadPool>      dispatcher_;

    mutable std::mutex               mtx_;      // guards cache_, listener_, browse_type_
    std::condition_variable          cache_cv_; // signalled on every ingested packet
    std::unique_ptr<MdnsRecordCache> cache_;
    ServiceListener*                 listener_{};
    std::string                      browse_type_;
    mutable std::mutex               send_mtx_;
};

} // namespace cr

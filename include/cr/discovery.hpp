#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cr {

class EndpointRegistry;

enum class DiscoveryEventKind { Added, Updated, Removed };

struct DiscoveryEvent {
    DiscoveryEventKind kind{DiscoveryEventKind::Added};
    std::string        service_type;
    std::string        service_name;
};

const char* event_kind_str(DiscoveryEventKind kind);

using Ipv4Bytes = std::array<std::uint8_t, 4>;

struct ResolvedService {
    std::string            server;    // host field, e.g. "esp32-cam-project.local."
    std::vector<Ipv4Bytes> addresses; // newest announcement first
    std::uint16_t          port{};
};

enum class ResolveErrorKind {
    None = 0,
    BadType,   // service name does not belong to the service type
    Timeout,
    Closed,    // transport not open
    Transport, // socket / encode failure
};

struct ResolveResult {
    double           ms{};
    int              rc{};    // 0 on success, -1 on error
    std::string      error;   // valid if rc != 0
    ResolveErrorKind kind{ResolveErrorKind::None};
    ResolvedService  service; // valid if rc == 0
};

// Text before the first '.', lower-cased.
std::string host_label(const std::string& server);

std::string ipv4_str(const Ipv4Bytes& ip);

class DiscoveryTransport;

// Receiver of discovery events. Callbacks run on the transport's dispatch
// thread and may call back into transport.resolve().
class ServiceListener {
public:
    virtual ~ServiceListener() = default;
    virtual void on_added(DiscoveryTransport& transport, const std::string& type, const std::string& name) = 0;
    virtual void on_updated(DiscoveryTransport& transport, const std::string& type, const std::string& name) = 0;
    virtual void on_removed(DiscoveryTransport& transport, const std::string& type, const std::string& name) = 0;
};

void dispatch_event(ServiceListener& listener, DiscoveryTransport& transport, const DiscoveryEvent& ev);

class DiscoveryTransport {
public:
    virtual ~DiscoveryTransport() = default;

    // Returns false and fills error when the transport cannot be opened.
    virtual bool open(std::string& error) = 0;

    // Start delivering events for service_type to listener. The listener must
    // stay alive until close() returns.
    virtual void browse(const std::string& service_type, ServiceListener& listener) = 0;

    virtual ResolveResult resolve(const std::string& service_type,
                                  const std::string& service_name,
                                  int timeout_ms) = 0;

    // false once the transport hit an unrecoverable error
    virtual bool healthy() const = 0;

    // Idempotent. After return no further callbacks are delivered.
    virtual void close() = 0;
};

// Translates discovery events into registry updates for one target hostname.
class DiscoveryListener final : public ServiceListener {
public:
    DiscoveryListener(std::shared_ptr<EndpointRegistry> registry, std::string target_hostname, int resolve_timeout_ms);

    void on_added(DiscoveryTransport& transport, const std::string& type, const std::string& name) override;
    void on_updated(DiscoveryTransport& transport, const std::string& type, const std::string& name) override;
    void on_removed(DiscoveryTransport& transport, const std::string& type, const std::string& name) override;

    const std::string& target() const { return target_; }

private:
    void resolve_and_update(DiscoveryTransport& transport, const std::string& type, const std::string& name);

    std::shared_ptr<EndpointRegistry> registry_;
    std::string       target_; // lower-cased
    int               resolve_timeout_ms_;
};

} // namespace cr

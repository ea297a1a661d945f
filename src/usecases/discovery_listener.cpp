#include "cr/discovery.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "cr/registry.hpp"

namespace cr
{
static std::string to_lower(std::string s)
{
    std::ranges::transform(
        s,
        s.begin(),
        [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
    return s;
}

const char *event_kind_str(DiscoveryEventKind kind)
{
    switch (kind)
    {
        case DiscoveryEventKind::Added: return "added";
        case DiscoveryEventKind::Updated: return "updated";
        case DiscoveryEventKind::Removed: return "removed";
    }
    return "unknown";
}

std::string host_label(const std::string &server)
{
    return to_lower(server.substr(0, server.find('.')));
}

std::string ipv4_str(const Ipv4Bytes &ip)
{
    return std::to_string(ip[0]) + '.' + std::to_string(ip[1]) + '.' +
           std::to_string(ip[2]) + '.' + std::to_string(ip[3]);
}

void dispatch_event(ServiceListener &listener,
                    DiscoveryTransport &transport,
                    const DiscoveryEvent &ev)
{
    switch (ev.kind)
    {
        case DiscoveryEventKind::Added:
            listener.on_added(transport, ev.service_type, ev.service_name);
            break;
        case DiscoveryEventKind::Updated:
            listener.on_updated(transport, ev.service_type, ev.service_name);
            break;
        case DiscoveryEventKind::Removed:
            listener.on_removed(transport, ev.service_type, ev.service_name);
            break;
    }
}

DiscoveryListener::DiscoveryListener(std::shared_ptr<EndpointRegistry> registry,
                                     std::string target_hostname,
                                     int resolve_timeout_ms)
    : registry_(std::move(registry)),
      target_(to_lower(std::move(target_hostname))),
      resolve_timeout_ms_(resolve_timeout_ms)
{
    spdlog::info("mDNS: listener initialized for hostname '{}'", target_);
}

void DiscoveryListener::on_added(DiscoveryTransport &transport,
                                 const std::string &type,
                                 const std::string &name)
{
    resolve_and_update(transport, type, name);
}

void DiscoveryListener::on_updated(DiscoveryTransport &transport,
                                   const std::string &type,
                                   const std::string &name)
{
    spdlog::debug("mDNS: service {} updated, re-resolving", name);
    resolve_and_update(transport, type, name);
}

void DiscoveryListener::on_removed(DiscoveryTransport &,
                                   const std::string &,
                                   const std::string &name)
{
    spdlog::info("mDNS: service {} removed", name);
    // The removed instance is not compared against the cached endpoint: any
    // service carrying the target label invalidates it.
    if (to_lower(name).find(target_) == std::string::npos) return;
    spdlog::warn("mDNS: service matching target '{}' removed", name);
    registry_->clear();
}

void DiscoveryListener::resolve_and_update(DiscoveryTransport &transport,
                                           const std::string &type,
                                           const std::string &name)
{
    ResolveResult rr = transport.resolve(type, name, resolve_timeout_ms_);
    if (rr.rc != 0)
    {
        if (rr.kind == ResolveErrorKind::BadType)
            spdlog::debug("mDNS: ignoring service with bad type: {}", name);
        else
            spdlog::warn("mDNS: could not get info for service {}: {}", name, rr.error);
        return;
    }

    const ResolvedService &svc = rr.service;
    if (svc.server.empty() || svc.addresses.empty() || svc.port == 0)
    {
        spdlog::debug("mDNS: incomplete info for service {}", name);
        return;
    }
    if (host_label(svc.server) != target_) return;

    const std::string ip = ipv4_str(svc.addresses.front());
    spdlog::info("mDNS: discovered target '{}' (server: {}) at {}:{}",
                 name, svc.server, ip, svc.port);
    registry_->set(ip, svc.port, name);
}
} // namespace cr

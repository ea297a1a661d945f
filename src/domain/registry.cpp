#include "cr/registry.hpp"

#include <spdlog/spdlog.h>

namespace cr {

std::string build_capture_url(const std::string& address, std::uint16_t port)
{
    return "http://" + address + ":" + std::to_string(port) + "/capture";
}

Endpoint EndpointRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return ep_;
}

void EndpointRegistry::set(const std::string& address, std::uint16_t port, const std::string& source)
{
    std::string url = build_capture_url(address, port);
    const auto  now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lk(mtx_);
    if (ep_.capture_url != url)
    {
        if (source.empty())
            spdlog::info("Endpoint: capture URL is now {}", url);
        else
            spdlog::info("Endpoint: capture URL is now {} (service '{}')", url, source);
    }
    ep_.address     = address;
    ep_.port        = port;
    ep_.capture_url = std::move(url);
    // steady_clock never goes backwards, but a racing writer may have stamped later
    if (!ep_.last_seen || *ep_.last_seen < now) ep_.last_seen = now;
}

void EndpointRegistry::clear()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (ep_.known())
    {
        spdlog::warn("Endpoint: forgetting {}", ep_.capture_url);
    }
    ep_ = Endpoint{};
}

} // namespace cr

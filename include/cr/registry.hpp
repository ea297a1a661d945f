#pragma once

#include <cstdint>
#include <mutex>
#include <string>

#include "cr/model.hpp"

namespace cr {

// "http://<address>:<port>/capture"
std::string build_capture_url(const std::string& address, std::uint16_t port);

// Holder of the single currently-known device endpoint. All fields are
// guarded by one mutex; readers only ever receive snapshot copies.
class EndpointRegistry {
public:
    Endpoint snapshot() const;

    // source is only used for the change log line (typically the service name)
    void set(const std::string& address, std::uint16_t port, const std::string& source = {});
    void clear();

private:
    mutable std::mutex mtx_;
    Endpoint           ep_;
};

} // namespace cr

#pragma once

#include <string>

#include "cr/model.hpp"

namespace cr
{
inline constexpr int kDefaultFetchTimeoutMs = 20000;

// One bounded-timeout HTTP GET per call, classified into CaptureOutcome.
// Thread-safe: every call uses its own curl handle.
class CurlFetcher
{
public:
    explicit CurlFetcher(int timeout_ms = kDefaultFetchTimeoutMs);

    CaptureOutcome fetch(const std::string &capture_url) const;

    int timeout_ms() const { return timeout_ms_; }

private:
    int timeout_ms_;
};
} // namespace cr

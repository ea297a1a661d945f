#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cr {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime   = std::chrono::system_clock::time_point;

// Currently known capture device. Either address/port/capture_url are all set
// (and capture_url is derived from the other two) or all are empty.
struct Endpoint {
    std::string                  address;
    std::optional<std::uint16_t> port;
    std::string                  capture_url;
    std::optional<SteadyTime>    last_seen;

    bool known() const { return !capture_url.empty(); }
};

enum class CaptureErrorKind {
    None = 0,
    NotDiscovered,
    Timeout,
    ConnectionFailed,
    RemoteHttpError,
    EmptyBody,
    UnexpectedContentType,
    PersistenceFailure,
    InternalError,
};

const char* error_kind_str(CaptureErrorKind kind);

// Result of one fetch attempt. kind == None <=> bytes non-empty.
struct CaptureOutcome {
    std::vector<std::uint8_t> bytes;
    std::string               content_type; // lower-cased, "" when absent
    CaptureErrorKind          kind{CaptureErrorKind::None};
    std::string               message;      // valid if kind != None
    int                       http_status{};
    double                    duration_ms{};

    bool ok() const { return kind == CaptureErrorKind::None; }
};

// One row for the capture log. capture_id == 0 means nothing was captured.
struct CaptureRecord {
    std::uint64_t    capture_id{};
    WallTime         timestamp{};
    std::string      filename;
    std::size_t      size_bytes{};
    double           duration_ms{};
    std::string      endpoint_url;
    CaptureErrorKind kind{CaptureErrorKind::None};
    int              http_status{};
};

inline constexpr const char* kNoFileSentinel = "none";

struct TriggerResult {
    int              http_status{};
    CaptureErrorKind kind{CaptureErrorKind::None};
    std::string      message;
    std::string      filename;   // empty when nothing was captured
    bool             saved{};    // bytes reached the image store
    std::optional<CaptureRecord> record; // absent for the not-discovered short-circuit

    bool ok() const { return kind == CaptureErrorKind::None; }
};

struct ServiceStatus {
    bool        discovered{};
    std::string url;             // empty when not discovered
    std::string target_hostname; // "<label>.local"
};

} // namespace cr

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "cr/model.hpp"
#include "cr/storage.hpp"

namespace cr {

class EndpointRegistry;

using FetchFn    = std::function<CaptureOutcome(const std::string& /*capture_url*/)>;
using PersistFn  = std::function<StoreResult(const std::vector<std::uint8_t>& /*bytes*/,
                                             const std::string& /*filename*/)>;
using RecordSink = std::function<void(const CaptureRecord&)>;

// image_<ts>_<id>.jpg, or image_<ts>_<id>_unknown_type.bin when jpeg is false
std::string make_capture_filename(const std::string& timestamp, std::uint64_t id, bool jpeg);

// Per-trigger control flow: registry snapshot -> fetch -> classify -> persist -> record.
class CaptureOrchestrator {
public:
    CaptureOrchestrator(EndpointRegistry& registry, FetchFn fetch, PersistFn persist, RecordSink sink);

    TriggerResult trigger();

    // Number of capture ids handed out so far.
    std::uint64_t captures_issued() const;

private:
    std::uint64_t next_capture_id();
    void emit(const CaptureRecord& rec) const;

    EndpointRegistry&  registry_;
    FetchFn            fetch_;
    PersistFn          persist_;
    RecordSink         sink_;

    mutable std::mutex counter_mtx_;
    std::uint64_t      counter_{};
};

} // namespace cr

#include "cr/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include "cr/registry.hpp"
#include "cr/timefmt.hpp"

namespace cr {

std::string make_capture_filename(const std::string& timestamp, std::uint64_t id, bool jpeg)
{
    std::string name = "image_" + timestamp + "_" + std::to_string(id);
    return name + (jpeg ? ".jpg" : "_unknown_type.bin");
}

CaptureOrchestrator::CaptureOrchestrator(EndpointRegistry& registry,
                                         FetchFn fetch,
                                         PersistFn persist,
                                         RecordSink sink)
    : registry_(registry),
      fetch_(std::move(fetch)),
      persist_(std::move(persist)),
      sink_(std::move(sink))
{}

std::uint64_t CaptureOrchestrator::next_capture_id()
{
    std::lock_guard<std::mutex> lk(counter_mtx_);
    return ++counter_;
}

std::uint64_t CaptureOrchestrator::captures_issued() const
{
    std::lock_guard<std::mutex> lk(counter_mtx_);
    return counter_;
}

void CaptureOrchestrator::emit(const CaptureRecord& rec) const
{
    if (sink_) sink_(rec);
}

TriggerResult CaptureOrchestrator::trigger()
{
    TriggerResult res{};
    const Endpoint ep = registry_.snapshot();
    spdlog::info("Trigger request. Current capture URL: {}", ep.known() ? ep.capture_url : "<unknown>");

    // 1. nothing to talk to: no fetch, no record, no id
    if (!ep.known())
    {
        spdlog::error("Capture URL not known (mDNS discovery pending or failed)");
        res.http_status = 503;
        res.kind = CaptureErrorKind::NotDiscovered;
        res.message = "Camera service not discovered. Please wait or check the device.";
        return res;
    }

    // 2. one attempt
    CaptureOutcome out = fetch_ ? fetch_(ep.capture_url) : CaptureOutcome{};
    if (!fetch_)
    {
        out.kind = CaptureErrorKind::InternalError;
        out.http_status = 500;
        out.message = "no fetcher configured";
    }
    else if (out.ok() && out.bytes.empty())
    {
        out.kind = CaptureErrorKind::EmptyBody;
        out.message = "Camera returned empty image data";
    }

    if (!out.ok())
    {
        // 3. a dead connection likely means the device moved; force rediscovery
        if (out.kind == CaptureErrorKind::ConnectionFailed)
        {
            spdlog::warn("Connection error to camera. Clearing cached URL to trigger mDNS re-check.");
            registry_.clear();
        }

        // 4. attempted but not captured
        CaptureRecord rec{};
        rec.capture_id   = 0;
        rec.timestamp    = std::chrono::system_clock::now();
        rec.filename     = kNoFileSentinel;
        rec.size_bytes   = 0;
        rec.duration_ms  = out.duration_ms;
        rec.endpoint_url = ep.capture_url;
        rec.kind         = out.kind;
        rec.http_status  = out.http_status;
        emit(rec);

        res.http_status = out.http_status;
        res.kind = out.kind;
        res.message = out.message;
        res.record = rec;
        return res;
    }

    // 5. captured: allocate an id, name the file, persist
    const std::uint64_t id = next_capture_id();
    const WallTime      now = std::chrono::system_clock::now();
    const bool          jpeg = out.content_type.find("image/jpeg") != std::string::npos;
    const std::string   filename = make_capture_filename(format_file_timestamp(now), id, jpeg);

    if (!jpeg)
    {
        spdlog::warn("Unexpected Content-Type from camera: '{}'. Expected 'image/jpeg'.", out.content_type);
    }

    StoreResult stored{};
    if (persist_)
    {
        stored = persist_(out.bytes, filename);
    }
    else
    {
        stored.error = "no image store configured";
    }

    CaptureRecord rec{};
    rec.capture_id   = id;
    rec.timestamp    = now;
    rec.filename     = filename;
    rec.size_bytes   = out.bytes.size();
    rec.duration_ms  = out.duration_ms;
    rec.endpoint_url = ep.capture_url;

    res.filename = filename;
    res.saved = stored.ok;
    if (!stored.ok)
    {
        spdlog::error("Error saving {}: {}", filename, stored.error);
        res.http_status = 500;
        res.kind = CaptureErrorKind::PersistenceFailure;
        res.message = jpeg ? "Failed to save image: " + stored.error
                           : "Failed to save raw image data: " + stored.error;
    }
    else if (jpeg)
    {
        spdlog::info("JPEG image saved as {}", stored.path);
        res.http_status = 200;
        res.kind = CaptureErrorKind::None;
        res.message = "JPEG captured and saved.";
    }
    else
    {
        spdlog::info("Raw data (unexpected type) saved as {}", stored.path);
        res.http_status = 415;
        res.kind = CaptureErrorKind::UnexpectedContentType;
        res.message = "Unexpected content type '" + out.content_type + "' from camera. Raw data saved as .bin.";
    }

    rec.kind = res.kind;
    rec.http_status = res.http_status;
    emit(rec);
    res.record = rec;
    return res;
}

} // namespace cr

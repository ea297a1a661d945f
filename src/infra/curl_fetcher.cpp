#include "cr/fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace cr
{
namespace
{
size_t write_cb(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *out = static_cast<std::vector<std::uint8_t> *>(userdata);
    const auto *p = reinterpret_cast<const std::uint8_t *>(ptr);
    out->insert(out->end(), p, p + size * nmemb);
    return size * nmemb;
}

void curl_global_once()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

double elapsed_ms(std::chrono::steady_clock::time_point t0)
{
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
}

bool is_connection_error(CURLcode rc)
{
    switch (rc)
    {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
    }
}

struct CurlHandle
{
    CURL *h = curl_easy_init();
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};
} // namespace

CurlFetcher::CurlFetcher(int timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : kDefaultFetchTimeoutMs)
{
    curl_global_once();
}

CaptureOutcome CurlFetcher::fetch(const std::string &capture_url) const
{
    CaptureOutcome out{};
    if (capture_url.empty())
    {
        out.kind = CaptureErrorKind::NotDiscovered;
        out.message = "Camera capture URL is not known.";
        out.http_status = 503;
        out.duration_ms = 0.0;
        return out;
    }

    const auto t0 = std::chrono::steady_clock::now();
    CurlHandle curl;
    if (!curl.h)
    {
        out.kind = CaptureErrorKind::InternalError;
        out.message = "An internal error occurred: curl_easy_init failed";
        out.http_status = 500;
        out.duration_ms = elapsed_ms(t0);
        return out;
    }

    std::vector<std::uint8_t> body;
    char errbuf[CURL_ERROR_SIZE]{};
    curl_easy_setopt(curl.h, CURLOPT_URL, capture_url.c_str());
    curl_easy_setopt(curl.h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.h, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.h, CURLOPT_NOSIGNAL, 1L);
    // the camera is on the local segment: never route through an environment proxy
    curl_easy_setopt(curl.h, CURLOPT_PROXY, "");
    curl_easy_setopt(curl.h, CURLOPT_ERRORBUFFER, errbuf);

    spdlog::info("Requesting image from camera: {}", capture_url);
    const CURLcode rc = curl_easy_perform(curl.h);
    out.duration_ms = elapsed_ms(t0);
    const std::string detail = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));

    if (rc == CURLE_OPERATION_TIMEDOUT)
    {
        spdlog::error("Timeout connecting to camera at {}", capture_url);
        out.kind = CaptureErrorKind::Timeout;
        out.message = "Timeout: camera did not respond.";
        out.http_status = 504;
        return out;
    }
    if (is_connection_error(rc))
    {
        spdlog::error("Connection error to camera at {}: {}", capture_url, detail);
        out.kind = CaptureErrorKind::ConnectionFailed;
        out.message = "Connection Error: could not connect to camera.";
        out.http_status = 502;
        return out;
    }
    if (rc != CURLE_OK)
    {
        spdlog::error("Unexpected error fetching image: {}", detail);
        out.kind = CaptureErrorKind::InternalError;
        out.message = "An internal error occurred: " + detail;
        out.http_status = 500;
        return out;
    }

    long code = 0;
    curl_easy_getinfo(curl.h, CURLINFO_RESPONSE_CODE, &code);
    out.http_status = static_cast<int>(code);

    if (code >= 400)
    {
        std::string text(body.begin(), body.end());
        spdlog::error("HTTP error from camera: {} - {}", code, text);
        out.kind = CaptureErrorKind::RemoteHttpError;
        out.message = "Camera Error: " + std::to_string(code) + " - " + text;
        return out;
    }

    char *ct = nullptr;
    if (curl_easy_getinfo(curl.h, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct)
    {
        out.content_type = ct;
        std::ranges::transform(
            out.content_type,
            out.content_type.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    if (body.empty())
    {
        spdlog::error("Camera returned empty image data.");
        out.kind = CaptureErrorKind::EmptyBody;
        out.message = "Camera returned empty image data";
        return out;
    }

    spdlog::info("Received {} bytes from camera (Content-Type: {}) in {:.2f} ms.",
                 body.size(), out.content_type, out.duration_ms);
    out.bytes = std::move(body);
    out.kind = CaptureErrorKind::None;
    return out;
}
} // namespace cr

#include "cr/storage.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "cr/timefmt.hpp"

namespace fs = std::filesystem;

namespace cr {

// Quotes a field when it carries a separator, quote or line break.
static std::string csv_field(const std::string& v)
{
    if (v.find_first_of(",\"\r\n") == std::string::npos) return v;
    std::string out = "\"";
    for (char c : v)
    {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string csv_header()
{
    return "rpi_iso_timestamp,rpi_image_id,saved_filename,image_size_bytes,"
           "fetch_duration_ms,esp32_url_used,outcome,http_status";
}

std::string format_csv_row(const CaptureRecord& rec)
{
    std::ostringstream os;
    os << format_iso_timestamp(rec.timestamp) << ','
       << rec.capture_id << ','
       << csv_field(rec.filename) << ','
       << rec.size_bytes << ','
       << std::fixed << std::setprecision(3) << rec.duration_ms << ','
       << csv_field(rec.endpoint_url) << ','
       << error_kind_str(rec.kind) << ','
       << rec.http_status;
    return os.str();
}

CaptureLog::CaptureLog(fs::path path)
    : path_(std::move(path))
{}

bool CaptureLog::open(std::string& error)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (path_.empty())
    {
        error = "log path cannot be empty";
        return false;
    }

    std::error_code ec;
    if (const fs::path parent = path_.parent_path(); !parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
        {
            error = "failed to create log directory '" + parent.string() + "': " + ec.message();
            return false;
        }
    }

    const bool exists = fs::exists(path_, ec);
    const bool empty = !exists || fs::file_size(path_, ec) == 0;
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out)
    {
        error = "failed to open log file '" + path_.string() + "'";
        return false;
    }
    if (empty)
    {
        out << csv_header() << '\n';
        if (!out)
        {
            error = "failed to write header to '" + path_.string() + "'";
            return false;
        }
        spdlog::info("CSV log header written to {}", path_.string());
    }
    opened_ = true;
    spdlog::info("Image capture log will be saved to: {}", path_.string());
    return true;
}

void CaptureLog::append(const CaptureRecord& rec)
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (!opened_)
    {
        spdlog::error("Capture log not opened; dropping record for image id {}", rec.capture_id);
        return;
    }
    std::ofstream out(path_, std::ios::binary | std::ios::app);
    if (!out)
    {
        spdlog::error("Error opening log file {}", path_.string());
        return;
    }
    out << format_csv_row(rec) << '\n';
    out.flush();
    if (!out)
    {
        spdlog::error("Error writing to log file {}", path_.string());
        return;
    }
    spdlog::debug("Logged event to CSV for image id {}", rec.capture_id);
}

} // namespace cr

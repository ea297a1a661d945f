#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "cr/model.hpp"

namespace cr {

struct StoreResult {
    bool        ok{};
    std::string path;  // valid if ok
    std::string error; // valid if !ok
};

// Writes captured bytes below a root directory.
class ImageStore {
public:
    explicit ImageStore(std::filesystem::path root);

    // Creates the root directory. Returns false and fills error on failure.
    bool prepare(std::string& error) const;

    StoreResult write(const std::vector<std::uint8_t>& bytes, const std::string& filename) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline constexpr const char* kCaptureLogFileName = "image_capture_log.csv";

// Append-only CSV log of capture records.
class CaptureLog {
public:
    explicit CaptureLog(std::filesystem::path path);

    // Creates the file and writes the header when it is missing or empty.
    bool open(std::string& error);

    // Failures are logged, never thrown.
    void append(const CaptureRecord& rec);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex            mtx_;
    bool                  opened_{};
};

std::string format_csv_row(const CaptureRecord& rec);
std::string csv_header();

} // namespace cr

#pragma once

#include <string>

#include "cr/model.hpp"

namespace cr {

// Local time as YYYYMMDD_HHMMSS_ffffff (used in capture filenames)
std::string format_file_timestamp(WallTime t);

// Local time as ISO-8601 with microseconds, e.g. 2024-05-01T10:20:30.123456
std::string format_iso_timestamp(WallTime t);

} // namespace cr

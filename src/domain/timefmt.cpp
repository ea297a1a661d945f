#include "cr/timefmt.hpp"

#include <cstdio>
#include <ctime>

namespace cr {

static bool split_local(WallTime t, std::tm& tm, long& micros)
{
    using namespace std::chrono;
    const auto since = t.time_since_epoch();
    auto secs = duration_cast<seconds>(since);
    auto us   = duration_cast<microseconds>(since - secs).count();
    if (us < 0)
    {
        // pre-epoch times round toward the earlier second
        secs -= seconds{1};
        us += 1000000;
    }
    std::time_t tt = static_cast<std::time_t>(secs.count());
    if (!localtime_r(&tt, &tm)) return false;
    micros = static_cast<long>(us);
    return true;
}

std::string format_file_timestamp(WallTime t)
{
    std::tm tm{};
    long    us = 0;
    if (!split_local(t, tm, us)) return "00000000_000000_000000";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d_%02d%02d%02d_%06ld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, us);
    return buf;
}

std::string format_iso_timestamp(WallTime t)
{
    std::tm tm{};
    long    us = 0;
    if (!split_local(t, tm, us)) return "N/A";
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ld",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, us);
    return buf;
}

} // namespace cr

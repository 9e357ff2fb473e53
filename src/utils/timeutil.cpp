#include "rg/timeutil.hpp"

#include <cstdio>
#include <ctime>

namespace rg
{
namespace
{
struct Split
{
    std::tm tm{};
    long usec{};
};

Split split(const TimePoint tp)
{
    using namespace std::chrono;
    const auto us = duration_cast<microseconds>(tp.time_since_epoch()).count();
    long long secs = us / 1000000;
    long rem = static_cast<long>(us % 1000000);
    if (rem < 0)
    {
        rem += 1000000;
        --secs;
    }
    Split out{};
    const auto t = static_cast<std::time_t>(secs);
    gmtime_r(&t, &out.tm);
    out.usec = rem;
    return out;
}

std::optional<TimePoint> join(std::tm tm, const long usec)
{
    if (usec < 0 || usec > 999999) return std::nullopt;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    const std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return TimePoint{} + std::chrono::seconds(secs) + std::chrono::microseconds(usec);
}
} // namespace

std::string format_iso8601(const TimePoint tp)
{
    const auto [tm, usec] = split(tp);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, usec);
    return buf;
}

std::optional<TimePoint> parse_iso8601(const std::string &s)
{
    std::tm tm{};
    long usec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6ldZ%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &usec, &consumed) != 7
        || static_cast<size_t>(consumed) != s.size())
        return std::nullopt;
    return join(tm, usec);
}

std::string format_compact(const TimePoint tp)
{
    const auto [tm, usec] = split(tp);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02d.%06ldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, usec);
    return buf;
}

std::optional<TimePoint> parse_compact(const std::string &s)
{
    std::tm tm{};
    long usec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d%2d%2dT%2d%2d%2d.%6ldZ%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &usec, &consumed) != 7
        || static_cast<size_t>(consumed) != s.size())
        return std::nullopt;
    return join(tm, usec);
}
} // namespace rg

#include "clock.hpp"

#include "mcptools/exceptions.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

namespace mcptools::internal::clock
{

namespace
{

// TZ is process-wide state; every local-time conversion holds this lock.
std::mutex tz_mutex;

constexpr const char* kZoneInfoDir = "/usr/share/zoneinfo/";

bool zone_installed(const std::string& zone)
{
    if (zone.empty() || zone.front() == '/' || zone.find("..") != std::string::npos)
        return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(kZoneInfoDir + zone, ec);
}

} // namespace

std::tm local_tm(std::time_t t)
{
    std::lock_guard<std::mutex> lock(tz_mutex);
    std::tm tm{};
#ifdef _WIN32
    if (localtime_s(&tm, &t) != 0)
        throw Error("localtime failed");
#else
    if (localtime_r(&t, &tm) == nullptr)
        throw Error("localtime failed");
#endif
    return tm;
}

std::tm utc_tm(std::time_t t)
{
    std::tm tm{};
#ifdef _WIN32
    if (gmtime_s(&tm, &t) != 0)
        throw Error("gmtime failed");
#else
    if (gmtime_r(&t, &tm) == nullptr)
        throw Error("gmtime failed");
#endif
    return tm;
}

std::optional<std::tm> zone_tm(std::time_t t, const std::string& zone)
{
#ifdef _WIN32
    (void)t;
    (void)zone;
    return std::nullopt;
#else
    if (!zone_installed(zone))
        return std::nullopt;

    std::lock_guard<std::mutex> lock(tz_mutex);
    const char* previous = std::getenv("TZ");
    std::optional<std::string> saved;
    if (previous)
        saved = previous;

    ::setenv("TZ", zone.c_str(), 1);
    ::tzset();
    std::tm tm{};
    bool converted = localtime_r(&t, &tm) != nullptr;

    if (saved)
        ::setenv("TZ", saved->c_str(), 1);
    else
        ::unsetenv("TZ");
    ::tzset();

    if (!converted)
        throw Error("localtime failed");
    return tm;
#endif
}

std::string utc_offset(const std::tm& tm)
{
#ifdef _WIN32
    (void)tm;
    throw Error("UTC offsets are not supported on this platform");
#else
    long seconds = tm.tm_gmtoff;
    char sign = seconds < 0 ? '-' : '+';
    if (seconds < 0)
        seconds = -seconds;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld", sign, seconds / 3600, (seconds % 3600) / 60);
    return buf;
#endif
}

long micros_of(TimePoint tp)
{
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    auto micros = static_cast<long>(since_epoch.count() % 1000000);
    return micros < 0 ? micros + 1000000 : micros;
}

std::string iso8601(const std::tm& tm, long micros)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    std::string out(buf);
    if (micros != 0)
    {
        std::snprintf(buf, sizeof(buf), ".%06ld", micros);
        out += buf;
    }
    return out;
}

std::string iso8601_local(TimePoint tp)
{
    auto t = std::chrono::system_clock::to_time_t(tp);
    return iso8601(local_tm(t), micros_of(tp));
}

std::string format(const std::tm& tm, const std::string& pattern, long micros)
{
    if (pattern.find('\0') != std::string::npos)
        throw Error("embedded null character");

    std::string expanded;
    expanded.reserve(pattern.size() + 8);
    for (size_t i = 0; i < pattern.size(); ++i)
    {
        if (pattern[i] == '%' && i + 1 < pattern.size())
        {
            if (pattern[i + 1] == 'f')
            {
                char digits[8];
                std::snprintf(digits, sizeof(digits), "%06ld", micros);
                expanded += digits;
                ++i;
                continue;
            }
            expanded += pattern[i];
            expanded += pattern[++i];
            continue;
        }
        expanded += pattern[i];
    }

    // The trailing marker keeps a legitimately empty result apart from a short buffer.
    expanded += '\x01';
    for (size_t size = 256; size <= (1u << 20); size *= 4)
    {
        std::vector<char> buf(size);
        size_t n = std::strftime(buf.data(), buf.size(), expanded.c_str(), &tm);
        if (n > 0)
            return std::string(buf.data(), n - 1);
    }
    throw Error("formatted time is too long");
}

} // namespace mcptools::internal::clock

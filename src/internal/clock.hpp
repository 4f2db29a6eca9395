#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace mcptools::internal::clock
{

using TimePoint = std::chrono::system_clock::time_point;

std::tm local_tm(std::time_t t);
std::tm utc_tm(std::time_t t);

/// Broken-down time in an IANA zone such as "Europe/Paris", read from the system zoneinfo
/// database. Empty when the zone is not installed.
std::optional<std::tm> zone_tm(std::time_t t, const std::string& zone);

/// "+HH:MM" offset from UTC of a time produced by local_tm or zone_tm.
std::string utc_offset(const std::tm& tm);

/// YYYY-MM-DDTHH:MM:SS with a .ffffff suffix only when the microsecond part is non-zero.
std::string iso8601(const std::tm& tm, long micros);

/// Local-time ISO-8601 rendering of a time point.
std::string iso8601_local(TimePoint tp);

long micros_of(TimePoint tp);

/// strftime with an unbounded result size. "%f" expands to six-digit microseconds.
/// Throws Error when the pattern contains a NUL character.
std::string format(const std::tm& tm, const std::string& pattern, long micros = 0);

} // namespace mcptools::internal::clock

#include "mcptools/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mcptools::logging
{

namespace
{
std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    static std::shared_ptr<spdlog::logger> instance = []
    {
        if (auto existing = spdlog::get(LOGGER_NAME))
            return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

spdlog::level::level_enum level_from_string(const std::string& name)
{
    std::string lower = to_lower(name);
    if (lower == "warning")
        lower = "warn";
    if (lower == "fatal")
        lower = "critical";

    auto level = spdlog::level::from_str(lower);
    // from_str maps unrecognized names to off
    if (level == spdlog::level::off && lower != "off")
        return spdlog::level::info;
    return level;
}

void configure(const Settings& settings)
{
    auto log = logger();
    auto level = level_from_string(settings.log_level);
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
    if (level == spdlog::level::info && to_lower(settings.log_level) != "info")
        log->warn("unknown log level '{}', using info", settings.log_level);
}

} // namespace mcptools::logging

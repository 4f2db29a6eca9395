#include "internal/arguments.hpp"
#include "internal/clock.hpp"
#include "mcptools/logging.hpp"
#include "mcptools/tools/builtin.hpp"

#include <chrono>

namespace mcptools::tools::builtin
{

namespace
{
constexpr const char* kHumanFormat = "%A, %B %d, %Y at %I:%M %p";
}

void from_json(const Json& j, CurrentTimeArgs& args)
{
    internal::require_object(j);
    args.format = internal::string_arg(j, "format", "iso");
    args.custom_format = internal::string_arg(j, "custom_format");
    args.timezone = internal::string_arg(j, "timezone", "local");
}

ToolResult current_time(const CurrentTimeArgs& args)
{
    const auto& zone = args.timezone;
    try
    {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto micros = internal::clock::micros_of(now);

        // Local time carries no offset suffix; explicit zones do.
        std::tm tm{};
        std::string offset;
        if (zone == "utc" || zone == "UTC")
        {
            tm = internal::clock::utc_tm(t);
            offset = "+00:00";
        }
        else if (zone.empty() || zone == "local")
        {
            tm = internal::clock::local_tm(t);
        }
        else if (auto zoned = internal::clock::zone_tm(t, zone))
        {
            tm = *zoned;
            offset = internal::clock::utc_offset(tm);
        }
        else
        {
            logging::logger()->debug("timezone '{}' is not installed, using local time", zone);
            tm = internal::clock::local_tm(t);
        }

        std::string result;
        if (args.format == "iso")
            result = internal::clock::iso8601(tm, micros) + offset;
        else if (args.format == "human")
            result = internal::clock::format(tm, kHumanFormat);
        else if (args.format == "timestamp")
            result = std::to_string(static_cast<long long>(t));
        else if (args.format == "custom")
            result = args.custom_format.empty()
                         ? "Custom format string required for custom format type"
                         : internal::clock::format(tm, args.custom_format, micros);
        else
            return ToolResult::error("Unknown format type: " + args.format);

        return ToolResult::ok("Current time: " + result);
    }
    catch (const std::exception& e)
    {
        return ToolResult::error(std::string("Error getting time: ") + e.what());
    }
}

} // namespace mcptools::tools::builtin

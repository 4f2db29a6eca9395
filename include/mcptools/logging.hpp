#pragma once
#include "mcptools/settings.hpp"

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mcptools::logging
{

constexpr const char* LOGGER_NAME = "mcptools";

/// Shared stderr logger. stdout is reserved for protocol responses.
std::shared_ptr<spdlog::logger> logger();

/// Applies Settings::log_level; unknown level names fall back to info.
void configure(const Settings& settings);

spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace mcptools::logging

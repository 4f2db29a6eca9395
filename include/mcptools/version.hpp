#pragma once

namespace mcptools
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

constexpr const char* SERVER_NAME = "mcptools-server";

} // namespace mcptools

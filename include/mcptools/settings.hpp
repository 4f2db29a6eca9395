#pragma once
#include "mcptools/types.hpp"

#include <string>

namespace mcptools
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Per-call deadline for tool handlers; 0 disables it.
    int tool_timeout_ms{0};
    /// Check tools/call arguments against the tool's inputSchema before invoking it.
    bool strict_input_validation{false};

    static Settings from_env();
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);
};

} // namespace mcptools

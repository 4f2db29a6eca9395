#pragma once
#include "mcptools/content.hpp"
#include "mcptools/tools/manager.hpp"
#include "mcptools/types.hpp"

#include <functional>
#include <string>

namespace mcptools::mcp
{

/// Resolves requests against a static tool registry.
///
/// Supported methods:
/// - "tools/list": {"tools": [descriptor, ...]} (the listing shape, not a ToolResult)
/// - "tools/call": a ToolResult for params.name / params.arguments
/// Any other method yields the uniform error "Unknown method: <method>".
class Dispatcher
{
  public:
    struct Options
    {
        /// Validate arguments against the tool's inputSchema before conversion.
        bool strict_input_validation{false};
    };

    explicit Dispatcher(const tools::ToolManager& tools) : Dispatcher(tools, Options{}) {}
    Dispatcher(const tools::ToolManager& tools, Options options)
        : tools_(tools), options_(options)
    {
    }

    /// Throws ValidationError when the request is not a JSON object; everything past that
    /// point is answered with a value.
    Json handle(const Json& request) const;

    /// Dispatch boundary: never throws for failures raised by the tool.
    ToolResult call_tool(const std::string& name, const Json& arguments) const;

  private:
    const tools::ToolManager& tools_;
    Options options_;
};

/// Adapts a dispatcher to the handler signature the stdio transport expects.
std::function<Json(const Json&)> make_mcp_handler(const Dispatcher& dispatcher);

} // namespace mcptools::mcp

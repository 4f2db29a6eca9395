#pragma once

/// @file mcptools.hpp
/// @brief Main header for mcptools - includes the components needed to serve the tools
///
/// Usage:
/// @code
/// #include <mcptools.hpp>
///
/// int main() {
///     auto tools = mcptools::tools::builtin::make_builtin_tools();
///     mcptools::mcp::Dispatcher dispatcher(tools);
///     mcptools::server::StdioServerWrapper server(mcptools::mcp::make_mcp_handler(dispatcher));
///     return server.run() ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "mcptools/types.hpp"
#include "mcptools/exceptions.hpp"
#include "mcptools/content.hpp"
#include "mcptools/settings.hpp"
#include "mcptools/logging.hpp"

// Tools
#include "mcptools/tools/tool.hpp"
#include "mcptools/tools/manager.hpp"
#include "mcptools/tools/calculator.hpp"
#include "mcptools/tools/builtin.hpp"

// Dispatch and transport
#include "mcptools/mcp/dispatcher.hpp"
#include "mcptools/server/stdio_server.hpp"

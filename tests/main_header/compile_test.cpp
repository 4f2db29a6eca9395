/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main mcptools.hpp header
///
/// This test verifies that including just <mcptools.hpp> gives access to
/// everything needed to build and serve the tool registry.

#include "mcptools.hpp"

#include <cassert>
#include <iostream>

using namespace mcptools;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    auto tools = tools::builtin::make_builtin_tools();
    mcp::Dispatcher dispatcher(tools);
    server::StdioServerWrapper server(mcp::make_mcp_handler(dispatcher));
    assert(!server.running());

    Settings settings;
    logging::configure(settings);
    assert(logging::logger()->name() == logging::LOGGER_NAME);

    assert(tools::calculator::format(tools::calculator::evaluate("6 / 3")) == "2.0");
    std::cout << "  PASSED" << std::endl;
    return 0;
}

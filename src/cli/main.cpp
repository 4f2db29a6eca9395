#include "mcptools/exceptions.hpp"
#include "mcptools/logging.hpp"
#include "mcptools/mcp/dispatcher.hpp"
#include "mcptools/server/stdio_server.hpp"
#include "mcptools/settings.hpp"
#include "mcptools/tools/builtin.hpp"
#include "mcptools/version.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static void print_version(std::ostream& os)
{
    os << mcptools::SERVER_NAME << " " << mcptools::VERSION_MAJOR << "."
       << mcptools::VERSION_MINOR << "." << mcptools::VERSION_PATCH << "\n";
}

static int usage(int exit_code = 2)
{
    // stdout belongs to the protocol once serving starts; help goes there only on request
    std::ostream& os = exit_code == 0 ? std::cout : std::cerr;
    print_version(os);
    os << "Usage:\n";
    os << "  mcptools-server [--config <file>]\n";
    os << "  mcptools-server --help\n";
    os << "  mcptools-server --version\n";
    os << "\n";
    os << "Reads one JSON request per line on stdin and writes one JSON response per line\n";
    os << "on stdout. Logs go to stderr.\n";
    os << "\n";
    os << "Environment (ignored when --config is given):\n";
    os << "  MCPTOOLS_LOG_LEVEL                trace|debug|info|warn|error|critical|off\n";
    os << "  MCPTOOLS_TOOL_TIMEOUT_MS          per-call tool deadline, 0 disables\n";
    os << "  MCPTOOLS_STRICT_INPUT_VALIDATION  1 to check arguments against inputSchema\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto& a : args)
    {
        if (a == "--help" || a == "-h")
            return usage(0);
        if (a == "--version")
        {
            print_version(std::cout);
            return 0;
        }
    }

    mcptools::Settings settings;
    try
    {
        auto config = consume_flag_value(args, "--config");
        if (!args.empty())
        {
            std::cerr << "Unknown option: " << args.front() << "\n";
            return usage();
        }
        settings = config ? mcptools::Settings::from_file(*config)
                          : mcptools::Settings::from_env();
    }
    catch (const mcptools::ValidationError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    mcptools::logging::configure(settings);
    auto log = mcptools::logging::logger();

    auto tools = mcptools::tools::builtin::make_builtin_tools();
    if (settings.tool_timeout_ms > 0)
        tools.apply_timeout(std::chrono::milliseconds(settings.tool_timeout_ms));

    mcptools::mcp::Dispatcher::Options options;
    options.strict_input_validation = settings.strict_input_validation;
    mcptools::mcp::Dispatcher dispatcher(tools, options);

    log->info("serving {} tools on stdio (timeout {} ms, strict input validation {})",
              tools.size(), settings.tool_timeout_ms,
              settings.strict_input_validation ? "on" : "off");

    mcptools::server::StdioServerWrapper server(mcptools::mcp::make_mcp_handler(dispatcher));
    bool ok = server.run();

    log->info("input closed, shutting down");
    if (auto left = mcptools::tools::drain_handlers(std::chrono::seconds(1)))
        log->warn("abandoning {} timed-out tool handler(s) still running at exit", left);
    return ok ? 0 : 1;
}

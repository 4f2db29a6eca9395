#include "mcptools/server/stdio_server.hpp"

#include "mcptools/content.hpp"
#include "mcptools/logging.hpp"
#include "mcptools/util/json.hpp"

#include <iostream>
#include <string>

namespace mcptools::server
{

namespace
{
void write_line(std::ostream& out, const std::string& line)
{
    out << line << '\n';
    out.flush();
}
} // namespace

StdioServerWrapper::StdioServerWrapper(McpHandler handler) : handler_(std::move(handler)) {}

std::string StdioServerWrapper::handle_line(const std::string& line) const
{
    auto log = logging::logger();
    Json request;
    try
    {
        request = util::json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        log->warn("invalid JSON request: {}", e.what());
        return util::json::dump_line(ToolResult::error("Invalid JSON request"));
    }

    try
    {
        return util::json::dump_line(handler_(request));
    }
    catch (const std::exception& e)
    {
        log->error("server error: {}", e.what());
        return util::json::dump_line(ToolResult::error(std::string("Server error: ") + e.what()));
    }
}

bool StdioServerWrapper::run_loop(std::istream& in, std::ostream& out)
{
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        // Whitespace-only lines are answered as invalid JSON
        if (line.empty())
            continue;
        write_line(out, handle_line(line));
    }

    if (in.bad())
    {
        logging::logger()->error("input stream failure");
        write_line(out, util::json::dump_line(
                            ToolResult::error("Server error: input stream failure")));
        return false;
    }
    return true;
}

bool StdioServerWrapper::run()
{
    return run(std::cin, std::cout);
}

bool StdioServerWrapper::run(std::istream& in, std::ostream& out)
{
    if (running_.exchange(true))
        return false;

    bool ok = run_loop(in, out);
    running_ = false;
    return ok;
}

} // namespace mcptools::server

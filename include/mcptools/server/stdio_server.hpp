#pragma once
#include "mcptools/types.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <string>

namespace mcptools::server
{

/**
 * Line-delimited JSON transport over standard streams.
 *
 * Reads one request per line, passes it to the handler and writes exactly one response
 * line per non-empty input line, flushing after each:
 * - a line that is not valid JSON is answered with the "Invalid JSON request" error
 *   without calling the handler;
 * - an exception escaping the handler is answered with "Server error: <message>".
 *
 * Requests are processed strictly one at a time, in order.
 *
 * Usage:
 *   auto tools = mcptools::tools::builtin::make_builtin_tools();
 *   mcptools::mcp::Dispatcher dispatcher(tools);
 *   StdioServerWrapper server(mcptools::mcp::make_mcp_handler(dispatcher));
 *   server.run();  // Blocking - runs until EOF on stdin
 */
class StdioServerWrapper
{
  public:
    using McpHandler = std::function<Json(const Json&)>;

    explicit StdioServerWrapper(McpHandler handler);

    /**
     * Serve std::cin / std::cout until end of input.
     *
     * @return true on a normal end of input, false if the server was already running or
     *         the input stream failed.
     */
    bool run();

    /// Same as run() on caller-supplied streams.
    bool run(std::istream& in, std::ostream& out);

    bool running() const
    {
        return running_.load();
    }

    /// Processes one raw line and returns the response line (without newline).
    std::string handle_line(const std::string& line) const;

  private:
    bool run_loop(std::istream& in, std::ostream& out);

    McpHandler handler_;
    std::atomic<bool> running_{false};
};

} // namespace mcptools::server

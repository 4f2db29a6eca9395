#pragma once
#include "mcptools/content.hpp"
#include "mcptools/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace mcptools::tools
{

/// A named, schema-described, stateless operation.
///
/// The descriptor part (name, description, inputSchema) is what tools/list advertises;
/// the handler is invoked with the raw "arguments" object of a tools/call request.
class Tool
{
  public:
    using Fn = std::function<ToolResult(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const Json& input_schema() const
    {
        return input_schema_;
    }
    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

    /// Descriptor entry as listed by tools/list.
    Json descriptor() const
    {
        return Json{{"name", name_}, {"description", description_}, {"inputSchema", input_schema_}};
    }

    /// Runs the handler. With a positive timeout and enforce_timeout set, the handler runs
    /// on a worker thread and ToolTimeoutError is thrown once the deadline passes; the
    /// worker is not cancelled and its late result is dropped.
    ToolResult invoke(const Json& input, bool enforce_timeout = true) const;

    Tool& set_timeout(std::chrono::milliseconds timeout)
    {
        timeout_ = timeout;
        return *this;
    }

  private:
    std::string name_;
    std::string description_;
    Json input_schema_;
    Fn fn_;
    std::chrono::milliseconds timeout_{0};
};

/// Waits up to grace for handler threads started by timed invocations, including those
/// abandoned after a timeout. Returns how many are still running.
std::size_t drain_handlers(std::chrono::milliseconds grace);

} // namespace mcptools::tools

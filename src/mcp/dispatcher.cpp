#include "mcptools/mcp/dispatcher.hpp"

#include "mcptools/exceptions.hpp"
#include "mcptools/logging.hpp"
#include "mcptools/util/json.hpp"
#include "mcptools/util/json_schema.hpp"

namespace mcptools::mcp
{

namespace
{
// Missing fields count as null so that messages render them as "null".
const Json& field_or_null(const Json& obj, const char* key)
{
    static const Json null_value;
    if (!obj.is_object())
        return null_value;
    auto it = obj.find(key);
    return it == obj.end() ? null_value : *it;
}
} // namespace

Json Dispatcher::handle(const Json& request) const
{
    if (!request.is_object())
        throw ValidationError("request must be a JSON object");

    const Json& method = field_or_null(request, "method");
    const Json& params = field_or_null(request, "params");
    auto log = logging::logger();

    if (method == "tools/list")
    {
        log->debug("tools/list ({} tools)", tools_.size());
        return Json{{"tools", tools_.list_descriptors()}};
    }

    if (method == "tools/call")
    {
        const Json& name = field_or_null(params, "name");
        const Json& arguments = field_or_null(params, "arguments");
        if (!name.is_string() || !tools_.has(name.get<std::string>()))
        {
            log->debug("tools/call for unknown tool {}", name.dump());
            Json out = ToolResult::error("Unknown tool: " + util::json::display(name));
            return out;
        }
        Json out = call_tool(name.get<std::string>(),
                             arguments.is_null() ? Json::object() : arguments);
        return out;
    }

    log->debug("unknown method {}", method.dump());
    Json out = ToolResult::error("Unknown method: " + util::json::display(method));
    return out;
}

ToolResult Dispatcher::call_tool(const std::string& name, const Json& arguments) const
{
    auto log = logging::logger();
    try
    {
        const auto& tool = tools_.get(name);
        if (options_.strict_input_validation)
            util::schema::validate(tool.input_schema(), arguments);

        log->debug("calling tool {}", name);
        ToolResult result = tool.invoke(arguments);
        if (result.content.empty())
            return ToolResult::error("Error executing tool " + name + ": no content returned");
        if (result.is_error)
            log->debug("tool {} reported: {}", name, result.text());
        return result;
    }
    catch (const ValidationError& e)
    {
        log->debug("invalid arguments for tool {}: {}", name, e.what());
        return ToolResult::error("Invalid arguments for tool " + name + ": " + e.what());
    }
    catch (const ToolTimeoutError& e)
    {
        log->warn("{}", e.what());
        return ToolResult::error("Error executing tool " + name + ": " + e.what());
    }
    catch (const std::exception& e)
    {
        log->error("tool {} failed: {}", name, e.what());
        return ToolResult::error("Error executing tool " + name + ": " + e.what());
    }
}

std::function<Json(const Json&)> make_mcp_handler(const Dispatcher& dispatcher)
{
    return [&dispatcher](const Json& request) { return dispatcher.handle(request); };
}

} // namespace mcptools::mcp

#include "mcptools/tools/builtin.hpp"

namespace mcptools::tools::builtin
{

namespace
{

// Wraps a typed handler: the raw arguments are converted into Args first, so a malformed
// argument object surfaces as ValidationError before any tool logic runs.
template <typename Args>
Tool make_tool(std::string name, std::string description, Json input_schema,
               ToolResult (*handler)(const Args&))
{
    return Tool(std::move(name), std::move(description), std::move(input_schema),
                [handler](const Json& arguments) { return handler(arguments.get<Args>()); });
}

Json string_property(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

Json enum_property(const std::string& description, std::initializer_list<const char*> values)
{
    Json p = string_property(description);
    Json allowed = Json::array();
    for (const char* v : values)
        allowed.push_back(v);
    p["enum"] = allowed;
    return p;
}

Json object_schema(Json properties, std::initializer_list<const char*> required)
{
    Json req = Json::array();
    for (const char* r : required)
        req.push_back(r);
    return Json{{"type", "object"}, {"properties", std::move(properties)}, {"required", req}};
}

} // namespace

ToolManager make_builtin_tools()
{
    ToolManager tm;

    tm.register_tool(make_tool<TextTransformArgs>(
        "text_transform",
        "Transform text using various operations (uppercase, lowercase, reverse, etc.)",
        object_schema(Json{{"text", string_property("The text to transform")},
                           {"operation", enum_property("The operation to perform",
                                                       {"uppercase", "lowercase", "reverse",
                                                        "capitalize", "title", "count_words",
                                                        "count_chars"})}},
                      {"text", "operation"}),
        &text_transform));

    tm.register_tool(make_tool<CalculateArgs>(
        "calculate", "Perform mathematical calculations",
        object_schema(
            Json{{"expression",
                  string_property("Mathematical expression to evaluate (e.g., '2 + 3 * 4')")}},
            {"expression"}),
        &calculate));

    tm.register_tool(make_tool<SystemInfoArgs>(
        "system_info", "Get system information",
        object_schema(Json{{"info_type",
                            enum_property("Type of system information to retrieve",
                                          {"platform", "cpu", "memory", "disk", "network",
                                           "processes", "uptime"})}},
                      {"info_type"}),
        &system_info));

    tm.register_tool(make_tool<FileOperationsArgs>(
        "file_operations", "Basic file operations (list, read, write)",
        object_schema(
            Json{{"operation", enum_property("File operation to perform",
                                             {"list", "read", "write", "exists", "size"})},
                 {"path", string_property("File or directory path")},
                 {"content", string_property("Content to write (only for write operation)")}},
            {"operation", "path"}),
        &file_operations));

    Json timezone = string_property("Timezone: local, utc or an IANA name such as Europe/Paris (default: local)");
    timezone["default"] = "local";
    tm.register_tool(make_tool<CurrentTimeArgs>(
        "current_time", "Get current date and time information",
        object_schema(
            Json{{"format", enum_property("Time format (iso, human, timestamp, custom)",
                                          {"iso", "human", "timestamp", "custom"})},
                 {"timezone", timezone},
                 {"custom_format",
                  string_property("Custom format string (for custom format type)")}},
            {"format"}),
        &current_time));

    return tm;
}

} // namespace mcptools::tools::builtin

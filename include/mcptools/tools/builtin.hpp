#pragma once
#include "mcptools/content.hpp"
#include "mcptools/tools/manager.hpp"
#include "mcptools/types.hpp"

#include <string>

namespace mcptools::tools::builtin
{

// Typed arguments, one struct per tool. from_json converts the raw "arguments" object and
// throws ValidationError when it is not an object or a field has the wrong JSON type;
// absent fields take the defaults below. Values outside a tool's allowed set are not
// rejected here: the handler reports them as an error result naming the value.

struct TextTransformArgs
{
    std::string text;
    std::string operation;
};

struct CalculateArgs
{
    std::string expression;
};

struct SystemInfoArgs
{
    std::string info_type;
};

struct FileOperationsArgs
{
    std::string operation;
    std::string path;
    std::string content;
};

struct CurrentTimeArgs
{
    std::string format{"iso"};
    std::string custom_format;
    std::string timezone{"local"};
};

void from_json(const Json& j, TextTransformArgs& args);
void from_json(const Json& j, CalculateArgs& args);
void from_json(const Json& j, SystemInfoArgs& args);
void from_json(const Json& j, FileOperationsArgs& args);
void from_json(const Json& j, CurrentTimeArgs& args);

// Handlers
ToolResult text_transform(const TextTransformArgs& args);
ToolResult calculate(const CalculateArgs& args);
ToolResult system_info(const SystemInfoArgs& args);
ToolResult file_operations(const FileOperationsArgs& args);
ToolResult current_time(const CurrentTimeArgs& args);

/// Registry with the five built-in tools, in the order tools/list reports them.
ToolManager make_builtin_tools();

} // namespace mcptools::tools::builtin

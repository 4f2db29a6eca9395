#pragma once
#include "mcptools/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mcptools
{

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

/// Uniform outcome of every tools/call: a non-empty list of text items plus an error flag.
///
/// Handlers build these with ok() / error(); the dispatcher and the transport use error()
/// for protocol and transport failures so that clients only ever parse one shape.
struct ToolResult
{
    std::vector<TextContent> content;
    bool is_error{false};

    static ToolResult ok(std::string text)
    {
        ToolResult r;
        r.content.push_back(TextContent{"text", std::move(text)});
        return r;
    }

    static ToolResult error(std::string text)
    {
        ToolResult r = ok(std::move(text));
        r.is_error = true;
        return r;
    }

    /// Text of the first content item; empty when there is none.
    const std::string& text() const
    {
        static const std::string empty;
        return content.empty() ? empty : content.front().text;
    }
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

inline void to_json(Json& j, const ToolResult& r)
{
    Json content = Json::array();
    for (const auto& item : r.content)
        content.push_back(item);
    j = Json{{"content", content}, {"isError", r.is_error}};
}

inline void from_json(const Json& j, ToolResult& r)
{
    r.content.clear();
    for (const auto& item : j.at("content"))
        r.content.push_back(item.get<TextContent>());
    r.is_error = j.value("isError", false);
}

} // namespace mcptools

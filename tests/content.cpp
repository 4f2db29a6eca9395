#include "mcptools/content.hpp"

#include <cassert>

int main()
{
    using namespace mcptools;
    TextContent t{"text", "Hello"};
    Json jt = t;
    assert(jt.at("type") == "text");
    assert(jt.at("text") == "Hello");

    // Uniform response shape: content first, isError always present
    Json ok = ToolResult::ok("done");
    assert(ok.dump() == R"({"content":[{"type":"text","text":"done"}],"isError":false})");

    Json err = ToolResult::error("Invalid JSON request");
    assert(err.dump() ==
           R"({"content":[{"type":"text","text":"Invalid JSON request"}],"isError":true})");

    auto back = err.get<ToolResult>();
    assert(back.is_error);
    assert(back.content.size() == 1);
    assert(back.text() == "Invalid JSON request");

    // isError absent reads as success
    auto legacy = Json::parse(R"({"content":[{"type":"text","text":"x"}]})").get<ToolResult>();
    assert(!legacy.is_error);
    assert(legacy.text() == "x");

    ToolResult empty;
    assert(empty.text().empty());
    return 0;
}

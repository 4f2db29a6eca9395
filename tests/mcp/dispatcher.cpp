/// @file dispatcher.cpp
/// @brief Request dispatch against the built-in registry

#include "mcptools/exceptions.hpp"
#include "mcptools/mcp/dispatcher.hpp"
#include "mcptools/tools/builtin.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using namespace mcptools;

static Json call(const mcp::Dispatcher& d, const std::string& name, const Json& arguments)
{
    return d.handle(Json{{"method", "tools/call"},
                         {"params", Json{{"name", name}, {"arguments", arguments}}}});
}

static std::string text_of(const Json& response)
{
    return response.at("content").at(0).at("text").get<std::string>();
}

void test_tools_list(const mcp::Dispatcher& d, const tools::ToolManager& tm)
{
    auto res = d.handle(Json{{"method", "tools/list"}});
    assert(res.size() == 1);
    assert(res.contains("tools"));
    assert(!res.contains("content"));
    const auto& listed = res["tools"];
    assert(listed.size() == tm.size());
    assert(listed.size() == 5);

    std::set<std::string> names;
    for (const auto& t : listed)
    {
        names.insert(t["name"].get<std::string>());
        assert(t["description"].is_string());
        assert(t["inputSchema"]["type"] == "object");
        assert(t["inputSchema"]["properties"].is_object());
        assert(t["inputSchema"]["required"].is_array());
    }
    assert(names.size() == listed.size());
    assert(listed[0]["name"] == "text_transform");
    assert(listed[4]["name"] == "current_time");
    assert(listed[0]["inputSchema"]["properties"]["operation"]["enum"].size() == 7);
    assert(listed[4]["inputSchema"]["properties"]["timezone"]["default"] == "local");
    std::cout << "  [PASS] tools/list\n";
}

void test_tools_call(const mcp::Dispatcher& d)
{
    auto res = call(d, "calculate", Json{{"expression", "2 + 3 * 4"}});
    assert(res["isError"] == false);
    assert(text_of(res) == "2 + 3 * 4 = 14");

    res = call(d, "text_transform", Json{{"text", "abc"}, {"operation", "reverse"}});
    assert(res["isError"] == false);
    assert(text_of(res) == "cba");

    res = call(d, "calculate", Json{{"expression", "import os"}});
    assert(res["isError"] == true);
    assert(text_of(res).rfind("Invalid expression", 0) == 0);

    // arguments may be omitted
    res = d.handle(Json{{"method", "tools/call"}, {"params", Json{{"name", "current_time"}}}});
    assert(res["isError"] == false);
    assert(text_of(res).rfind("Current time: ", 0) == 0);
    std::cout << "  [PASS] tools/call\n";
}

void test_protocol_errors(const mcp::Dispatcher& d)
{
    auto res = call(d, "launch_rockets", Json::object());
    assert(res["isError"] == true);
    assert(text_of(res) == "Unknown tool: launch_rockets");
    assert(res["content"].size() == 1);

    res = d.handle(Json{{"method", "tools/call"}});
    assert(res["isError"] == true);
    assert(text_of(res) == "Unknown tool: null");

    res = d.handle(Json{{"method", "resources/list"}});
    assert(res["isError"] == true);
    assert(text_of(res) == "Unknown method: resources/list");

    res = d.handle(Json::object());
    assert(text_of(res) == "Unknown method: null");

    res = d.handle(Json{{"method", 7}});
    assert(text_of(res) == "Unknown method: 7");

    bool threw = false;
    try
    {
        d.handle(Json::array({1, 2}));
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS] protocol errors\n";
}

void test_argument_conversion(const mcp::Dispatcher& d)
{
    auto res = call(d, "text_transform", Json{{"text", 5}, {"operation", "uppercase"}});
    assert(res["isError"] == true);
    assert(text_of(res).rfind("Invalid arguments for tool text_transform: ", 0) == 0);

    res = call(d, "calculate", Json::array());
    assert(res["isError"] == true);
    assert(text_of(res) == "Invalid arguments for tool calculate: arguments must be an object");
    std::cout << "  [PASS] argument conversion\n";
}

void test_dispatch_boundary()
{
    tools::ToolManager tm;
    tm.register_tool(tools::Tool("explode", "throws", Json{{"type", "object"}},
                                 [](const Json&) -> ToolResult
                                 { throw std::runtime_error("kaboom"); }));
    tm.register_tool(tools::Tool("silent", "returns nothing", Json{{"type", "object"}},
                                 [](const Json&) { return ToolResult{}; }));
    tm.register_tool(tools::Tool("sleepy", "sleeps", Json{{"type", "object"}},
                                 [](const Json&)
                                 {
                                     std::this_thread::sleep_for(std::chrono::milliseconds(300));
                                     return ToolResult::ok("late");
                                 }));
    tm.apply_timeout(std::chrono::milliseconds(20));
    mcp::Dispatcher d(tm);

    auto r = d.call_tool("explode", Json::object());
    assert(r.is_error);
    assert(r.text() == "Error executing tool explode: kaboom");

    r = d.call_tool("silent", Json::object());
    assert(r.is_error);
    assert(!r.content.empty());

    r = d.call_tool("sleepy", Json::object());
    assert(r.is_error);
    assert(r.text().rfind("Error executing tool sleepy: ", 0) == 0);
    assert(r.text().find("timed out") != std::string::npos);
    std::cout << "  [PASS] dispatch boundary\n";
}

void test_strict_input_validation(const tools::ToolManager& tm)
{
    mcp::Dispatcher::Options opts;
    opts.strict_input_validation = true;
    mcp::Dispatcher strict(tm, opts);

    auto res = call(strict, "text_transform", Json{{"text", "x"}});
    assert(res["isError"] == true);
    assert(text_of(res) == "Invalid arguments for tool text_transform: missing required: operation");

    res = call(strict, "system_info", Json{{"info_type", "gpu"}});
    assert(res["isError"] == true);
    assert(text_of(res).find("gpu") != std::string::npos);

    res = call(strict, "text_transform", Json{{"text", "x"}, {"operation", "uppercase"}});
    assert(res["isError"] == false);
    assert(text_of(res) == "X");

    // Lenient mode reaches the handler, which names the bad value itself
    mcp::Dispatcher lenient(tm);
    res = call(lenient, "system_info", Json{{"info_type", "gpu"}});
    assert(text_of(res) == "Unknown info type: gpu");
    std::cout << "  [PASS] strict input validation\n";
}

void test_file_roundtrip(const mcp::Dispatcher& d)
{
    auto path = (std::filesystem::temp_directory_path() / "mcptools_dispatcher_roundtrip.txt").string();
    std::filesystem::remove(path);

    auto w = call(d, "file_operations",
                  Json{{"operation", "write"}, {"path", path}, {"content", "hello"}});
    assert(w["isError"] == false);
    auto r = call(d, "file_operations", Json{{"operation", "read"}, {"path", path}});
    assert(r["isError"] == false);
    assert(text_of(r).find("hello") != std::string::npos);

    std::filesystem::remove(path);
    auto e = call(d, "file_operations", Json{{"operation", "exists"}, {"path", path}});
    assert(e["isError"] == false);
    auto t = text_of(e);
    assert(t.size() >= 14 && t.compare(t.size() - 14, 14, "does not exist") == 0);
    std::cout << "  [PASS] file round trip\n";
}

int main()
{
    std::cout << "Dispatcher tests\n";
    auto tm = tools::builtin::make_builtin_tools();
    mcp::Dispatcher d(tm);

    test_tools_list(d, tm);
    test_tools_call(d);
    test_protocol_errors(d);
    test_argument_conversion(d);
    test_dispatch_boundary();
    test_strict_input_validation(tm);
    test_file_roundtrip(d);

    auto handler = mcp::make_mcp_handler(d);
    assert(handler(Json{{"method", "tools/list"}})["tools"].size() == 5);
    std::cout << "All dispatcher tests passed!\n";
    return 0;
}

#include "mcptools/exceptions.hpp"
#include "mcptools/tools/builtin.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcptools;
using namespace mcptools::tools::builtin;

static ToolResult run(const std::string& text, const std::string& op)
{
    return text_transform(TextTransformArgs{text, op});
}

int main()
{
    assert(run("Hello World", "uppercase").text() == "HELLO WORLD");
    assert(run("Hello World", "lowercase").text() == "hello world");
    assert(run("abc def", "reverse").text() == "fed cba");
    assert(run("hELLO wORLD", "capitalize").text() == "Hello world");
    assert(run("hello wORLD it's 2nd", "title").text() == "Hello World It'S 2Nd");
    assert(run("  one two\tthree\n", "count_words").text() == "Word count: 3");
    assert(run("", "count_words").text() == "Word count: 0");
    assert(run("a b c", "count_chars").text() ==
           "Character count: 5 (including spaces), 3 (excluding spaces)");
    std::cout << "[PASS] operations\n";

    // reverse is an involution, lowercase after uppercase restores lowercase input
    for (std::string s : {"", "x", "racecar", "The quick brown fox!", "a\tb\nc"})
    {
        assert(run(run(s, "reverse").text(), "reverse").text() == s);
        std::string lower = run(s, "lowercase").text();
        assert(run(run(lower, "uppercase").text(), "lowercase").text() == lower);
    }
    std::cout << "[PASS] properties\n";

    // Multi-byte characters stay intact and count once
    std::string cafe = "caf\xC3\xA9";
    assert(run(cafe, "reverse").text() == "\xC3\xA9" "fac");
    assert(run(cafe, "count_chars").text() ==
           "Character count: 4 (including spaces), 4 (excluding spaces)");
    std::cout << "[PASS] utf-8\n";

    auto bad = run("text", "shout");
    assert(bad.is_error);
    assert(bad.text() == "Unknown operation: shout");
    assert(!run("text", "uppercase").is_error);
    std::cout << "[PASS] unknown operation\n";

    // Argument conversion
    auto args = Json{{"text", "hi"}, {"operation", "reverse"}}.get<TextTransformArgs>();
    assert(args.text == "hi" && args.operation == "reverse");
    auto defaults = Json::object().get<TextTransformArgs>();
    assert(defaults.text.empty() && defaults.operation.empty());
    assert(text_transform(defaults).text() == "Unknown operation: ");

    bool threw = false;
    try
    {
        Json{{"text", 42}, {"operation", "reverse"}}.get<TextTransformArgs>();
    }
    catch (const ValidationError& e)
    {
        threw = std::string(e.what()).find("text") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try
    {
        Json::array({1, 2}).get<TextTransformArgs>();
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] argument conversion\n";
    return 0;
}

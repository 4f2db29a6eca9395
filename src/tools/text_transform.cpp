#include "internal/arguments.hpp"
#include "internal/utf8.hpp"
#include "mcptools/tools/builtin.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace mcptools::tools::builtin
{

namespace
{

enum class TextOperation
{
    Uppercase,
    Lowercase,
    Reverse,
    Capitalize,
    Title,
    CountWords,
    CountChars
};

std::optional<TextOperation> text_operation_from_string(const std::string& s)
{
    if (s == "uppercase")
        return TextOperation::Uppercase;
    if (s == "lowercase")
        return TextOperation::Lowercase;
    if (s == "reverse")
        return TextOperation::Reverse;
    if (s == "capitalize")
        return TextOperation::Capitalize;
    if (s == "title")
        return TextOperation::Title;
    if (s == "count_words")
        return TextOperation::CountWords;
    if (s == "count_chars")
        return TextOperation::CountChars;
    return std::nullopt;
}

// Case mapping touches ASCII letters only; multi-byte sequences pass through unchanged.
char upper(char c)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

char lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool is_letter(const std::string& unit)
{
    unsigned char lead = static_cast<unsigned char>(unit[0]);
    return lead >= 0x80 ? unit.size() > 1 : std::isalpha(lead) != 0;
}

std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), upper);
    return s;
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), lower);
    return s;
}

std::string reverse(const std::string& s)
{
    auto units = internal::utf8::split_code_points(s);
    std::string out;
    out.reserve(s.size());
    for (auto it = units.rbegin(); it != units.rend(); ++it)
        out += *it;
    return out;
}

std::string capitalize(const std::string& s)
{
    std::string out = to_lower(s);
    if (!out.empty())
        out[0] = upper(out[0]);
    return out;
}

// Upper-cases the first letter of every run of letters and lower-cases the rest.
std::string title(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    bool previous_is_letter = false;
    for (auto& unit : internal::utf8::split_code_points(s))
    {
        bool letter = is_letter(unit);
        if (letter && unit.size() == 1)
            out += previous_is_letter ? lower(unit[0]) : upper(unit[0]);
        else
            out += unit;
        previous_is_letter = letter;
    }
    return out;
}

size_t count_words(const std::string& s)
{
    std::istringstream in(s);
    size_t n = 0;
    std::string word;
    while (in >> word)
        ++n;
    return n;
}

std::string count_chars(const std::string& s)
{
    size_t total = internal::utf8::count_code_points(s);
    size_t spaces = static_cast<size_t>(std::count(s.begin(), s.end(), ' '));
    return "Character count: " + std::to_string(total) + " (including spaces), " +
           std::to_string(total - spaces) + " (excluding spaces)";
}

} // namespace

void from_json(const Json& j, TextTransformArgs& args)
{
    internal::require_object(j);
    args.text = internal::string_arg(j, "text");
    args.operation = internal::string_arg(j, "operation");
}

ToolResult text_transform(const TextTransformArgs& args)
{
    auto op = text_operation_from_string(args.operation);
    if (!op)
        return ToolResult::error("Unknown operation: " + args.operation);

    switch (*op)
    {
    case TextOperation::Uppercase:
        return ToolResult::ok(to_upper(args.text));
    case TextOperation::Lowercase:
        return ToolResult::ok(to_lower(args.text));
    case TextOperation::Reverse:
        return ToolResult::ok(reverse(args.text));
    case TextOperation::Capitalize:
        return ToolResult::ok(capitalize(args.text));
    case TextOperation::Title:
        return ToolResult::ok(title(args.text));
    case TextOperation::CountWords:
        return ToolResult::ok("Word count: " + std::to_string(count_words(args.text)));
    case TextOperation::CountChars:
        return ToolResult::ok(count_chars(args.text));
    }
    return ToolResult::error("Unknown operation: " + args.operation);
}

} // namespace mcptools::tools::builtin

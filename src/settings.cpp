#include "mcptools/settings.hpp"

#include "mcptools/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace mcptools
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static bool is_truthy(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

static int parse_timeout(const std::string& s)
{
    size_t pos = 0;
    int v = 0;
    try
    {
        v = std::stoi(s, &pos, 10);
    }
    catch (const std::exception&)
    {
        throw ValidationError("tool timeout must be an integer: " + s);
    }
    if (pos != s.size() || v < 0)
        throw ValidationError("tool timeout must be a non-negative integer: " + s);
    return v;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = to_upper(getenv_str("MCPTOOLS_LOG_LEVEL", s.log_level));
    auto timeout = getenv_str("MCPTOOLS_TOOL_TIMEOUT_MS", "");
    if (!timeout.empty())
        s.tool_timeout_ms = parse_timeout(timeout);
    s.strict_input_validation = is_truthy(getenv_str("MCPTOOLS_STRICT_INPUT_VALIDATION", "0"));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("settings must be a JSON object");
    Settings s;
    try
    {
        if (j.contains("log_level"))
            s.log_level = to_upper(j.at("log_level").get<std::string>());
        if (j.contains("tool_timeout_ms"))
            s.tool_timeout_ms = j.at("tool_timeout_ms").get<int>();
        if (j.contains("strict_input_validation"))
            s.strict_input_validation = j.at("strict_input_validation").get<bool>();
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("invalid settings: ") + e.what());
    }
    if (s.tool_timeout_ms < 0)
        throw ValidationError("tool_timeout_ms must not be negative");
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ValidationError("cannot open settings file: " + path);
    Json j;
    try
    {
        j = Json::parse(in);
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError("malformed settings file " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace mcptools

#include "internal/arguments.hpp"
#include "internal/utf8.hpp"
#include "mcptools/exceptions.hpp"
#include "mcptools/tools/builtin.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>
#include <vector>

#include <sys/stat.h>

namespace mcptools::tools::builtin
{

namespace fs = std::filesystem;

namespace
{

// A handler abandoned by a timeout may still be writing; writes never overlap. Never
// destroyed, so such a handler can finish during exit.
std::mutex& write_mutex()
{
    static auto* m = new std::mutex;
    return *m;
}

std::string list_directory(const std::string& path)
{
    std::error_code ec;
    if (!fs::is_directory(path, ec))
        return "Path " + path + " is not a directory";

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(path))
        names.push_back(entry.path().filename().string());
    std::sort(names.begin(), names.end());

    std::string out = "Contents of " + path + ":\n";
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i)
            out += '\n';
        out += names[i];
    }
    return out;
}

// Text-mode read: \r\n and lone \r become \n; the content must be UTF-8.
std::string read_text(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::system_error(errno, std::generic_category(), "cannot open " + path);
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw std::system_error(errno, std::generic_category(), "cannot read " + path);
    if (!internal::utf8::is_valid(raw))
        throw Error("cannot decode " + path + ": file is not valid UTF-8 text");

    std::string text;
    text.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
    {
        if (raw[i] == '\r')
        {
            text += '\n';
            if (i + 1 < raw.size() && raw[i + 1] == '\n')
                ++i;
            continue;
        }
        text += raw[i];
    }
    return text;
}

std::string read_file(const std::string& path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return "File " + path + " not found";
    return "Contents of " + path + ":\n" + read_text(path);
}

std::string write_file(const std::string& path, const std::string& content)
{
    std::lock_guard<std::mutex> lock(write_mutex());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::system_error(errno, std::generic_category(), "cannot open " + path);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out)
        throw std::system_error(errno, std::generic_category(), "cannot write " + path);
    return "Successfully wrote to " + path;
}

std::string path_exists(const std::string& path)
{
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    return "Path " + path + (exists ? " exists" : " does not exist");
}

std::string path_size(const std::string& path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        return "Path " + path + " does not exist";
    // stat rather than file_size so directories report their size too
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        throw std::system_error(errno, std::generic_category(), "cannot stat " + path);
    return "Size of " + path + ": " + std::to_string(static_cast<long long>(st.st_size)) +
           " bytes";
}

} // namespace

void from_json(const Json& j, FileOperationsArgs& args)
{
    internal::require_object(j);
    args.operation = internal::string_arg(j, "operation");
    args.path = internal::string_arg(j, "path");
    args.content = internal::string_arg(j, "content");
}

ToolResult file_operations(const FileOperationsArgs& args)
{
    const auto& op = args.operation;
    try
    {
        if (op == "list")
            return ToolResult::ok(list_directory(args.path));
        if (op == "read")
            return ToolResult::ok(read_file(args.path));
        if (op == "write")
            return ToolResult::ok(write_file(args.path, args.content));
        if (op == "exists")
            return ToolResult::ok(path_exists(args.path));
        if (op == "size")
            return ToolResult::ok(path_size(args.path));
        return ToolResult::error("Unknown operation: " + op);
    }
    catch (const std::exception& e)
    {
        return ToolResult::error(std::string("Error with file operation: ") + e.what());
    }
}

} // namespace mcptools::tools::builtin

#include "internal/arguments.hpp"
#include "internal/clock.hpp"
#include "mcptools/exceptions.hpp"
#include "mcptools/tools/builtin.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

#include <pwd.h>
#include <sys/utsname.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/sysinfo.h>
#endif

namespace mcptools::tools::builtin
{

namespace
{

const internal::clock::TimePoint process_start = std::chrono::system_clock::now();

struct utsname uname_or_throw()
{
    struct utsname info{};
    if (::uname(&info) != 0)
        throw std::system_error(errno, std::generic_category(), "uname");
    return info;
}

std::string home_directory()
{
    if (const char* home = std::getenv("HOME"))
        return home;
    if (const struct passwd* pw = ::getpwuid(::getuid()))
        return pw->pw_dir;
    throw Error("home directory is unknown");
}

std::string hostname()
{
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0)
        throw std::system_error(errno, std::generic_category(), "gethostname");
    return buf;
}

// "model name" from /proc/cpuinfo; the machine type where the kernel reports none.
std::string processor_name(const struct utsname& u)
{
    std::ifstream cpuinfo("/proc/cpuinfo");
    std::string line;
    while (std::getline(cpuinfo, line))
    {
        if (line.rfind("model name", 0) != 0)
            continue;
        auto colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        auto begin = line.find_first_not_of(" \t", colon + 1);
        if (begin != std::string::npos)
            return line.substr(begin);
    }
    return u.machine;
}

std::string platform_info()
{
    auto u = uname_or_throw();
    return std::string("Platform: ") + u.sysname + " " + u.release +
           "\nArchitecture: " + u.machine + "\nProcessor: " + processor_name(u);
}

std::string cpu_info()
{
    auto u = uname_or_throw();
    unsigned count = std::thread::hardware_concurrency();
    return "CPU Count: " + (count ? std::to_string(count) : std::string("unknown")) +
           "\nProcessor: " + processor_name(u);
}

std::string disk_info()
{
    return "Current directory: " + std::filesystem::current_path().string() +
           "\nHome directory: " + home_directory();
}

std::string uptime_info()
{
    std::string out = "Server started at: " + internal::clock::iso8601_local(process_start);
#ifdef __linux__
    struct sysinfo si{};
    if (::sysinfo(&si) == 0)
        out += "\nSystem uptime: " + std::to_string(si.uptime) + " seconds";
#endif
    return out;
}

} // namespace

void from_json(const Json& j, SystemInfoArgs& args)
{
    internal::require_object(j);
    args.info_type = internal::string_arg(j, "info_type");
}

ToolResult system_info(const SystemInfoArgs& args)
{
    const auto& type = args.info_type;
    try
    {
        std::string info;
        if (type == "platform")
            info = platform_info();
        else if (type == "cpu")
            info = cpu_info();
        else if (type == "memory")
            info = "Memory information is unavailable: extended system metrics are not enabled";
        else if (type == "disk")
            info = disk_info();
        else if (type == "network")
            info = "Hostname: " + hostname();
        else if (type == "processes")
            info = "Process information is unavailable: extended system metrics are not enabled";
        else if (type == "uptime")
            info = uptime_info();
        else
            return ToolResult::error("Unknown info type: " + type);
        return ToolResult::ok(info);
    }
    catch (const std::exception& e)
    {
        return ToolResult::error(std::string("Error getting system info: ") + e.what());
    }
}

} // namespace mcptools::tools::builtin

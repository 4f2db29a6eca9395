#pragma once
#include "mcptools/exceptions.hpp"
#include "mcptools/types.hpp"

#include <string>

namespace mcptools::internal
{

inline void require_object(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("arguments must be an object");
}

/// Reads an optional string field; absent or null yields the default.
inline std::string string_arg(const Json& j, const char* key, const std::string& defv = "")
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return defv;
    if (!it->is_string())
        throw ValidationError(std::string("'") + key + "' must be a string");
    return it->get<std::string>();
}

} // namespace mcptools::internal

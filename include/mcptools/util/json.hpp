#pragma once
#include <string>
#include "mcptools/types.hpp"

namespace mcptools::util::json {

using json = mcptools::Json;

inline json parse(const std::string& s) { return json::parse(s); }

// Single-line form written to the wire: compact, non-ASCII escaped, invalid UTF-8 replaced.
inline std::string dump_line(const json& j)
{
  return j.dump(-1, ' ', true, json::error_handler_t::replace);
}

// Renders a request field for messages: strings verbatim, anything else as JSON text.
inline std::string display(const json& j)
{
  if (j.is_string()) return j.get<std::string>();
  return j.dump();
}

} // namespace mcptools::util::json

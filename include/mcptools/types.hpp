#pragma once
#include <nlohmann/json.hpp>

namespace mcptools
{

// Insertion-ordered so descriptors and responses keep their declared key order on the wire.
using Json = nlohmann::ordered_json;

} // namespace mcptools

#pragma once
#include <string>
#include <vector>

namespace mcptools::internal::utf8
{

bool is_valid(const std::string& s);

/// Splits into code point sequences. A byte that does not start a well-formed sequence
/// becomes a unit of its own, so joining the units always reproduces the input.
std::vector<std::string> split_code_points(const std::string& s);

size_t count_code_points(const std::string& s);

} // namespace mcptools::internal::utf8

#pragma once
#include "mcptools/exceptions.hpp"
#include "mcptools/types.hpp"

namespace mcptools::util::schema
{

// Minimal JSON Schema validator for tool input schemas, supporting:
// - type: object, array, string, number, integer, boolean
// - required: [..]
// - properties: { name: { type: ..., enum: [..] } }
//
// Throws ValidationError naming the first violation.
void validate(const Json& schema, const Json& instance);

} // namespace mcptools::util::schema

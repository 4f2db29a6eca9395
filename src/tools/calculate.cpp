#include "internal/arguments.hpp"
#include "mcptools/exceptions.hpp"
#include "mcptools/tools/builtin.hpp"
#include "mcptools/tools/calculator.hpp"

namespace mcptools::tools::builtin
{

void from_json(const Json& j, CalculateArgs& args)
{
    internal::require_object(j);
    args.expression = internal::string_arg(j, "expression");
}

ToolResult calculate(const CalculateArgs& args)
{
    if (!calculator::is_allowed(args.expression))
        return ToolResult::error("Invalid expression: only numbers and basic operators (+, -, *, "
                                 "/, parentheses) are allowed");

    try
    {
        auto value = calculator::evaluate(args.expression);
        return ToolResult::ok(args.expression + " = " + calculator::format(value));
    }
    catch (const EvaluationError& e)
    {
        return ToolResult::error("Error calculating '" + args.expression + "': " + e.what());
    }
}

} // namespace mcptools::tools::builtin

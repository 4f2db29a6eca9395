#pragma once
#include <string>

namespace mcptools::tools::calculator
{

/// Result of evaluating an arithmetic expression. Integer arithmetic stays integral;
/// a decimal literal, a division or a result beyond 64 bits makes the value real.
struct Value
{
    bool is_integer{true};
    long long integer{0};
    double real{0.0};

    static Value of_integer(long long v)
    {
        return Value{true, v, 0.0};
    }
    static Value of_real(double v)
    {
        return Value{false, 0, v};
    }

    double as_double() const
    {
        return is_integer ? static_cast<double>(integer) : real;
    }
};

/// Allow-list check: digits, whitespace, parentheses, '.', and + - * / only.
bool is_allowed(const std::string& expression);

/// Recursive-descent evaluation with the usual precedence (unary sign, then * /, then + -)
/// and left associativity. Throws EvaluationError on syntax errors and division by zero.
Value evaluate(const std::string& expression);

/// Integers print as is; reals print in shortest round-trip form, fixed notation for
/// exponents in [-4, 16) with a ".0" suffix when integral, scientific otherwise.
std::string format(const Value& value);

} // namespace mcptools::tools::calculator

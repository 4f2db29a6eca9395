#include "mcptools/tools/calculator.hpp"

#include "mcptools/exceptions.hpp"

#include <cctype>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <regex>

namespace mcptools::tools::calculator
{

namespace
{

constexpr int kMaxDepth = 200;

// Integer results that do not fit in 64 bits continue as reals.
bool add_overflows(long long a, long long b)
{
    return (b > 0 && a > LLONG_MAX - b) || (b < 0 && a < LLONG_MIN - b);
}

bool sub_overflows(long long a, long long b)
{
    return (b < 0 && a > LLONG_MAX + b) || (b > 0 && a < LLONG_MIN + b);
}

bool mul_overflows(long long a, long long b)
{
    if (a > 0)
        return b > 0 ? a > LLONG_MAX / b : b < LLONG_MIN / a;
    if (b > 0)
        return a < LLONG_MIN / b;
    return a != 0 && b < LLONG_MAX / a;
}

Value add(const Value& a, const Value& b)
{
    if (a.is_integer && b.is_integer && !add_overflows(a.integer, b.integer))
        return Value::of_integer(a.integer + b.integer);
    return Value::of_real(a.as_double() + b.as_double());
}

Value subtract(const Value& a, const Value& b)
{
    if (a.is_integer && b.is_integer && !sub_overflows(a.integer, b.integer))
        return Value::of_integer(a.integer - b.integer);
    return Value::of_real(a.as_double() - b.as_double());
}

Value multiply(const Value& a, const Value& b)
{
    if (a.is_integer && b.is_integer && !mul_overflows(a.integer, b.integer))
        return Value::of_integer(a.integer * b.integer);
    return Value::of_real(a.as_double() * b.as_double());
}

Value divide(const Value& a, const Value& b)
{
    if (b.as_double() == 0.0)
        throw EvaluationError(a.is_integer && b.is_integer ? "division by zero"
                                                           : "float division by zero");
    return Value::of_real(a.as_double() / b.as_double());
}

Value negate(const Value& v)
{
    if (v.is_integer && v.integer != LLONG_MIN)
        return Value::of_integer(-v.integer);
    return Value::of_real(-v.as_double());
}

class Parser
{
  public:
    explicit Parser(const std::string& src) : src_(src) {}

    Value parse()
    {
        skip_ws();
        if (at_end())
            throw EvaluationError("invalid syntax: empty expression");
        Value v = expression(0);
        skip_ws();
        if (!at_end())
            throw unexpected();
        return v;
    }

  private:
    // expression := term (('+' | '-') term)*
    Value expression(int depth)
    {
        Value lhs = term(depth);
        for (;;)
        {
            skip_ws();
            char op = peek();
            if (op != '+' && op != '-')
                return lhs;
            ++pos_;
            Value rhs = term(depth);
            lhs = op == '+' ? add(lhs, rhs) : subtract(lhs, rhs);
        }
    }

    // term := unary (('*' | '/') unary)*
    Value term(int depth)
    {
        Value lhs = unary(depth);
        for (;;)
        {
            skip_ws();
            char op = peek();
            if (op != '*' && op != '/')
                return lhs;
            ++pos_;
            Value rhs = unary(depth);
            lhs = op == '*' ? multiply(lhs, rhs) : divide(lhs, rhs);
        }
    }

    // unary := ('+' | '-') unary | primary
    Value unary(int depth)
    {
        if (depth > kMaxDepth)
            throw EvaluationError("expression is nested too deeply");
        skip_ws();
        char c = peek();
        if (c == '+')
        {
            ++pos_;
            return unary(depth + 1);
        }
        if (c == '-')
        {
            ++pos_;
            return negate(unary(depth + 1));
        }
        return primary(depth);
    }

    // primary := number | '(' expression ')'
    Value primary(int depth)
    {
        skip_ws();
        if (at_end())
            throw EvaluationError("invalid syntax: unexpected end of expression");
        char c = peek();
        if (c == '(')
        {
            size_t open = pos_++;
            Value v = expression(depth + 1);
            skip_ws();
            if (at_end())
                throw EvaluationError("invalid syntax: '(' at position " +
                                      std::to_string(open + 1) + " was never closed");
            if (peek() != ')')
                throw unexpected();
            ++pos_;
            return v;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.')
            return number();
        throw unexpected();
    }

    Value number()
    {
        size_t start = pos_;
        bool has_dot = false;
        size_t digits = 0;
        while (!at_end())
        {
            char c = peek();
            if (std::isdigit(static_cast<unsigned char>(c)))
                ++digits;
            else if (c == '.' && !has_dot)
                has_dot = true;
            else
                break;
            ++pos_;
        }
        std::string text = src_.substr(start, pos_ - start);
        if (digits == 0)
        {
            pos_ = start;
            throw unexpected();
        }

        if (has_dot)
            return Value::of_real(std::strtod(text.c_str(), nullptr));

        if (text.size() > 1 && text[0] == '0' && text.find_first_not_of('0') != std::string::npos)
            throw EvaluationError(
                "invalid syntax: leading zeros in decimal integer literals are not permitted");
        long long v = 0;
        for (char d : text)
        {
            int digit = d - '0';
            if (v > (LLONG_MAX - digit) / 10)
                return Value::of_real(std::strtod(text.c_str(), nullptr));
            v = v * 10 + digit;
        }
        return Value::of_integer(v);
    }

    EvaluationError unexpected() const
    {
        if (at_end())
            return EvaluationError("invalid syntax: unexpected end of expression");
        return EvaluationError(std::string("invalid syntax: unexpected '") + src_[pos_] +
                               "' at position " + std::to_string(pos_ + 1));
    }

    void skip_ws()
    {
        while (!at_end() && std::isspace(static_cast<unsigned char>(src_[pos_])))
            ++pos_;
    }

    bool at_end() const
    {
        return pos_ >= src_.size();
    }

    char peek() const
    {
        return at_end() ? '\0' : src_[pos_];
    }

    const std::string& src_;
    size_t pos_{0};
};

std::string format_real(double v)
{
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v > 0 ? "inf" : "-inf";

    // Shortest scientific rendering that round-trips.
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, v);
        if (std::strtod(buf, nullptr) == v)
            break;
    }

    std::string sci(buf);
    std::string sign;
    size_t i = 0;
    if (sci[i] == '-')
    {
        sign = "-";
        ++i;
    }
    size_t e = sci.find('e');
    std::string digits;
    for (size_t k = i; k < e; ++k)
        if (sci[k] != '.')
            digits += sci[k];
    int exponent = std::atoi(sci.c_str() + e + 1);
    while (digits.size() > 1 && digits.back() == '0')
        digits.pop_back();

    if (exponent >= -4 && exponent < 16)
    {
        std::string out;
        if (exponent >= 0)
        {
            size_t int_len = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= int_len)
                out = digits + std::string(int_len - digits.size(), '0') + ".0";
            else
                out = digits.substr(0, int_len) + "." + digits.substr(int_len);
        }
        else
        {
            out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
        return sign + out;
    }

    std::string mantissa = digits.substr(0, 1);
    if (digits.size() > 1)
        mantissa += "." + digits.substr(1);
    char exp_buf[16];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                  exponent < 0 ? -exponent : exponent);
    return sign + mantissa + exp_buf;
}

} // namespace

bool is_allowed(const std::string& expression)
{
    static const std::regex pattern(R"(^[0-9+\-*/().\s]+$)");
    return std::regex_match(expression, pattern);
}

Value evaluate(const std::string& expression)
{
    return Parser(expression).parse();
}

std::string format(const Value& value)
{
    if (value.is_integer)
        return std::to_string(value.integer);
    return format_real(value.real);
}

} // namespace mcptools::tools::calculator

#include "operations.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>

#include <fmt/format.h>

#include "errors.hpp"

namespace scicalc
{
using UnaryFunc = std::function<Number(const Number&)>;
using BinaryFunc = std::function<Number(const Number&, const Number&)>;

struct UnaryOpInfo
{
    std::string_view symbol;
    UnaryFunc func;
};

struct BinaryOpInfo
{
    std::string_view symbol;
    BinaryFunc func;
};

constexpr auto int64_max = std::numeric_limits<std::int64_t>::max();
constexpr auto int64_min = std::numeric_limits<std::int64_t>::min();

static std::optional<std::int64_t> checked_add(std::int64_t x, std::int64_t y)
{
    if ((y > 0 && x > int64_max - y) || (y < 0 && x < int64_min - y))
    {
        return std::nullopt;
    }
    return x + y;
}

static std::optional<std::int64_t> checked_sub(std::int64_t x, std::int64_t y)
{
    if ((y < 0 && x > int64_max + y) || (y > 0 && x < int64_min + y))
    {
        return std::nullopt;
    }
    return x - y;
}

static std::optional<std::int64_t> checked_mul(std::int64_t x, std::int64_t y)
{
    if (x > 0)
    {
        if ((y > 0 && x > int64_max / y) || (y <= 0 && y < int64_min / x))
        {
            return std::nullopt;
        }
    }
    else if ((y > 0 && x < int64_min / y) || (y <= 0 && x != 0 && y < int64_max / x))
    {
        return std::nullopt;
    }
    return x * y;
}

static std::optional<std::int64_t> checked_pow(std::int64_t base, std::int64_t exponent)
{
    std::optional<std::int64_t> result = 1;
    while (exponent > 0)
    {
        if (exponent & 1)
        {
            result = checked_mul(*result, base);
            if (!result)
            {
                return std::nullopt;
            }
        }
        exponent >>= 1;
        if (exponent > 0)
        {
            const auto square = checked_mul(base, base);
            if (!square)
            {
                return std::nullopt;
            }
            base = *square;
        }
    }
    return result;
}

static Number unary_sqrt(const Number& x)
{
    if (x.as_double() < 0.0)
    {
        throw Error{ ErrorKind::domain_error, "Cannot calculate square root of a negative number" };
    }
    return std::sqrt(x.as_double());
}

static Number binary_add(const Number& x, const Number& y)
{
    if (x.is_integer() && y.is_integer())
    {
        if (const auto res = checked_add(x.as_integer(), y.as_integer()))
        {
            return *res;
        }
    }
    return x.as_double() + y.as_double();
}

static Number binary_sub(const Number& x, const Number& y)
{
    if (x.is_integer() && y.is_integer())
    {
        if (const auto res = checked_sub(x.as_integer(), y.as_integer()))
        {
            return *res;
        }
    }
    return x.as_double() - y.as_double();
}

static Number binary_mul(const Number& x, const Number& y)
{
    if (x.is_integer() && y.is_integer())
    {
        if (const auto res = checked_mul(x.as_integer(), y.as_integer()))
        {
            return *res;
        }
    }
    return x.as_double() * y.as_double();
}

static Number binary_div(const Number& x, const Number& y)
{
    if (y.as_double() == 0.0)
    {
        throw Error{ ErrorKind::division_by_zero, "Cannot divide by zero" };
    }
    return x.as_double() / y.as_double();
}

static Number binary_pow(const Number& x, const Number& y)
{
    if (x.is_integer() && y.is_integer() && y.as_integer() >= 0)
    {
        if (const auto res = checked_pow(x.as_integer(), y.as_integer()))
        {
            return *res;
        }
    }
    const double base = x.as_double();
    const double exponent = y.as_double();
    if (base == 0.0 && exponent < 0.0)
    {
        throw Error{ ErrorKind::division_by_zero, "0 cannot be raised to a negative power" };
    }
    if (base < 0.0 && std::isfinite(exponent) && std::trunc(exponent) != exponent)
    {
        throw Error{ ErrorKind::domain_error,
                     fmt::format("{} ** {} has no real value", to_string(x), to_string(y)) };
    }
    return std::pow(base, exponent);
}

static Number binary_log(const Number& base, const Number& value)
{
    if (base.as_double() <= 0.0 || base.as_double() == 1.0)
    {
        throw Error{ ErrorKind::domain_error, "Log base must be positive and not equal to 1" };
    }
    if (value.as_double() <= 0.0)
    {
        throw Error{ ErrorKind::domain_error, "Cannot calculate logarithm of a non-positive number" };
    }
    return std::log(value.as_double()) / std::log(base.as_double());
}

static const std::array<UnaryOpInfo, 1> unary_op_info_list = { {
    { "sqrt", unary_sqrt },
} };

static const std::array<BinaryOpInfo, 6> binary_op_info_list = { {
    { "+", binary_add },
    { "-", binary_sub },
    { "*", binary_mul },
    { "/", binary_div },
    { "**", binary_pow },
    { "log", binary_log },
} };

template <class Container>
static const auto& find_op(const Container& op_info_list, std::string_view symbol)
{
    const auto it = std::find_if(
        op_info_list.begin(), op_info_list.end(), [&](const auto& op_info) { return op_info.symbol == symbol; });
    if (it == op_info_list.end())
    {
        throw Error{ ErrorKind::unknown_operation, fmt::format("Unknown operation '{}'", symbol) };
    }
    return *it;
}

double resolve_constant(std::string_view name)
{
    if (name == "pi")
    {
        return pi;
    }
    if (name == "e")
    {
        return e;
    }
    throw Error{ ErrorKind::invalid_operand, fmt::format("Invalid operand: {}", name) };
}

Number resolve(const Operand& operand)
{
    if (const auto* name = std::get_if<std::string>(&operand))
    {
        return resolve_constant(*name);
    }
    return std::get<Number>(operand);
}

static Number expect_finite(const Number& result, std::string_view operation)
{
    if (!std::isfinite(result.as_double()))
    {
        throw Error{ ErrorKind::domain_error, fmt::format("Result of '{}' out of range", operation) };
    }
    return result;
}

Number unary_operation(const Operand& a, std::string_view operation)
{
    const auto x = resolve(a);
    return expect_finite(find_op(unary_op_info_list, operation).func(x), operation);
}

Number binary_operation(const Operand& a, const Operand& b, std::string_view operation)
{
    const auto x = resolve(a);
    const auto y = resolve(b);
    return expect_finite(find_op(binary_op_info_list, operation).func(x, y), operation);
}

}  // namespace scicalc

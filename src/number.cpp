#include "number.hpp"

#include <cmath>
#include <cstdlib>
#include <ostream>
#include <string>

#include <fmt/format.h>

#include "errors.hpp"
#include "string_utils.hpp"

namespace scicalc
{
namespace
{
constexpr double int64_lower_bound = -9223372036854775808.0;
constexpr double int64_upper_bound = 9223372036854775808.0;

}  // namespace

// Out of range literals are not malformed: overflow yields +-inf and underflow
// yields zero or a denormal, as strtod reports them.
std::optional<Number> parse_number(std::string_view text)
{
    if (text.empty() || is_space(text.front()))
    {
        return std::nullopt;
    }
    const std::string buffer{ text };
    char* end = nullptr;
    const double res = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size())
    {
        return std::nullopt;
    }
    return Number{ res }.normalized();
}

std::int64_t Number::as_integer() const
{
    if (const auto* v = std::get_if<std::int64_t>(&value_))
    {
        return *v;
    }
    const auto normalized_value = normalized();
    if (!normalized_value.is_integer())
    {
        throw Error{ ErrorKind::invalid_operand, fmt::format("{} is not an integer", to_string(*this)) };
    }
    return normalized_value.as_integer();
}

double Number::as_double() const
{
    return std::visit([](auto v) { return static_cast<double>(v); }, value_);
}

Number Number::normalized() const
{
    const auto* v = std::get_if<double>(&value_);
    if (!v)
    {
        return *this;
    }
    if (std::isfinite(*v) && std::trunc(*v) == *v && *v >= int64_lower_bound && *v < int64_upper_bound)
    {
        return Number{ static_cast<std::int64_t>(*v) };
    }
    return *this;
}

bool operator==(const Number& lhs, const Number& rhs)
{
    if (lhs.is_integer() && rhs.is_integer())
    {
        return std::get<std::int64_t>(lhs.value_) == std::get<std::int64_t>(rhs.value_);
    }
    return lhs.as_double() == rhs.as_double();
}

std::ostream& operator<<(std::ostream& os, const Number& item)
{
    return os << to_string(item);
}

std::string to_string(const Number& number)
{
    return std::visit([](auto v) { return fmt::format("{}", v); }, number.value());
}

}  // namespace scicalc

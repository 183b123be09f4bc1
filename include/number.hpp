#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace scicalc
{
class Number
{
public:
    using value_type = std::variant<std::int64_t, double>;

    Number()
        : value_{ std::int64_t{ 0 } }
    {
    }

    template <class T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
    Number(T v)
        : value_{ static_cast<std::int64_t>(v) }
    {
    }

    template <class T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Number(T v)
        : value_{ static_cast<double>(v) }
    {
    }

    bool is_integer() const
    {
        return std::holds_alternative<std::int64_t>(value_);
    }

    std::int64_t as_integer() const;
    double as_double() const;

    const value_type& value() const
    {
        return value_;
    }

    // Integral doubles that fit into 64 bits become integers, everything else is returned as is.
    Number normalized() const;

    friend bool operator==(const Number& lhs, const Number& rhs);
    friend bool operator!=(const Number& lhs, const Number& rhs)
    {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const Number& item);

private:
    value_type value_;
};

std::string to_string(const Number& number);

// Parses the whole of text as a decimal number, normalized.
std::optional<Number> parse_number(std::string_view text);

}  // namespace scicalc

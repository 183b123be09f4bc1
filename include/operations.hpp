#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "number.hpp"

namespace scicalc
{
constexpr double pi = 3.14159265358979323846;
constexpr double e = 2.71828182845904523536;

// Either a number or the name of a constant ("pi", "e").
using Operand = std::variant<Number, std::string>;

double resolve_constant(std::string_view name);

Number resolve(const Operand& operand);

Number unary_operation(const Operand& a, std::string_view operation);

// For "log", a is the base and b is the value.
Number binary_operation(const Operand& a, const Operand& b, std::string_view operation);

}  // namespace scicalc

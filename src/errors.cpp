#include "errors.hpp"

#include <ostream>

namespace scicalc
{
std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::empty_expression: return "empty_expression";
        case ErrorKind::missing_parenthesis: return "missing_parenthesis";
        case ErrorKind::missing_argument_separator: return "missing_argument_separator";
        case ErrorKind::malformed_number: return "malformed_number";
        case ErrorKind::unexpected_trailing_input: return "unexpected_trailing_input";
        case ErrorKind::nesting_too_deep: return "nesting_too_deep";
        case ErrorKind::unknown_operation: return "unknown_operation";
        case ErrorKind::invalid_operand: return "invalid_operand";
        case ErrorKind::invalid_argument: return "invalid_argument";
        case ErrorKind::domain_error: return "domain_error";
        case ErrorKind::division_by_zero: return "division_by_zero";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
    return os << to_string(kind);
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error{ message }
    , kind_{ kind }
    , position_{}
{
}

Error::Error(ErrorKind kind, const std::string& message, std::size_t position)
    : std::runtime_error{ message }
    , kind_{ kind }
    , position_{ position }
{
}

}  // namespace scicalc

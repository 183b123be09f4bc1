#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scicalc
{
enum class ErrorKind
{
    empty_expression,
    missing_parenthesis,
    missing_argument_separator,
    malformed_number,
    unexpected_trailing_input,
    nesting_too_deep,
    unknown_operation,
    invalid_operand,
    invalid_argument,
    domain_error,
    division_by_zero,
};

std::string_view to_string(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

class Error : public std::runtime_error
{
public:
    Error(ErrorKind kind, const std::string& message);
    Error(ErrorKind kind, const std::string& message, std::size_t position);

    ErrorKind kind() const
    {
        return kind_;
    }

    // Offset into the whitespace-stripped expression, when the error came from the evaluator.
    std::optional<std::size_t> position() const
    {
        return position_;
    }

private:
    ErrorKind kind_;
    std::optional<std::size_t> position_;
};

}  // namespace scicalc

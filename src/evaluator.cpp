#include "evaluator.hpp"

#include <cctype>
#include <cmath>
#include <string>

#include <fmt/format.h>

#include "errors.hpp"
#include "operations.hpp"
#include "string_utils.hpp"

namespace scicalc
{
static bool is_number_char(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch)) || ch == '.';
}

struct ParseResult
{
    Number value;
    std::size_t pos;
};

struct Evaluator::Impl
{
    explicit Impl(EvaluatorOptions options)
        : options{ options }
    {
    }

    Number evaluate(std::string_view text) const
    {
        const auto expr = strip_whitespace(text);
        if (expr.empty())
        {
            throw Error{ ErrorKind::empty_expression, "Empty expression", 0 };
        }

        const auto [value, pos] = parse_expression(expr, 0, 0);
        if (pos < expr.size())
        {
            throw Error{ ErrorKind::unexpected_trailing_input,
                         fmt::format("Unexpected character at position {}: '{}'", pos, expr[pos]),
                         pos };
        }
        return value.normalized();
    }

    ParseResult parse_expression(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        auto result = parse_term(expr, pos, depth);
        while (at(expr, result.pos, '+') || at(expr, result.pos, '-'))
        {
            const auto op = expr.substr(result.pos, 1);
            const auto rhs = parse_term(expr, result.pos + 1, depth);
            result = { binary_operation(result.value, rhs.value, op), rhs.pos };
        }
        return result;
    }

    ParseResult parse_term(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        auto result = parse_factor(expr, pos, depth);
        while (at(expr, result.pos, '*') || at(expr, result.pos, '/'))
        {
            const auto op = expr.substr(result.pos, 1);
            const auto rhs = parse_factor(expr, result.pos + 1, depth);
            result = { binary_operation(result.value, rhs.value, op), rhs.pos };
        }
        return result;
    }

    ParseResult parse_factor(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        if (depth > options.max_depth)
        {
            throw Error{ ErrorKind::nesting_too_deep,
                         fmt::format("Expression nesting exceeds {} levels at position {}", options.max_depth, pos),
                         pos };
        }

        const auto rest = expr.substr(pos);
        if (starts_with(rest, "sqrt"))
        {
            return parse_sqrt(expr, pos + 4, depth);
        }
        if (starts_with(rest, "log"))
        {
            return parse_log(expr, pos + 3, depth);
        }
        if (at(expr, pos, '('))
        {
            return parse_group(expr, pos + 1, depth);
        }
        return parse_literal(expr, pos, depth);
    }

    ParseResult parse_sqrt(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        expect_open_paren(expr, pos, "sqrt");
        const auto arg = parse_expression(expr, pos + 1, depth + 1);
        expect_close_paren(expr, arg.pos, "sqrt function");
        return { unary_operation(arg.value, "sqrt"), arg.pos + 1 };
    }

    ParseResult parse_log(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        expect_open_paren(expr, pos, "log");
        const auto base = parse_expression(expr, pos + 1, depth + 1);
        if (!at(expr, base.pos, ','))
        {
            throw Error{ ErrorKind::missing_argument_separator,
                         fmt::format("log function requires two arguments separated by a comma (position {})", base.pos),
                         base.pos };
        }
        const auto value = parse_expression(expr, base.pos + 1, depth + 1);
        expect_close_paren(expr, value.pos, "log function");
        // The dispatcher takes the base first, so the arguments are handed over as (value, base).
        return { binary_operation(value.value, base.value, "log"), value.pos + 1 };
    }

    ParseResult parse_group(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        const auto inner = parse_expression(expr, pos, depth + 1);
        expect_close_paren(expr, inner.pos, "group");
        return parse_exponent(expr, { inner.value, inner.pos + 1 }, depth);
    }

    ParseResult parse_literal(std::string_view expr, std::size_t pos, std::size_t depth) const
    {
        const auto start = pos;
        if (at(expr, pos, '-'))
        {
            ++pos;
        }
        while (pos < expr.size() && is_number_char(expr[pos]))
        {
            ++pos;
        }
        if (start == pos)
        {
            throw Error{ ErrorKind::malformed_number, fmt::format("Expected number at position {}", pos), pos };
        }

        const auto literal = expr.substr(start, pos - start);
        const auto value = scicalc::parse_number(literal);
        if (!value)
        {
            throw Error{ ErrorKind::malformed_number, fmt::format("Invalid number format: {}", literal), start };
        }
        if (!std::isfinite(value->as_double()))
        {
            throw Error{ ErrorKind::domain_error, fmt::format("Number out of range: {}", literal), start };
        }
        return parse_exponent(expr, { *value, pos }, depth);
    }

    // Right associative: the exponent is a whole factor, so 2**3**2 is 2**(3**2).
    ParseResult parse_exponent(std::string_view expr, ParseResult base, std::size_t depth) const
    {
        if (!starts_with(expr.substr(base.pos), "**"))
        {
            return base;
        }
        const auto exponent = parse_factor(expr, base.pos + 2, depth + 1);
        return { binary_operation(base.value, exponent.value, "**"), exponent.pos };
    }

    static bool at(std::string_view expr, std::size_t pos, char ch)
    {
        return pos < expr.size() && expr[pos] == ch;
    }

    static void expect_open_paren(std::string_view expr, std::size_t pos, std::string_view function)
    {
        if (!at(expr, pos, '('))
        {
            throw Error{ ErrorKind::missing_parenthesis,
                         fmt::format("{} function requires parentheses (position {})", function, pos),
                         pos };
        }
    }

    static void expect_close_paren(std::string_view expr, std::size_t pos, std::string_view context)
    {
        if (!at(expr, pos, ')'))
        {
            throw Error{ ErrorKind::missing_parenthesis,
                         fmt::format("Missing closing parenthesis for {} at position {}", context, pos),
                         pos };
        }
    }

    EvaluatorOptions options;
};

Evaluator::Evaluator()
    : Evaluator{ EvaluatorOptions{} }
{
}

Evaluator::Evaluator(EvaluatorOptions options)
    : impl{ std::make_unique<Impl>(options) }
{
}

Evaluator::~Evaluator() = default;

const EvaluatorOptions& Evaluator::options() const
{
    return impl->options;
}

Number Evaluator::operator()(std::string_view text) const
{
    return impl->evaluate(text);
}

}  // namespace scicalc

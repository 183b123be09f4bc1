#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include "number.hpp"

namespace scicalc
{
struct EvaluatorOptions
{
    // Maximum nesting of parentheses, function arguments and exponents.
    std::size_t max_depth = 256;
};

/*
 * Parses and evaluates in a single pass:
 *
 *   expression := term (('+' | '-') term)*
 *   term       := factor (('*' | '/') factor)*
 *   factor     := 'sqrt' '(' expression ')'
 *               | 'log' '(' expression ',' expression ')'
 *               | '(' expression ')' ['**' factor]
 *               | number ['**' factor]
 *   number     := ['-'] (digit | '.')+
 *
 * Whitespace is removed before parsing. Failures are reported as scicalc::Error.
 */
struct Evaluator
{
public:
    Evaluator();
    explicit Evaluator(EvaluatorOptions options);
    ~Evaluator();

    const EvaluatorOptions& options() const;

    Number operator()(std::string_view text) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

static const inline auto evaluate = Evaluator{};

}  // namespace scicalc

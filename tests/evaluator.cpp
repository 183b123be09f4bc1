#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "evaluator.hpp"
#include "matchers.hpp"

using namespace ::testing;
using scicalc::ErrorKind;

scicalc::Number eval(std::string_view text)
{
    return scicalc::evaluate(text);
}

TEST(evaluator, empty_string_fails)
{
    ASSERT_THAT([] { return eval(""); }, fails_with(ErrorKind::empty_expression));
}

TEST(evaluator, all_whitespace_string_fails)
{
    ASSERT_THAT([] { return eval("  \t \n "); }, fails_with(ErrorKind::empty_expression));
}

TEST(evaluator, binary_operators_plus)
{
    ASSERT_THAT(eval("2.1 + 3.2").as_double(), DoubleEq(5.3));
    ASSERT_THAT(eval("2+3"), 5);
}

TEST(evaluator, binary_operators_minus)
{
    ASSERT_THAT(eval("2.1 - 3.2").as_double(), DoubleEq(-1.1));
    ASSERT_THAT(eval("5-2"), 3);
}

TEST(evaluator, binary_operators_multiplies)
{
    ASSERT_THAT(eval("2.1 * 3.2").as_double(), DoubleEq(6.72));
    ASSERT_THAT(eval("4*3"), 12);
}

TEST(evaluator, binary_operators_divides)
{
    ASSERT_THAT(eval("6.3 / 2.1").as_double(), DoubleEq(3.00));
    ASSERT_THAT(eval("10/2"), 5);
    ASSERT_THAT(eval("7 / 2").as_double(), DoubleEq(3.5));
}

TEST(evaluator, operator_precedence)
{
    ASSERT_THAT(eval("2 + 3 * 4"), 14);
    ASSERT_THAT(eval("(2 + 3) * 4"), 20);
    ASSERT_THAT(eval("2 + 3 * 4 - 5"), 9);
    ASSERT_THAT(eval("(2 + 3) * (4 - 1)"), 15);
    ASSERT_THAT(eval("10 / (2 + 3)"), 2);
    ASSERT_THAT(eval("2 ** 3 + 4"), 12);
}

TEST(evaluator, additive_operators_are_left_associative)
{
    ASSERT_THAT(eval("10 - 4 - 3"), 3);
    ASSERT_THAT(eval("16 / 4 / 2"), 2);
}

TEST(evaluator, exponent_is_right_associative)
{
    ASSERT_THAT(eval("2 ** 3 ** 2"), 512);
    ASSERT_THAT(eval("2 ** 3"), 8);
    ASSERT_THAT(eval("2**3"), 8);
    ASSERT_THAT(eval("(2 + 1) ** 2"), 9);
    ASSERT_THAT(eval("2 ** (1 + 2)"), 8);
    ASSERT_THAT(eval("2 ** -1").as_double(), DoubleEq(0.5));
}

TEST(evaluator, minus_sign_belongs_to_the_literal)
{
    ASSERT_THAT(eval("5 - -3"), 8);
    ASSERT_THAT(eval("-5 * -3"), 15);
    ASSERT_THAT(eval("-5 + 3"), -2);
    ASSERT_THAT(eval("5 + -3"), 2);
    ASSERT_THAT(eval("5 * -3"), -15);
    ASSERT_THAT(eval("-10 / 2"), -5);
    ASSERT_THAT(eval("10 / -2"), -5);
}

TEST(evaluator, sqrt_function)
{
    ASSERT_THAT(eval("sqrt(4)"), 2);
    ASSERT_THAT(eval("sqrt(9)"), 3);
    ASSERT_THAT(eval("sqrt(2 + 2)"), 2);
    ASSERT_THAT(eval("sqrt(3 ** 2)"), 3);
    ASSERT_THAT(eval("sqrt(2)").as_double(), DoubleEq(1.4142135623730951));
}

TEST(evaluator, nested_functions)
{
    ASSERT_THAT(eval("sqrt(16) + 2 ** 2"), 8);
    ASSERT_THAT(eval("(sqrt(16) + 2) ** 2"), 36);
    ASSERT_THAT(eval("sqrt(sqrt(81))"), 3);
}

TEST(evaluator, log_hands_arguments_to_dispatcher_as_value_then_base)
{
    // log(x, y) is the logarithm of x in base y.
    ASSERT_THAT(eval("log(8, 2)").as_double(), DoubleNear(3.0, 1e-12));
    ASSERT_THAT(eval("log(2, 8)").as_double(), DoubleNear(1.0 / 3.0, 1e-12));
    ASSERT_THAT(eval("log(1, 10)"), 0);
}

TEST(evaluator, log_domain_errors)
{
    ASSERT_THAT([] { return eval("log(8, 1)"); }, fails_with(ErrorKind::domain_error));
    ASSERT_THAT([] { return eval("log(8, 0)"); }, fails_with(ErrorKind::domain_error));
    ASSERT_THAT([] { return eval("log(-8, 2)"); }, fails_with(ErrorKind::domain_error));
    ASSERT_THAT([] { return eval("log(0, 2)"); }, fails_with(ErrorKind::domain_error));
}

TEST(evaluator, integral_results_are_normalized_to_integers)
{
    ASSERT_TRUE(eval("sqrt(4)").is_integer());
    ASSERT_TRUE(eval("2.0").is_integer());
    ASSERT_TRUE(eval("10 / 2").is_integer());
    ASSERT_FALSE(eval("2.5").is_integer());
    ASSERT_FALSE(eval("7 / 2").is_integer());
}

TEST(evaluator, whitespace_is_removed_everywhere)
{
    ASSERT_THAT(eval("1 0"), 10);
    ASSERT_THAT(eval("\t2 +\n3 "), 5);
    ASSERT_THAT(eval("s q r t ( 1 6 )"), 4);
}

TEST(evaluator, division_by_zero_fails)
{
    ASSERT_THAT([] { return eval("5 / 0"); }, fails_with(ErrorKind::division_by_zero));
    ASSERT_THAT([] { return eval("5 / (3 - 3)"); }, fails_with(ErrorKind::division_by_zero));
    ASSERT_THAT([] { return eval("0 ** -1"); }, fails_with(ErrorKind::division_by_zero));
}

TEST(evaluator, domain_errors)
{
    ASSERT_THAT([] { return eval("sqrt(-4)"); }, fails_with(ErrorKind::domain_error));
    ASSERT_THAT([] { return eval("(-8) ** (1 / 3)"); }, fails_with(ErrorKind::domain_error));
}

TEST(evaluator, missing_parenthesis_fails)
{
    ASSERT_THAT([] { return eval("(2 + 3"); }, fails_with(ErrorKind::missing_parenthesis));
    ASSERT_THAT([] { return eval("sqrt 4"); }, fails_with(ErrorKind::missing_parenthesis));
    ASSERT_THAT([] { return eval("sqrt(4"); }, fails_with(ErrorKind::missing_parenthesis));
    ASSERT_THAT([] { return eval("log 8, 2"); }, fails_with(ErrorKind::missing_parenthesis));
    ASSERT_THAT([] { return eval("log(8, 2"); }, fails_with(ErrorKind::missing_parenthesis));
    ASSERT_THAT([] { return eval("((1)"); }, fails_with(ErrorKind::missing_parenthesis));
}

TEST(evaluator, missing_argument_separator_fails)
{
    ASSERT_THAT([] { return eval("log(8)"); }, fails_with(ErrorKind::missing_argument_separator));
}

TEST(evaluator, malformed_number_fails)
{
    ASSERT_THAT([] { return eval("."); }, fails_with(ErrorKind::malformed_number));
    ASSERT_THAT([] { return eval("-"); }, fails_with(ErrorKind::malformed_number));
    ASSERT_THAT([] { return eval("1.2.3"); }, fails_with(ErrorKind::malformed_number));
    ASSERT_THAT([] { return eval("2 + * 3"); }, fails_with(ErrorKind::malformed_number));
    ASSERT_THAT([] { return eval("-(2)"); }, fails_with(ErrorKind::malformed_number));
    ASSERT_THAT([] { return eval("pi"); }, fails_with(ErrorKind::malformed_number));
}

TEST(evaluator, exponent_after_function_call_is_not_accepted)
{
    ASSERT_THAT([] { return eval("sqrt(4) ** 2"); }, fails_with(ErrorKind::malformed_number));
}

TEST(evaluator, trailing_input_fails)
{
    ASSERT_THAT([] { return eval("2 + 3)"); }, fails_with(ErrorKind::unexpected_trailing_input));
    ASSERT_THAT([] { return eval("5 ? 3"); }, fails_with(ErrorKind::unexpected_trailing_input));
    ASSERT_THAT([] { return eval("(1)(2)"); }, fails_with(ErrorKind::unexpected_trailing_input));
}

TEST(evaluator, errors_report_position_in_stripped_text)
{
    try
    {
        eval("2 + 3)");
        FAIL() << "expected scicalc::Error";
    }
    catch (const scicalc::Error& ex)
    {
        ASSERT_THAT(ex.position(), Optional(3u));
        ASSERT_THAT(ex.what(), HasSubstr("Unexpected character at position 3: ')'"));
    }
}

TEST(evaluator, nesting_limit_is_configurable)
{
    const auto shallow = scicalc::Evaluator{ scicalc::EvaluatorOptions{ 4 } };
    ASSERT_THAT(shallow("((1))"), 1);
    ASSERT_THAT([&] { return shallow("((((((1))))))"); }, fails_with(ErrorKind::nesting_too_deep));
    ASSERT_THAT([&] { return shallow("2 ** 2 ** 2 ** 2 ** 2 ** 2"); }, fails_with(ErrorKind::nesting_too_deep));
}

TEST(evaluator, default_nesting_limit_allows_deep_input)
{
    const auto depth = 100;
    const auto text = std::string(depth, '(') + "1" + std::string(depth, ')');
    ASSERT_THAT(eval(text), 1);
}

TEST(evaluator, evaluation_is_repeatable)
{
    const auto first = eval("(sqrt(16) + 2) ** 2 / 3");
    const auto second = eval("(sqrt(16) + 2) ** 2 / 3");
    ASSERT_THAT(first, Eq(second));
    ASSERT_THAT(first, 12);
}

TEST(evaluator, integer_overflow_falls_back_to_floating_point)
{
    const auto result = eval("3037000500 * 3037000500");
    ASSERT_FALSE(result.is_integer());
    ASSERT_THAT(result.as_double(), DoubleEq(9223372037000250000.0));
}

TEST(evaluator, literal_that_underflows_is_zero)
{
    ASSERT_THAT(eval("0." + std::string(400, '0') + "1").as_double(), DoubleEq(0.0));
    ASSERT_THAT(eval("1 + 0." + std::string(400, '0') + "1"), 1);
}

TEST(evaluator, literal_that_overflows_is_domain_error)
{
    ASSERT_THAT([] { return eval("1" + std::string(400, '0')); }, fails_with(ErrorKind::domain_error));
}

TEST(evaluator, result_out_of_range_is_domain_error)
{
    ASSERT_THAT([] { return eval("10 ** 400"); }, fails_with(ErrorKind::domain_error));
    ASSERT_THAT([] { return eval("10 ** 400 - 10 ** 400"); }, fails_with(ErrorKind::domain_error));
    ASSERT_FALSE(eval("2 ** 64 * 2 ** 64").is_integer());
}

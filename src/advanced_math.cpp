#include "advanced_math.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <numeric>

#include <fmt/format.h>

#include "errors.hpp"
#include "operations.hpp"

namespace scicalc
{
using MathFunc = std::function<double(double)>;

struct MathFuncInfo
{
    std::string_view name;
    MathFunc func;
};

static double apply(const std::vector<MathFuncInfo>& func_info_list, std::string_view name, double x)
{
    for (const auto& func_info : func_info_list)
    {
        if (func_info.name == name)
        {
            return func_info.func(x);
        }
    }
    throw Error{ ErrorKind::unknown_operation, fmt::format("Unknown operation '{}'", name) };
}

std::uint64_t factorial(std::int64_t n)
{
    if (n < 0)
    {
        throw Error{ ErrorKind::domain_error, "Factorial is not defined for negative numbers" };
    }
    // 21! no longer fits into 64 bits
    if (n > 20)
    {
        throw Error{ ErrorKind::domain_error, fmt::format("Factorial of {} does not fit into 64 bits", n) };
    }
    std::uint64_t result = 1;
    for (std::int64_t i = 2; i <= n; ++i)
    {
        result *= static_cast<std::uint64_t>(i);
    }
    return result;
}

std::uint64_t fibonacci(std::int64_t n)
{
    if (n < 0)
    {
        throw Error{ ErrorKind::domain_error, "Fibonacci is not defined for negative indices" };
    }
    if (n > 93)
    {
        throw Error{ ErrorKind::domain_error, fmt::format("Fibonacci number {} does not fit into 64 bits", n) };
    }
    if (n <= 1)
    {
        return static_cast<std::uint64_t>(n);
    }
    std::uint64_t a = 0;
    std::uint64_t b = 1;
    for (std::int64_t i = 2; i <= n; ++i)
    {
        a = std::exchange(b, a + b);
    }
    return b;
}

static double median(std::vector<double> numbers)
{
    std::sort(numbers.begin(), numbers.end());
    const auto mid = numbers.size() / 2;
    if (numbers.size() % 2 == 1)
    {
        return numbers[mid];
    }
    return (numbers[mid - 1] + numbers[mid]) / 2.0;
}

static std::optional<double> mode(const std::vector<double>& numbers)
{
    std::map<double, std::size_t> counts;
    for (double x : numbers)
    {
        ++counts[x];
    }
    const auto best = std::max_element(
        counts.begin(), counts.end(), [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });
    const auto ties = std::count_if(
        counts.begin(), counts.end(), [&](const auto& item) { return item.second == best->second; });
    if (ties > 1)
    {
        return std::nullopt;
    }
    return best->first;
}

Statistics calculate_statistics(const std::vector<double>& numbers)
{
    if (numbers.empty())
    {
        throw Error{ ErrorKind::invalid_argument, "Cannot calculate statistics on an empty list" };
    }

    const auto n = static_cast<double>(numbers.size());
    const auto [min_it, max_it] = std::minmax_element(numbers.begin(), numbers.end());

    Statistics result{};
    result.mean = std::accumulate(numbers.begin(), numbers.end(), 0.0) / n;
    result.median = median(numbers);
    result.mode = mode(numbers);
    result.min = *min_it;
    result.max = *max_it;
    result.range = *max_it - *min_it;

    if (numbers.size() > 1)
    {
        const auto sum_of_squares = std::accumulate(
            numbers.begin(), numbers.end(), 0.0, [&](double acc, double x) { return acc + (x - result.mean) * (x - result.mean); });
        result.variance = sum_of_squares / (n - 1.0);
        result.std_dev = std::sqrt(result.variance);
    }
    return result;
}

QuadraticSolution solve_quadratic(double a, double b, double c)
{
    if (a == 0.0)
    {
        throw Error{ ErrorKind::domain_error, "Coefficient 'a' cannot be zero in a quadratic equation" };
    }

    const double discriminant = b * b - 4.0 * a * c;
    if (discriminant >= 0.0)
    {
        const double root = std::sqrt(discriminant);
        return { discriminant, { { (-b + root) / (2.0 * a), 0.0 }, { (-b - root) / (2.0 * a), 0.0 } } };
    }

    const double real_part = -b / (2.0 * a);
    const double imag_part = std::sqrt(-discriminant) / (2.0 * a);
    return { discriminant, { { real_part, imag_part }, { real_part, -imag_part } } };
}

AngleUnit parse_angle_unit(std::string_view name)
{
    if (name == "deg")
    {
        return AngleUnit::deg;
    }
    if (name == "rad")
    {
        return AngleUnit::rad;
    }
    if (name == "grad")
    {
        return AngleUnit::grad;
    }
    throw Error{ ErrorKind::invalid_operand, fmt::format("Invalid unit '{}', units must be one of: deg, rad, grad", name) };
}

static double to_radians(double angle, AngleUnit unit)
{
    switch (unit)
    {
        case AngleUnit::deg: return angle * (pi / 180.0);
        case AngleUnit::grad: return angle * (pi / 200.0);
        case AngleUnit::rad: return angle;
    }
    return angle;
}

static double from_radians(double radians, AngleUnit unit)
{
    switch (unit)
    {
        case AngleUnit::deg: return radians * (180.0 / pi);
        case AngleUnit::grad: return radians * (200.0 / pi);
        case AngleUnit::rad: return radians;
    }
    return radians;
}

double convert_angle(double angle, AngleUnit from, AngleUnit to)
{
    return from_radians(to_radians(angle, from), to);
}

double convert_angle(double angle, std::string_view from, std::string_view to)
{
    return convert_angle(angle, parse_angle_unit(from), parse_angle_unit(to));
}

double trigonometric_operation(double angle, std::string_view operation)
{
    static const std::vector<MathFuncInfo> func_info_list = {
        { "sin", [](double x) { return std::sin(x); } },
        { "cos", [](double x) { return std::cos(x); } },
        { "tan", [](double x) { return std::tan(x); } },
    };
    return apply(func_info_list, operation, angle);
}

double hyperbolic_operation(double x, std::string_view operation)
{
    static const std::vector<MathFuncInfo> func_info_list = {
        { "sinh", [](double v) { return std::sinh(v); } },
        { "cosh", [](double v) { return std::cosh(v); } },
        { "tanh", [](double v) { return std::tanh(v); } },
    };
    return apply(func_info_list, operation, x);
}

}  // namespace scicalc

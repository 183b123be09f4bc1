#pragma once

#include <complex>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace scicalc
{
std::uint64_t factorial(std::int64_t n);

std::uint64_t fibonacci(std::int64_t n);

struct Statistics
{
    double mean;
    double median;
    std::optional<double> mode;  // empty when several values are equally frequent
    double min;
    double max;
    double range;
    double variance;
    double std_dev;
};

Statistics calculate_statistics(const std::vector<double>& numbers);

struct QuadraticSolution
{
    double discriminant;
    std::pair<std::complex<double>, std::complex<double>> roots;

    bool has_real_roots() const
    {
        return discriminant >= 0.0;
    }
};

// Roots of a*x^2 + b*x + c = 0.
QuadraticSolution solve_quadratic(double a, double b, double c);

enum class AngleUnit
{
    deg,
    rad,
    grad,
};

AngleUnit parse_angle_unit(std::string_view name);

double convert_angle(double angle, AngleUnit from, AngleUnit to);
double convert_angle(double angle, std::string_view from, std::string_view to);

double trigonometric_operation(double angle, std::string_view operation);

double hyperbolic_operation(double x, std::string_view operation);

}  // namespace scicalc

#include "commands.hpp"

#include <algorithm>
#include <cmath>
#include <complex>

#include <fmt/format.h>

#include "advanced_math.hpp"
#include "errors.hpp"
#include "operations.hpp"
#include "string_utils.hpp"

namespace scicalc
{
static std::string join(const Args& args, std::string_view separator)
{
    std::string result;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (i > 0)
        {
            result += separator;
        }
        result += args[i];
    }
    return result;
}

static void expect_arity(const Args& args, std::size_t count, std::string_view usage)
{
    if (args.size() != count)
    {
        throw Error{ ErrorKind::invalid_argument,
                     fmt::format("expected {} argument(s), got {} (usage: {})", count, args.size(), usage) };
    }
}

static Operand parse_operand(std::string_view text)
{
    if (const auto number = parse_number(text))
    {
        return *number;
    }
    return std::string{ text };
}

static double parse_real(std::string_view text)
{
    if (const auto number = parse_number(text); number && std::isfinite(number->as_double()))
    {
        return number->as_double();
    }
    if (text == "pi" || text == "e")
    {
        return resolve_constant(text);
    }
    throw Error{ ErrorKind::invalid_argument, fmt::format("'{}' is not a number", text) };
}

static std::int64_t parse_integer(std::string_view text)
{
    const auto number = parse_number(text);
    if (!number || !number->is_integer())
    {
        throw Error{ ErrorKind::invalid_argument, fmt::format("'{}' is not an integer", text) };
    }
    return number->as_integer();
}

static std::string format_root(const std::complex<double>& z)
{
    if (z.imag() == 0.0)
    {
        return fmt::format("{}", z.real());
    }
    return fmt::format("{}{:+}i", z.real(), z.imag());
}

static std::string format_statistics(const Statistics& stats)
{
    return fmt::format(
        "mean = {}\nmedian = {}\nmode = {}\nmin = {}\nmax = {}\nrange = {}\nvariance = {}\nstd_dev = {}",
        stats.mean,
        stats.median,
        stats.mode ? fmt::format("{}", *stats.mode) : std::string{ "none" },
        stats.min,
        stats.max,
        stats.range,
        stats.variance,
        stats.std_dev);
}

struct Dispatcher::Impl
{
    explicit Impl(EvaluatorOptions options)
        : evaluator{ options }
    {
    }

    void register_command(std::string name, std::string usage, Command func)
    {
        command_info_list.push_back(CommandInfo{ std::move(name), std::move(usage), std::move(func) });
    }

    const CommandInfo* find(std::string_view name) const
    {
        for (const auto& info : command_info_list)
        {
            if (info.name == name)
            {
                return &info;
            }
        }
        return nullptr;
    }

    std::string handle(std::string_view request) const
    {
        const auto words = split_whitespace(request);
        if (!words.empty())
        {
            if (const auto* info = find(words.front()))
            {
                return info->func(Args(words.begin() + 1, words.end()));
            }
        }
        return to_string(evaluator(request));
    }

    Evaluator evaluator;
    std::vector<CommandInfo> command_info_list;
};

Dispatcher::Dispatcher()
    : Dispatcher{ EvaluatorOptions{} }
{
}

Dispatcher::Dispatcher(EvaluatorOptions options)
    : impl{ std::make_unique<Impl>(options) }
{
    const Impl* self = impl.get();

    register_command("calc", "calc <expression>", [self](const Args& args) {
        return to_string(self->evaluator(join(args, " ")));
    });
    register_command("unary", "unary <a> <operation>", [](const Args& args) {
        expect_arity(args, 2, "unary <a> <operation>");
        return to_string(unary_operation(parse_operand(args[0]), args[1]).normalized());
    });
    register_command("binary", "binary <a> <b> <operation>", [](const Args& args) {
        expect_arity(args, 3, "binary <a> <b> <operation>");
        return to_string(binary_operation(parse_operand(args[0]), parse_operand(args[1]), args[2]).normalized());
    });
    register_command("factorial", "factorial <n>", [](const Args& args) {
        expect_arity(args, 1, "factorial <n>");
        return fmt::format("{}", factorial(parse_integer(args[0])));
    });
    register_command("fibonacci", "fibonacci <n>", [](const Args& args) {
        expect_arity(args, 1, "fibonacci <n>");
        return fmt::format("{}", fibonacci(parse_integer(args[0])));
    });
    register_command("stats", "stats <x> [<x>...]", [](const Args& args) {
        std::vector<double> numbers(args.size());
        std::transform(args.begin(), args.end(), numbers.begin(), parse_real);
        return format_statistics(calculate_statistics(numbers));
    });
    register_command("quadratic", "quadratic <a> <b> <c>", [](const Args& args) {
        expect_arity(args, 3, "quadratic <a> <b> <c>");
        const auto solution = solve_quadratic(parse_real(args[0]), parse_real(args[1]), parse_real(args[2]));
        return fmt::format(
            "discriminant = {}\nx1 = {}\nx2 = {}",
            solution.discriminant,
            format_root(solution.roots.first),
            format_root(solution.roots.second));
    });
    register_command("angle", "angle <value> <deg|rad|grad> <deg|rad|grad>", [](const Args& args) {
        expect_arity(args, 3, "angle <value> <deg|rad|grad> <deg|rad|grad>");
        return fmt::format("{} {}", convert_angle(parse_real(args[0]), args[1], args[2]), args[2]);
    });
    for (const auto* name : { "sin", "cos", "tan" })
    {
        register_command(name, fmt::format("{} <radians>", name), [name](const Args& args) {
            expect_arity(args, 1, fmt::format("{} <radians>", name));
            return fmt::format("{}", trigonometric_operation(parse_real(args[0]), name));
        });
    }
    for (const auto* name : { "sinh", "cosh", "tanh" })
    {
        register_command(name, fmt::format("{} <x>", name), [name](const Args& args) {
            expect_arity(args, 1, fmt::format("{} <x>", name));
            return fmt::format("{}", hyperbolic_operation(parse_real(args[0]), name));
        });
    }
    register_command("help", "help", [self](const Args&) {
        std::string result = "<expression>";
        for (const auto& info : self->command_info_list)
        {
            result += "\n" + info.usage;
        }
        return result;
    });
}

Dispatcher::~Dispatcher() = default;

void Dispatcher::register_command(std::string name, std::string usage, Command func)
{
    impl->register_command(std::move(name), std::move(usage), std::move(func));
}

bool Dispatcher::has_command(std::string_view name) const
{
    return impl->find(name) != nullptr;
}

const std::vector<CommandInfo>& Dispatcher::commands() const
{
    return impl->command_info_list;
}

std::string Dispatcher::operator()(std::string_view request) const
{
    return impl->handle(request);
}

}  // namespace scicalc

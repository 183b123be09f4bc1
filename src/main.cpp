#include <cstdlib>
#include <deque>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "ansi.hpp"
#include "commands.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

struct Config
{
    std::optional<std::string> request;
    std::size_t history_size = 10;
};

std::optional<std::string> read_line(std::istream& is, std::function<void(std::ostream& os)> prompt)
{
    prompt(std::cout);
    std::string line;
    if (!std::getline(is, line))
    {
        return std::nullopt;
    }
    return line;
}

struct History
{
    struct Entry
    {
        std::string request;
        std::string response;
    };

    void push(std::string request, std::string response)
    {
        if (max_size == 0)
        {
            return;
        }
        if (entries.size() == max_size)
        {
            entries.pop_back();
        }
        entries.push_front({ std::move(request), std::move(response) });
    }

    std::size_t max_size;
    std::deque<Entry> entries;
};

void print_usage(std::ostream& os, std::string_view program)
{
    os << "usage: " << program << " [-e|--eval <request>] [--history <n>] [--no-color] [-h|--help]\n";
}

void report(const std::exception& ex)
{
    using namespace ansi;

    if (const auto* error = dynamic_cast<const scicalc::Error*>(&ex))
    {
        std::cerr << fg(color::red) << "error[" << error->kind() << "]: " << reset << error->what() << '\n';
    }
    else
    {
        std::cerr << fg(color::red) << "exception: " << reset << ex.what() << '\n';
    }
}

std::optional<Config> parse_args(int argc, char* argv[])
{
    Config config{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if ((arg == "-e" || arg == "--eval") && i + 1 < argc)
        {
            config.request = argv[++i];
        }
        else if (arg == "--history" && i + 1 < argc)
        {
            const auto size = scicalc::parse_number(argv[++i]);
            if (!size || !size->is_integer() || size->as_integer() < 0)
            {
                return std::nullopt;
            }
            config.history_size = static_cast<std::size_t>(size->as_integer());
        }
        else if (arg == "--no-color")
        {
            ansi::enabled = false;
        }
        else
        {
            return std::nullopt;
        }
    }
    return config;
}

int main(int argc, char* argv[])
{
    using namespace ansi;

    const std::string_view program = argc > 0 ? argv[0] : "scicalc";
    for (int i = 1; i < argc; ++i)
    {
        if (std::string_view{ argv[i] } == "-h" || std::string_view{ argv[i] } == "--help")
        {
            print_usage(std::cout, program);
            return EXIT_SUCCESS;
        }
    }

    const auto config = parse_args(argc, argv);
    if (!config)
    {
        print_usage(std::cerr, program);
        return 2;
    }

    const auto dispatcher = scicalc::Dispatcher{};

    if (config->request)
    {
        try
        {
            std::cout << dispatcher(*config->request) << std::endl;
            return EXIT_SUCCESS;
        }
        catch (const std::exception& ex)
        {
            report(ex);
            return EXIT_FAILURE;
        }
    }

    auto history = History{ config->history_size };

    while (true)
    {
        const auto line = read_line(std::cin, [](std::ostream& os) { os << fg(color::green) << "> " << reset; });
        if (!line || *line == "quit" || *line == "exit")
        {
            break;
        }
        if (scicalc::trim_whitespace(*line).empty())
        {
            continue;
        }
        if (*line == "history")
        {
            for (const auto& [request, response] : history.entries)
            {
                std::cout << "  " << request << " = " << response << std::endl;
            }
            continue;
        }

        try
        {
            auto response = dispatcher(*line);
            std::cout << fg(color::yellow) << response << reset << std::endl;
            history.push(*line, std::move(response));
        }
        catch (const std::exception& ex)
        {
            report(ex);
        }
    }
    return EXIT_SUCCESS;
}

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "evaluator.hpp"

namespace scicalc
{
using Args = std::vector<std::string_view>;

using Command = std::function<std::string(const Args&)>;

struct CommandInfo
{
    std::string name;
    std::string usage;
    Command func;
};

/*
 * Maps a request line "<name> <args...>" to a registered command and returns its response text.
 * A line whose first word is not a command is evaluated as an expression.
 */
struct Dispatcher
{
public:
    Dispatcher();
    explicit Dispatcher(EvaluatorOptions options);
    ~Dispatcher();

    void register_command(std::string name, std::string usage, Command func);

    bool has_command(std::string_view name) const;

    const std::vector<CommandInfo>& commands() const;

    std::string operator()(std::string_view request) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

}  // namespace scicalc

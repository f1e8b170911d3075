#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <format>
#include <optional>
#include <print>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lang/Ast.hpp"
#include "simulations/Scheduler.hpp"
#include "Util.hpp"

namespace Interpreter
{

struct [[nodiscard]] Value final
{
    using ValueType = std::variant<std::string_view, std::int64_t, std::vector<Value>, std::monostate>;

    Value()
      : value { std::monostate {} }
    {}

    explicit Value(const std::string_view string)
      : value { string }
    {}

    explicit Value(const std::int64_t number)
      : value { number }
    {}

    explicit Value(const std::vector<Value>& values)
      : value { values }
    {}

    [[nodiscard]] constexpr auto is_string() const -> bool { return std::holds_alternative<std::string_view>(value); }

    [[nodiscard]] constexpr auto as_string() const -> std::string_view
    {
        return Util::get<std::string_view>(value).value();
    }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_string_or(Callback callback) const -> std::optional<std::string_view>
    {
        return is_string() ? as_string() : callback();
    }

    [[nodiscard]] constexpr auto is_number() const -> bool { return std::holds_alternative<std::int64_t>(value); }

    [[nodiscard]] constexpr auto as_number() const -> std::int64_t { return Util::get<std::int64_t>(value).value(); }

    template<std::invocable Callback>
    [[nodiscard]] constexpr auto as_number_or(Callback callback) const -> std::optional<std::int64_t>
    {
        return is_number() ? as_number() : callback();
    }

    [[nodiscard]] constexpr auto is_value_list() const -> bool
    {
        return std::holds_alternative<std::vector<Value>>(value);
    }

    [[nodiscard]] constexpr auto is_monostate() const -> bool { return std::holds_alternative<std::monostate>(value); }

  private:
    ValueType value;
};

// Bounds used by `spawn_random_process`, all settable through script constants.
struct [[nodiscard]] RandomLimits final
{
    std::uint64_t seed             = 0;
    Os::Tick      max_arrival_time = 50;
    Os::Tick      max_burst_time   = 20;
    std::int64_t  min_nice         = Os::NICE_MIN;
    std::int64_t  max_nice         = Os::NICE_MAX;
};

// Turns a workload script into a Workload. Workload validation is left to Scheduler::create.
class [[nodiscard]] Interpreter final
{
  public:
    [[nodiscard]] static auto eval(const std::string_view file_content) -> std::optional<Simulations::Workload>;

  private:
    explicit Interpreter(const std::string_view source, Ast ast);

    [[nodiscard]] auto evaluate_ast() -> bool;
    [[nodiscard]] auto evaluate_statement(const Statement& statement) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_expression(const Expression& expression) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_constant(const Constant& constant, const Span span) -> std::optional<Value>;
    [[nodiscard]] auto evaluate_for_expression(const For& four) -> std::optional<Value>;

    [[nodiscard]] auto builtin_handler(const Token& name, const std::vector<ExpressionId>& arguments)
      -> std::optional<Value>;
    [[nodiscard]] auto spawn_process_builtin(const Token& name, const std::vector<Expression>& arguments)
      -> std::optional<Value>;
    [[nodiscard]] auto spawn_random_process_builtin(const Token& name, const std::vector<Expression>& arguments)
      -> std::optional<Value>;

    [[nodiscard]] auto natural_argument(
      const Expression&      argument,
      const std::size_t      idx,
      const std::string_view builtin
    ) -> std::optional<std::size_t>;
    [[nodiscard]] auto pid_is_taken(const std::size_t pid) const -> bool;

    [[nodiscard]] auto materialize_expressions(const std::vector<ExpressionId>& expr_ids) const
      -> std::vector<Expression>;

    [[nodiscard]] auto line_of(const Span& span) const -> std::size_t { return span.line_in(source); }

    [[nodiscard]] constexpr static auto is_builtin(const Token& token) -> bool
    {
        constexpr static std::string_view builtins[] = { "spawn_process", "spawn_random_process" };
        return std::ranges::contains(builtins, token.lexeme);
    }

    template<typename... Args>
    static auto report_error(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[ERROR] (interpreter) {}", std::format(message, std::forward<Args>(args)...));
        return std::nullopt;
    }

    template<typename... Args>
    static auto report_note(std::format_string<Args...> message, Args&&... args) -> std::nullopt_t
    {
        std::println(stderr, "[NOTE] (interpreter) {}", std::format(message, std::forward<Args>(args)...));
        return std::nullopt;
    }

  private:
    std::string_view      source;
    Ast                   ast;
    Simulations::Workload workload;
    RandomLimits          limits;
    Util::Random          random;
};

} // namespace Interpreter

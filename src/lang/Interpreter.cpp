#include "Interpreter.hpp"

#include <ranges>

#include "lang/Lexer.hpp"
#include "lang/Parser.hpp"

// Linux default pid_max.
constexpr static std::size_t MAX_RANDOM_PID = 32768;

namespace Interpreter
{

auto Interpreter::eval(const std::string_view file_content) -> std::optional<Simulations::Workload>
{
    const auto tokens = TRY(Lexer::lex(file_content));

#ifdef DEBUG
    std::println("- Tokens -");
    for (const auto& [idx, token] : std::views::zip(std::views::iota(0), tokens)) {
        std::println("#{}: {}", idx, token);
    }
#endif

    auto ast = TRY(Parser::parse(tokens));

#ifdef DEBUG
    std::println("- Statements -");
    for (const auto& [idx, statement] : std::views::zip(std::views::iota(0), ast.statements)) {
        std::println("#{}: {}", idx, statement);
    }

    std::println("- Expressions -");
    for (const auto& [idx, expression] : std::views::zip(std::views::iota(0), ast.expressions)) {
        std::println("#{}: {}", idx, expression);
    }
#endif

    Interpreter interpreter(file_content, std::move(ast));
    if (!interpreter.evaluate_ast()) { return std::nullopt; }

    return std::move(interpreter.workload);
}

Interpreter::Interpreter(const std::string_view source, Ast ast)
  : source { source },
    ast { std::move(ast) },
    random { limits.seed }
{}

auto Interpreter::evaluate_ast() -> bool
{
    for (const auto& statement : ast.statements) {
        if (!evaluate_statement(statement)) { return false; }
    }

    return true;
}

auto Interpreter::evaluate_statement(const Statement& statement) -> std::optional<Value>
{
    const auto expression_visitor = [this](const ExpressionId expr_id) -> std::optional<Value> {
        return evaluate_expression(ast.expression_by_id(expr_id));
    };

    const auto visitor = Util::make_visitor(expression_visitor);
    return std::visit(visitor, statement.kind);
}

auto Interpreter::evaluate_expression(const Expression& expression) -> std::optional<Value>
{
    static_assert(
      std::variant_size_v<ExpressionKind> == 9, "Exhaustive handling for all variants for ExpressionKind is required"
    );

    const auto call_expression_visitor = [this](const Call& call_expression) -> std::optional<Value> {
        const auto& [name, arguments] = call_expression;
        if (!is_builtin(name)) {
            report_error("line {}: call to unknown function `{}`", line_of(name.span), name.lexeme);
            return report_note("available functions are: spawn_process, spawn_random_process");
        }

        return builtin_handler(name, arguments);
    };

    const auto string_literal_visitor = [](const StringLiteral& string_literal) -> std::optional<Value> {
        return Value(string_literal.literal.lexeme);
    };

    const auto number_visitor = [](const Number& number) -> std::optional<Value> {
        const auto parsed_number = TRY(Util::parse_integer(number.number.lexeme));
        return Value(parsed_number);
    };

    const auto list_visitor = [this](const List& list) -> std::optional<Value> {
        std::vector<Value> result;
        result.reserve(list.elements.size());

        for (const auto& elem : materialize_expressions(list.elements)) {
            result.push_back(TRY(evaluate_expression(elem)));
        }

        return Value(result);
    };

    const auto tuple_visitor = [this](const Tuple& tuple) -> std::optional<Value> {
        std::vector<Value> result;
        result.reserve(tuple.elements.size());

        for (const auto& elem : materialize_expressions(tuple.elements)) {
            result.push_back(TRY(evaluate_expression(elem)));
        }

        return Value(result);
    };

    // Bare identifiers evaluate to their own name, e.g. `arrival_policy :: zero`.
    const auto variable_visitor = [](const Variable& variable) -> std::optional<Value> {
        return Value(variable.name.lexeme);
    };

    const auto constant_visitor = [this, &expression](const Constant& constant) -> std::optional<Value> {
        return evaluate_constant(constant, expression.span);
    };

    const auto range_visitor = [](const Range& range) -> std::optional<Value> {
        const auto start = TRY(Util::parse_integer(range.start.lexeme));
        const auto end   = TRY(Util::parse_integer(range.end.lexeme));
        return Value(std::vector { Value(start), Value(end) });
    };

    const auto for_visitor = [this](const For& four) -> std::optional<Value> { return evaluate_for_expression(four); };

    const auto visitor = Util::make_visitor(
      call_expression_visitor,
      string_literal_visitor,
      number_visitor,
      list_visitor,
      tuple_visitor,
      variable_visitor,
      constant_visitor,
      range_visitor,
      for_visitor
    );

    return std::visit(visitor, expression.kind);
}

auto Interpreter::evaluate_constant(const Constant& constant, const Span span) -> std::optional<Value>
{
    constexpr static std::string_view constants[] = {
        "target_latency", "min_granularity", "arrival_policy", "seed",
        "max_arrival_time", "max_burst_time", "min_nice", "max_nice",
    };

    const auto name = constant.name.lexeme;
    const auto line = line_of(span);
    if (!std::ranges::contains(constants, name)) {
        report_error("line {}: invalid constant for the fair scheduler: {}", line, name);
        return report_note(
          "available constants are: target_latency, min_granularity, arrival_policy, seed, max_arrival_time, "
          "max_burst_time, min_nice, max_nice"
        );
    }

    const auto value = TRY(evaluate_expression(ast.expression_by_id(constant.value)));

    if (name == "arrival_policy") {
        const auto policy_name = TRY(value.as_string_or([&] -> std::optional<std::string_view> {
            return report_error("line {}: `arrival_policy` expects `min_vruntime` or `zero`", line);
        }));

        workload.config.arrival_policy = TRY(Simulations::arrival_policy_try_from_str(policy_name));
        return Value();
    }

    const auto number = TRY(value.as_number_or([&] -> std::optional<std::int64_t> {
        return report_error("line {}: constant `{}` expects a number", line, name);
    }));

    if (name == "min_nice" || name == "max_nice") {
        if (!Os::nice_in_range(number)) {
            return report_error(
              "line {}: `{}` must lie in [{}, {}], got {}", line, name, Os::NICE_MIN, Os::NICE_MAX, number
            );
        }

        (name == "min_nice" ? limits.min_nice : limits.max_nice) = number;
        return Value();
    }

    if (number < 0) { return report_error("line {}: constant `{}` must not be negative, got {}", line, name, number); }
    const auto natural = static_cast<std::size_t>(number);

    if (name == "target_latency") {
        workload.config.target_latency = natural;
    } else if (name == "min_granularity") {
        workload.config.min_granularity = natural;
    } else if (name == "seed") {
        limits.seed = natural;
        random      = Util::Random(limits.seed);
    } else if (name == "max_arrival_time") {
        limits.max_arrival_time = natural;
    } else if (name == "max_burst_time") {
        limits.max_burst_time = natural;
    } else {
        assert(false && "unreachable");
    }

    return Value();
}

auto Interpreter::evaluate_for_expression(const For& four) -> std::optional<Value>
{
    const auto range = TRY(Util::get<Range>(ast.expression_by_id(four.range).kind));
    const auto start = TRY(Util::parse_integer(range.start.lexeme));
    const auto end   = TRY(Util::parse_integer(range.end.lexeme));

    const auto body = materialize_expressions(four.body);
    for (auto i = start; i < end; ++i) {
        for (const auto& expr : body) { TRY(evaluate_expression(expr)); }
    }

    return Value();
}

auto Interpreter::builtin_handler(const Token& name, const std::vector<ExpressionId>& arguments)
  -> std::optional<Value>
{
    const auto arguments_exprs = materialize_expressions(arguments);

    if (name.lexeme == "spawn_process") { return spawn_process_builtin(name, arguments_exprs); }
    if (name.lexeme == "spawn_random_process") { return spawn_random_process_builtin(name, arguments_exprs); }

    assert(false && "unreachable");
    return std::nullopt;
}

auto Interpreter::spawn_process_builtin(const Token& name, const std::vector<Expression>& arguments)
  -> std::optional<Value>
{
    constexpr static auto NAME     = "spawn_process";
    constexpr static auto MIN_ARGC = 4;
    constexpr static auto MAX_ARGC = 5;
    if (arguments.size() < MIN_ARGC || arguments.size() > MAX_ARGC) {
        report_error(
          "line {}: failed to interpret call to builtin `{}`: expected {} or {} arguments, {} were provided",
          line_of(name.span),
          NAME,
          MIN_ARGC,
          MAX_ARGC,
          arguments.size()
        );
        return report_note("(e.g. spawn_process(name: string, pid: int, nice: int, burst: int[, arrival: int]))");
    }

    std::size_t argument_count     = 0;
    const auto  process_name_value = TRY(evaluate_expression(arguments[argument_count++]));
    const auto  process_name       = TRY(process_name_value.as_string_or([&] -> std::optional<std::string_view> {
        return report_error(
          "line {}: mismatched type for argument #{} of builtin `{}`: expected type `string`",
          line_of(name.span),
          argument_count - 1,
          NAME
        );
    }));

    const auto pid = TRY(natural_argument(arguments[argument_count++], argument_count - 1, NAME));

    const auto nice_value = TRY(evaluate_expression(arguments[argument_count++]));
    const auto nice       = TRY(nice_value.as_number_or([&] -> std::optional<std::int64_t> {
        return report_error(
          "line {}: mismatched type for argument #{} of builtin `{}`: expected type `int`",
          line_of(name.span),
          argument_count - 1,
          NAME
        );
    }));

    const auto burst = TRY(natural_argument(arguments[argument_count++], argument_count - 1, NAME));

    Os::Tick arrival = 0;
    if (arguments.size() == MAX_ARGC) {
        arrival = TRY(natural_argument(arguments[argument_count++], argument_count - 1, NAME));
    }

    workload.processes.push_back(Os::ProcessDescriptor {
      .name    = std::string(process_name),
      .pid     = pid,
      .nice    = nice,
      .burst   = burst,
      .arrival = arrival,
    });

    return Value();
}

auto Interpreter::spawn_random_process_builtin(const Token& name, const std::vector<Expression>& arguments)
  -> std::optional<Value>
{
    constexpr static auto NAME = "spawn_random_process";
    if (!arguments.empty()) {
        return report_error(
          "line {}: failed to interpret call to builtin `{}`: expected 0 arguments, {} were provided",
          line_of(name.span),
          NAME,
          arguments.size()
        );
    }

    if (limits.min_nice > limits.max_nice) {
        return report_error("`min_nice` ({}) must not exceed `max_nice` ({})", limits.min_nice, limits.max_nice);
    }

    if (workload.processes.size() >= MAX_RANDOM_PID) {
        return report_error("line {}: no free pid left for `{}`", line_of(name.span), NAME);
    }

    auto pid = random.natural(1, MAX_RANDOM_PID);
    while (pid_is_taken(pid)) { pid = random.natural(1, MAX_RANDOM_PID); }

    const auto arrival = random.natural(0, limits.max_arrival_time);
    const auto burst   = random.natural(1, std::max<Os::Tick>(1, limits.max_burst_time));
    const auto nice    = random.integer(limits.min_nice, limits.max_nice);

    workload.processes.push_back(Os::ProcessDescriptor {
      .name    = std::format("random-{}", pid),
      .pid     = pid,
      .nice    = nice,
      .burst   = burst,
      .arrival = arrival,
    });

    return Value();
}

auto Interpreter::natural_argument(const Expression& argument, const std::size_t idx, const std::string_view builtin)
  -> std::optional<std::size_t>
{
    const auto value  = TRY(evaluate_expression(argument));
    const auto number = TRY(value.as_number_or([&] -> std::optional<std::int64_t> {
        return report_error(
          "line {}: mismatched type for argument #{} of builtin `{}`: expected type `int`",
          line_of(argument.span),
          idx,
          builtin
        );
    }));

    if (number < 0) {
        return report_error(
          "line {}: argument #{} of builtin `{}` must not be negative, got {}",
          line_of(argument.span),
          idx,
          builtin,
          number
        );
    }

    return static_cast<std::size_t>(number);
}

auto Interpreter::pid_is_taken(const std::size_t pid) const -> bool
{
    return std::ranges::any_of(workload.processes, [pid](const auto& process) { return process.pid == pid; });
}

auto Interpreter::materialize_expressions(const std::vector<ExpressionId>& expr_ids) const -> std::vector<Expression>
{
    return std::views::transform(
             expr_ids, [this](const auto& expr_id) -> Expression { return ast.expression_by_id(expr_id); }
           )
           | std::ranges::to<std::vector>();
}

} // namespace Interpreter

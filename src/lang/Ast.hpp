#pragma once

#include <format>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "lang/Span.hpp"
#include "lang/Token.hpp"

namespace Interpreter
{

using ExpressionId  = std::size_t;
using StatementKind = std::variant<ExpressionId>;

struct [[nodiscard]] Call final
{
    Token                     identifier;
    std::vector<ExpressionId> arguments;
};

struct [[nodiscard]] StringLiteral final
{
    Token literal;
};

struct [[nodiscard]] Number final
{
    Token number;
};

struct [[nodiscard]] List final
{
    std::vector<ExpressionId> elements;
};

struct [[nodiscard]] Tuple final
{
    std::vector<ExpressionId> elements;
};

struct [[nodiscard]] Variable final
{
    Token name;
};

// `name :: value`
struct [[nodiscard]] Constant final
{
    Token        name;
    ExpressionId value;
};

// `start..end`, end exclusive.
struct [[nodiscard]] Range final
{
    Token start;
    Token end;
};

struct [[nodiscard]] For final
{
    ExpressionId              range;
    std::vector<ExpressionId> body;
};

using ExpressionKind = std::variant<Call, StringLiteral, Number, List, Tuple, Variable, Constant, Range, For>;

struct [[nodiscard]] Expression final
{
    ExpressionKind kind;
    Span           span;
    std::size_t    id;
};

struct [[nodiscard]] Statement final
{
    StatementKind kind;
    Span          span;
    std::size_t   id;
};

struct [[nodiscard]] Ast final
{
    std::vector<Statement>  statements;
    std::vector<Expression> expressions;

    [[nodiscard]] auto statement_by_id(const std::size_t id) const -> const Statement& { return statements[id]; }

    [[nodiscard]] auto expression_by_id(const std::size_t id) const -> const Expression& { return expressions[id]; }

    template<typename... Args>
    auto emplace_expression(Args&&... args) -> Expression&
    {
        return expressions.emplace_back(std::forward<Args>(args)...);
    }
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::StatementKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::StatementKind& kind, auto& ctx) const
    {
        static_assert(
          std::variant_size_v<Interpreter::StatementKind> == 1,
          "Exhaustive handling of all variants for StatementKind is required."
        );
        const auto result = std::visit(
          [](const auto& value) -> std::string {
              if constexpr (std::is_same_v<std::decay_t<decltype(value)>, Interpreter::ExpressionId>) {
                  return std::format("ExpressionId(#{})", value);
              } else {
                  static_assert(false, "Unhandled StatementKind variant alternative");
              }
          },
          kind
        );

        return std::format_to(ctx.out(), "{}", result);
    }
};

template<>
struct std::formatter<Interpreter::Statement>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Statement& statement, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "Statement {{ kind = {}, span = {}, id = {} }}", statement.kind, statement.span, statement.id
        );
    }
};

template<>
struct std::formatter<Interpreter::ExpressionKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::ExpressionKind& kind, auto& ctx) const
    {
        const auto join_expressions = [](const auto& ids) -> std::string {
            std::stringstream ss;
            for (std::size_t i = 0; i < ids.size(); ++i) {
                ss << std::format("ExpressionId(#{})", ids[i]);
                if (i != ids.size() - 1) { ss << ", "; }
            }
            return ss.str();
        };

        static_assert(
          std::variant_size_v<Interpreter::ExpressionKind> == 9,
          "Exhaustive handling of all variants for ExpressionKind is required."
        );
        const auto result = std::visit(
          [&](const auto& value) -> std::string {
              using T = std::decay_t<decltype(value)>;
              if constexpr (std::is_same_v<T, Interpreter::Call>) {
                  return std::format(
                    "Call {{ identifier = {}, arguments = [{}] }}",
                    value.identifier.lexeme,
                    join_expressions(value.arguments)
                  );
              } else if constexpr (std::is_same_v<T, Interpreter::StringLiteral>) {
                  return std::format("StringLiteral {{ literal = {} }}", value.literal.lexeme);
              } else if constexpr (std::is_same_v<T, Interpreter::Number>) {
                  return std::format("Number {{ number = {} }}", value.number.lexeme);
              } else if constexpr (std::is_same_v<T, Interpreter::List>) {
                  return std::format("List {{ elements = [{}] }}", join_expressions(value.elements));
              } else if constexpr (std::is_same_v<T, Interpreter::Tuple>) {
                  return std::format("Tuple {{ elements = [{}] }}", join_expressions(value.elements));
              } else if constexpr (std::is_same_v<T, Interpreter::Variable>) {
                  return std::format("Variable {{ name = {} }}", value.name.lexeme);
              } else if constexpr (std::is_same_v<T, Interpreter::Constant>) {
                  return std::format(
                    "Constant {{ name = {}, value = ExpressionId(#{}) }}", value.name.lexeme, value.value
                  );
              } else if constexpr (std::is_same_v<T, Interpreter::Range>) {
                  return std::format("Range {{ start = {}, end = {} }}", value.start.lexeme, value.end.lexeme);
              } else if constexpr (std::is_same_v<T, Interpreter::For>) {
                  return std::format(
                    "For {{ range = ExpressionId(#{}), body = [{}] }}", value.range, join_expressions(value.body)
                  );
              } else {
                  static_assert(false, "Unhandled ExpressionKind variant alternative");
              }
          },
          kind
        );

        return std::format_to(ctx.out(), "{}", result);
    }
};

template<>
struct std::formatter<Interpreter::Expression>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Expression& expression, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "Expression {{ kind = {}, span = {}, id = {} }}", expression.kind, expression.span, expression.id
        );
    }
};

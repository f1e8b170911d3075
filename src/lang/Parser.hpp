#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "lang/Ast.hpp"
#include "lang/Token.hpp"

namespace Interpreter
{

class [[nodiscard]] Parser final
{
  public:
    [[nodiscard]] static auto parse(const std::vector<Token>& tokens) -> std::optional<Ast>;

  private:
    explicit Parser(const std::vector<Token>& tokens);

    [[nodiscard]] auto expression_statement() -> std::optional<Statement>;

    [[nodiscard]] auto expression() -> std::optional<Expression>;
    [[nodiscard]] auto primary_expression() -> std::optional<Expression>;
    [[nodiscard]] auto string_literal() -> std::optional<Expression>;
    [[nodiscard]] auto number() -> std::optional<Expression>;
    [[nodiscard]] auto list() -> std::optional<Expression>;
    [[nodiscard]] auto tuple() -> std::optional<Expression>;
    [[nodiscard]] auto call_expression() -> std::optional<Expression>;
    [[nodiscard]] auto constant_definition() -> std::optional<Expression>;
    [[nodiscard]] auto for_loop() -> std::optional<Expression>;
    [[nodiscard]] auto range() -> std::optional<Expression>;

    // Comma separated expressions up to `closing`, which is consumed.
    [[nodiscard]] auto delimited_expressions(TokenKind closing)
      -> std::optional<std::pair<std::vector<ExpressionId>, Span>>;

    [[nodiscard]] auto identifier() -> std::optional<Token>;

    [[nodiscard]] auto consume_then_match(TokenKind expected) -> std::optional<Token>;

    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<Token>;
    [[nodiscard]] auto next() -> std::optional<Token>;

    [[nodiscard]] auto emplace(ExpressionKind kind, const Span span) -> Expression;

  private:
    std::vector<Token> tokens;
    std::size_t        cursor = 0;

    Ast ast = {};
};

} // namespace Interpreter

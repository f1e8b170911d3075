#include "Parser.hpp"

#include <print>

#include "Util.hpp"

namespace Interpreter
{

auto Parser::parse(const std::vector<Token>& tokens) -> std::optional<Ast>
{
    Parser parser(tokens);

    while (parser.has_more()) {
        const auto statement = TRY(parser.expression_statement());
        parser.ast.statements.push_back(statement);
    }

    return parser.ast;
}

auto Parser::expression_statement() -> std::optional<Statement>
{
    const auto expr = TRY(expression());
    return Statement { .kind = expr.id, .span = expr.span, .id = ast.statements.size() };
}

auto Parser::expression() -> std::optional<Expression>
{
    const auto current_token = TRY(peek());
    if (current_token.kind == TokenKind::Keyword && current_token.lexeme == "for") { return for_loop(); }

    return primary_expression();
}

auto Parser::primary_expression() -> std::optional<Expression>
{
    const auto maybe_token = peek();
    if (!maybe_token) {
        std::println(stderr, "[ERROR] (parser) Expected primary expression but ran out of tokens");
        return std::nullopt;
    }

    const auto token = *maybe_token;
    switch (token.kind) {
        case TokenKind::Identifier: {
            const auto following = peek(1);
            if (following && following->kind == TokenKind::LeftParen) { return call_expression(); }
            if (following && following->kind == TokenKind::ColonColon) { return constant_definition(); }

            TRY(consume_then_match(TokenKind::Identifier));
            return emplace(Variable { .name = token }, token.span);
        }
        case TokenKind::StringLiteral: {
            return string_literal();
        }
        case TokenKind::Number: {
            return number();
        }
        case TokenKind::LeftBracket: {
            return list();
        }
        case TokenKind::LeftParen: {
            return tuple();
        }
        default: {
            std::println(
              stderr, "[ERROR] (parser) Expected primary expression but got {} `{}`", token.kind, token.lexeme
            );
            return std::nullopt;
        }
    }
}

auto Parser::string_literal() -> std::optional<Expression>
{
    const auto token = TRY(consume_then_match(TokenKind::StringLiteral));
    return emplace(StringLiteral { .literal = token }, token.span);
}

auto Parser::number() -> std::optional<Expression>
{
    const auto token = TRY(consume_then_match(TokenKind::Number));
    return emplace(Number { .number = token }, token.span);
}

auto Parser::list() -> std::optional<Expression>
{
    const auto left_bracket         = TRY(consume_then_match(TokenKind::LeftBracket));
    const auto [elements, end_span] = TRY(delimited_expressions(TokenKind::RightBracket));

    return emplace(List { .elements = elements }, Span::join(left_bracket.span, end_span));
}

auto Parser::tuple() -> std::optional<Expression>
{
    const auto left_paren           = TRY(consume_then_match(TokenKind::LeftParen));
    const auto [elements, end_span] = TRY(delimited_expressions(TokenKind::RightParen));

    return emplace(Tuple { .elements = elements }, Span::join(left_paren.span, end_span));
}

auto Parser::call_expression() -> std::optional<Expression>
{
    const auto callee = TRY(identifier());
    TRY(consume_then_match(TokenKind::LeftParen));
    const auto [arguments, end_span] = TRY(delimited_expressions(TokenKind::RightParen));

    return emplace(Call { .identifier = callee, .arguments = arguments }, Span::join(callee.span, end_span));
}

auto Parser::delimited_expressions(TokenKind closing) -> std::optional<std::pair<std::vector<ExpressionId>, Span>>
{
    std::vector<ExpressionId> elements = {};
    for (auto maybe_token = peek(); maybe_token.has_value(); maybe_token = peek()) {
        const auto token = *maybe_token;
        if (token.kind == closing) {
            TRY(consume_then_match(closing));
            return std::pair { elements, token.span };
        }

        if (token.kind == TokenKind::Comma) {
            TRY(consume_then_match(TokenKind::Comma));
            continue;
        }

        const auto expr = TRY(expression());
        elements.push_back(expr.id);
    }

    std::println(stderr, "[ERROR] (parser) Expected {} but ran out of tokens", closing);
    return std::nullopt;
}

auto Parser::constant_definition() -> std::optional<Expression>
{
    const auto name = TRY(identifier());
    TRY(consume_then_match(TokenKind::ColonColon));
    const auto value = TRY(primary_expression());

    return emplace(Constant { .name = name, .value = value.id }, Span::join(name.span, value.span));
}

auto Parser::for_loop() -> std::optional<Expression>
{
    const auto for_token = TRY(consume_then_match(TokenKind::Keyword));
    assert(for_token.lexeme == "for" && "unreachable");

    const auto range_expression = TRY(range());
    TRY(consume_then_match(TokenKind::LeftCurly));

    std::vector<ExpressionId> body;
    for (auto current_token = peek(); current_token && current_token->kind != TokenKind::RightCurly;
         current_token      = peek()) {
        const auto expr = TRY(expression());
        body.push_back(expr.id);
    }

    const auto right_curly = TRY(consume_then_match(TokenKind::RightCurly));
    return emplace(
      For { .range = range_expression.id, .body = body }, Span::join(for_token.span, right_curly.span)
    );
}

auto Parser::range() -> std::optional<Expression>
{
    const auto start_range = TRY(consume_then_match(TokenKind::Number));
    TRY(consume_then_match(TokenKind::DotDot));
    const auto end_range = TRY(consume_then_match(TokenKind::Number));

    return emplace(Range { .start = start_range, .end = end_range }, Span::join(start_range.span, end_range.span));
}

auto Parser::identifier() -> std::optional<Token> { return consume_then_match(TokenKind::Identifier); }

auto Parser::consume_then_match(TokenKind expected) -> std::optional<Token>
{
    const auto maybe_token = next();
    if (!maybe_token) {
        std::println(stderr, "[ERROR] (parser) Expected {} but ran out of tokens", expected);
        return std::nullopt;
    }

    const auto token = *maybe_token;
    if (token.kind != expected) {
        std::println(stderr, "[ERROR] (parser) Expected {} but got {} `{}`", expected, token.kind, token.lexeme);
        return std::nullopt;
    }

    return token;
}

auto Parser::has_more() const -> bool { return cursor < tokens.size(); }

auto Parser::peek(const std::size_t offset) const -> std::optional<Token>
{
    if (cursor + offset < tokens.size()) { return tokens[cursor + offset]; }

    return std::nullopt;
}

auto Parser::next() -> std::optional<Token>
{
    if (has_more()) { return tokens[cursor++]; }

    return std::nullopt;
}

auto Parser::emplace(ExpressionKind kind, const Span span) -> Expression
{
    const auto id = ast.expressions.size();
    return ast.emplace_expression(std::move(kind), span, id);
}

Parser::Parser(const std::vector<Token>& tokens)
  : tokens { tokens }
{}

} // namespace Interpreter

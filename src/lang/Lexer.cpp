#include "Lexer.hpp"

#include <cctype>
#include <print>

#include "Util.hpp"

[[nodiscard]] static auto token_kind_try_from_character(const char character) -> std::optional<Interpreter::TokenKind>
{
    static_assert(
      std::to_underlying(Interpreter::TokenKind::Count) == 13,
      "Exhastive handling of all enum variants for TokenKind is required."
    );

    switch (character) {
        case '(':
            return Interpreter::TokenKind::LeftParen;
        case ')':
            return Interpreter::TokenKind::RightParen;
        case '[':
            return Interpreter::TokenKind::LeftBracket;
        case ']':
            return Interpreter::TokenKind::RightBracket;
        case ',':
            return Interpreter::TokenKind::Comma;
        case '{':
            return Interpreter::TokenKind::LeftCurly;
        case '}':
            return Interpreter::TokenKind::RightCurly;
        default: {
            std::println(stderr, "[ERROR] (lexer) Unexpected single character token {}", character);
            return std::nullopt;
        }
    }
}

[[nodiscard]] static auto is_digit(const char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

[[nodiscard]] static auto is_identifier_start(const char c) -> bool
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] static auto is_identifier_character(const char c) -> bool
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

namespace Interpreter
{

auto Lexer::lex(const std::string_view source) -> std::optional<std::vector<Token>>
{
    std::vector<Token> result = {};
    Lexer              lexer(source);

    while (true) {
        lexer.skip_trivia();
        if (!lexer.has_more()) { break; }

        result.push_back(TRY(lexer.next_token()));
    }

    return result;
}

Lexer::Lexer(const std::string_view source)
  : source { source }
{}

auto Lexer::single_character_token(const char character) -> std::optional<Token>
{
    const auto kind      = TRY(token_kind_try_from_character(character));
    const auto start_idx = cursor;

    advance();
    return make_token(start_idx, kind);
}

auto Lexer::keyword_or_identifier() -> std::optional<Token>
{
    const auto start_idx = cursor;
    if (!is_identifier_start(source[cursor])) {
        return report_error(std::format("unexpected character `{}`", source[cursor]));
    }

    while (const auto peeked = peek()) {
        if (!is_identifier_character(*peeked)) { break; }
        advance();
    }

    const auto lexeme = source.substr(start_idx, cursor - start_idx);
    return make_token(start_idx, Token::is_keyword(lexeme) ? TokenKind::Keyword : TokenKind::Identifier);
}

auto Lexer::string_literal() -> std::optional<Token>
{
    assert(peek() == '"' && "expected \"");
    advance();

    const auto start_idx = cursor;
    while (true) {
        const auto peeked = peek();
        if (!peeked || *peeked == '\n') { return report_error("unterminated string literal"); }
        if (*peeked == '"') { break; }
        advance();
    }

    const auto token = make_token(start_idx, TokenKind::StringLiteral);
    advance();
    return token;
}

auto Lexer::number() -> std::optional<Token>
{
    const auto start_idx = cursor;
    if (peek() == '-') { advance(); }

    assert(peek().has_value() && is_digit(*peek()) && "expected number");
    while (const auto peeked = peek()) {
        if (!is_digit(*peeked)) { break; }
        advance();
    }

    if (const auto peeked = peek(); peeked && is_identifier_start(*peeked)) {
        return report_error(std::format("unexpected character `{}` after number", *peeked));
    }

    return make_token(start_idx, TokenKind::Number);
}

auto Lexer::colon() -> std::optional<Token>
{
    assert(peek() == ':' && "expected \":\"");
    const auto start_idx = cursor;
    advance();

    if (peek() == ':') {
        advance();
        return make_token(start_idx, TokenKind::ColonColon);
    }

    return report_error("expected `::`");
}

auto Lexer::dotdot() -> std::optional<Token>
{
    assert(peek() == '.' && "expected \".\"");
    const auto start_idx = cursor;
    advance();

    if (peek() == '.') {
        advance();
        return make_token(start_idx, TokenKind::DotDot);
    }

    return report_error("expected `..`");
}

auto Lexer::has_more() const -> bool { return cursor < source.size(); }

auto Lexer::next_token() -> std::optional<Token>
{
    const auto next_character = TRY(peek());

    if (is_digit(next_character)) { return number(); }
    if (next_character == '-' && peek(1).has_value() && is_digit(*peek(1))) { return number(); }

    switch (next_character) {
        case '[':
        case ']':
        case ',':
        case '{':
        case '}':
        case '(':
        case ')': {
            return single_character_token(next_character);
        }
        case ':': {
            return colon();
        }
        case '.': {
            return dotdot();
        }
        case '"': {
            return string_literal();
        }
        default: {
            return keyword_or_identifier();
        }
    }
}

auto Lexer::peek(const std::size_t offset) const -> std::optional<char>
{
    if (cursor + offset >= source.size()) { return std::nullopt; }

    return source[cursor + offset];
}

void Lexer::advance(const std::size_t amount) { cursor += amount; }

void Lexer::skip_trivia()
{
    while (const auto peeked = peek()) {
        if (*peeked == '#') {
            while (peek().has_value() && peek() != '\n') { advance(); }
        } else if (std::isspace(static_cast<unsigned char>(*peeked)) != 0) {
            advance();
        } else {
            break;
        }
    }
}

auto Lexer::make_token(const std::size_t start_idx, const TokenKind kind) const -> Token
{
    return Token {
        .lexeme = source.substr(start_idx, cursor - start_idx),
        .kind   = kind,
        .span   = Span { .start = start_idx, .end = cursor },
    };
}

auto Lexer::report_error(const std::string_view message) const -> std::nullopt_t
{
    const auto line = Span { .start = cursor, .end = cursor }.line_in(source);
    std::println(stderr, "[ERROR] (lexer) line {}: {}", line, message);
    return std::nullopt;
}

} // namespace Interpreter

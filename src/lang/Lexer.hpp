#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "lang/Token.hpp"

namespace Interpreter
{

class [[nodiscard]] Lexer final
{
  public:
    // Fails on the first malformed token; partial token streams are never returned.
    [[nodiscard]] static auto lex(const std::string_view source) -> std::optional<std::vector<Token>>;

  private:
    explicit Lexer(const std::string_view source);

    [[nodiscard]] auto single_character_token(const char character) -> std::optional<Token>;
    [[nodiscard]] auto keyword_or_identifier() -> std::optional<Token>;
    [[nodiscard]] auto string_literal() -> std::optional<Token>;
    [[nodiscard]] auto number() -> std::optional<Token>;
    [[nodiscard]] auto colon() -> std::optional<Token>;
    [[nodiscard]] auto dotdot() -> std::optional<Token>;

    [[nodiscard]] auto has_more() const -> bool;
    [[nodiscard]] auto next_token() -> std::optional<Token>;

    [[nodiscard]] auto peek(const std::size_t offset = 0) const -> std::optional<char>;
    void               advance(const std::size_t amount = 1);

    // Whitespace and `#` comments up to the end of the line.
    void skip_trivia();

    [[nodiscard]] auto make_token(const std::size_t start_idx, const TokenKind kind) const -> Token;
    [[nodiscard]] auto report_error(const std::string_view message) const -> std::nullopt_t;

  private:
    std::string_view source;
    std::size_t      cursor = 0;
};

} // namespace Interpreter

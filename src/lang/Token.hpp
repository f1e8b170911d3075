#pragma once

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <format>
#include <string_view>
#include <utility>

#include "lang/Span.hpp"

namespace Interpreter
{

enum class [[nodiscard]] TokenKind : std::uint8_t
{
    LeftParen = 0,
    RightParen,
    LeftBracket,
    RightBracket,
    LeftCurly,
    RightCurly,
    Comma,

    Keyword,
    Identifier,
    StringLiteral,
    Number,
    ColonColon,
    DotDot,

    Count,
};

struct [[nodiscard]] Token final
{
    [[nodiscard]] constexpr static auto is_keyword(const std::string_view lexeme) -> bool
    {
        constexpr static std::string_view keywords[] = { "for" };
        return std::ranges::contains(keywords, lexeme);
    }

    std::string_view lexeme;
    TokenKind        kind;
    Span             span;
};

} // namespace Interpreter

template<>
struct std::formatter<Interpreter::TokenKind>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(Interpreter::TokenKind kind, auto& ctx) const
    {
        constexpr static auto visitor = [](Interpreter::TokenKind value) constexpr -> std::string_view {
            static_assert(
              std::to_underlying(Interpreter::TokenKind::Count) == 13,
              "[ERROR] Exhaustive handling of all enum variants for TokenKind is required"
            );

            switch (value) {
                case Interpreter::TokenKind::LeftParen: return "`(`";
                case Interpreter::TokenKind::RightParen: return "`)`";
                case Interpreter::TokenKind::LeftBracket: return "`[`";
                case Interpreter::TokenKind::RightBracket: return "`]`";
                case Interpreter::TokenKind::LeftCurly: return "`{`";
                case Interpreter::TokenKind::RightCurly: return "`}`";
                case Interpreter::TokenKind::Comma: return "`,`";
                case Interpreter::TokenKind::Keyword: return "keyword";
                case Interpreter::TokenKind::Identifier: return "identifier";
                case Interpreter::TokenKind::StringLiteral: return "string literal";
                case Interpreter::TokenKind::Number: return "number";
                case Interpreter::TokenKind::ColonColon: return "`::`";
                case Interpreter::TokenKind::DotDot: return "`..`";
                default: {
                    assert(false && "unreachable");
                    return "unreachable";
                }
            }
        };

        return std::format_to(ctx.out(), "{}", visitor(kind));
    }
};

template<>
struct std::formatter<Interpreter::Token>
{
    constexpr auto parse(auto& ctx) { return ctx.begin(); }

    auto format(const Interpreter::Token& token, auto& ctx) const
    {
        return std::format_to(
          ctx.out(), "{{ lexeme = \"{}\", kind = {}, span = {} }}", token.lexeme, token.kind, token.span
        );
    }
};

#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "lang/Lexer.hpp"
#include "lang/Parser.hpp"

namespace
{

using Interpreter::Lexer;
using Interpreter::TokenKind;

auto kinds_of(const std::vector<Interpreter::Token>& tokens) -> std::vector<TokenKind>
{
    std::vector<TokenKind> kinds;
    for (const auto& token : tokens) { kinds.push_back(token.kind); }
    return kinds;
}

TEST(LexerTest, SpawnCall)
{
    const auto tokens = Lexer::lex(R"(spawn_process("editor", 1, -5, 30))");
    ASSERT_TRUE(tokens.has_value());

    const auto expected = std::vector<TokenKind> {
        TokenKind::Identifier, TokenKind::LeftParen, TokenKind::StringLiteral, TokenKind::Comma,
        TokenKind::Number,     TokenKind::Comma,     TokenKind::Number,        TokenKind::Comma,
        TokenKind::Number,     TokenKind::RightParen,
    };
    EXPECT_EQ(kinds_of(*tokens), expected);
    EXPECT_EQ((*tokens)[0].lexeme, "spawn_process");
    EXPECT_EQ((*tokens)[2].lexeme, "editor");
    EXPECT_EQ((*tokens)[6].lexeme, "-5");
}

TEST(LexerTest, ConstantAndLoop)
{
    const auto tokens = Lexer::lex("target_latency :: 24\nfor 0..3 { spawn_random_process() }");
    ASSERT_TRUE(tokens.has_value());

    const auto expected = std::vector<TokenKind> {
        TokenKind::Identifier, TokenKind::ColonColon, TokenKind::Number,     TokenKind::Keyword,
        TokenKind::Number,     TokenKind::DotDot,     TokenKind::Number,     TokenKind::LeftCurly,
        TokenKind::Identifier, TokenKind::LeftParen,  TokenKind::RightParen, TokenKind::RightCurly,
    };
    EXPECT_EQ(kinds_of(*tokens), expected);
    EXPECT_EQ((*tokens)[3].span.line_in("target_latency :: 24\nfor 0..3 { spawn_random_process() }"), 2U);
}

TEST(LexerTest, SkipsCommentsAndWhitespace)
{
    const auto tokens = Lexer::lex("# header comment\n\n   seed :: 7 # trailing\n# done");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 3U);
    EXPECT_EQ(tokens->back().lexeme, "7");

    const auto empty = Lexer::lex("  # nothing here\n");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(LexerTest, IdentifierAtEndOfInput)
{
    const auto tokens = Lexer::lex("arrival_policy :: zero");
    ASSERT_TRUE(tokens.has_value());
    ASSERT_EQ(tokens->size(), 3U);
    EXPECT_EQ(tokens->back().kind, TokenKind::Identifier);
    EXPECT_EQ(tokens->back().lexeme, "zero");
}

TEST(LexerTest, RejectsMalformedInput)
{
    EXPECT_FALSE(Lexer::lex(R"(spawn_process("unterminated, 1, 0, 5))").has_value());
    EXPECT_FALSE(Lexer::lex("seed :: 12abc").has_value());
    EXPECT_FALSE(Lexer::lex("seed : 12").has_value());
    EXPECT_FALSE(Lexer::lex("for 0.3 {}").has_value());
    EXPECT_FALSE(Lexer::lex("seed :: 1; seed :: 2").has_value());
}

TEST(ParserTest, BuildsStatementsForEachTopLevelExpression)
{
    const auto tokens = Lexer::lex(R"(target_latency :: 6
spawn_process("A", 1, 0, 10)
for 0..2 { spawn_random_process() spawn_random_process() })");
    ASSERT_TRUE(tokens.has_value());

    const auto ast = Interpreter::Parser::parse(*tokens);
    ASSERT_TRUE(ast.has_value());
    ASSERT_EQ(ast->statements.size(), 3U);

    const auto& loop_id = std::get<Interpreter::ExpressionId>(ast->statements[2].kind);
    const auto& loop    = ast->expression_by_id(loop_id);
    ASSERT_TRUE(std::holds_alternative<Interpreter::For>(loop.kind));
    EXPECT_EQ(std::get<Interpreter::For>(loop.kind).body.size(), 2U);

    const auto& constant_id = std::get<Interpreter::ExpressionId>(ast->statements[0].kind);
    ASSERT_TRUE(std::holds_alternative<Interpreter::Constant>(ast->expression_by_id(constant_id).kind));
}

TEST(ParserTest, RejectsIncompleteInput)
{
    const auto parse = [](std::string_view source) {
        const auto tokens = Lexer::lex(source);
        EXPECT_TRUE(tokens.has_value()) << source;
        return tokens.has_value() && Interpreter::Parser::parse(*tokens).has_value();
    };

    EXPECT_FALSE(parse(R"(spawn_process("A", 1, 0, 10)"));
    EXPECT_FALSE(parse("for 0..2 { spawn_random_process()"));
    EXPECT_FALSE(parse("for 2 { spawn_random_process() }"));
    EXPECT_FALSE(parse("seed ::"));
    EXPECT_FALSE(parse("}"));
}

} // namespace

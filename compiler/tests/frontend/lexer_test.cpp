#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>

using namespace talkpp;
using namespace talkpp::lexer;

class LexerTest : public ::testing::Test {
protected:
    std::unique_ptr<Source> source_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_ok(result)) << unwrap_err(result).message;
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_EQ(tokens.size(), 1u);
        return tokens.empty() ? Token{} : tokens[0];
    }

    auto lex_error(const std::string& code) -> LexicalError {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }
};

// Keywords
TEST_F(LexerTest, Keywords) {
    EXPECT_EQ(lex_one("if").kind, TokenKind::KwIf);
    EXPECT_EQ(lex_one("then").kind, TokenKind::KwThen);
    EXPECT_EQ(lex_one("else").kind, TokenKind::KwElse);
    EXPECT_EQ(lex_one("when").kind, TokenKind::KwWhen);
    EXPECT_EQ(lex_one("and").kind, TokenKind::KwAnd);
    EXPECT_EQ(lex_one("or").kind, TokenKind::KwOr);
    EXPECT_EQ(lex_one("using").kind, TokenKind::KwUsing);
    EXPECT_EQ(lex_one("with").kind, TokenKind::KwWith);
    EXPECT_EQ(lex_one("to").kind, TokenKind::KwTo);
    EXPECT_EQ(lex_one("in").kind, TokenKind::KwIn);
    EXPECT_EQ(lex_one("from").kind, TokenKind::KwFrom);
}

TEST_F(LexerTest, VerbsAcceptSingularAndPlural) {
    EXPECT_EQ(lex_one("send").kind, TokenKind::VerbSend);
    EXPECT_EQ(lex_one("sends").kind, TokenKind::VerbSend);
    EXPECT_EQ(lex_one("store").kind, TokenKind::VerbStore);
    EXPECT_EQ(lex_one("stores").kind, TokenKind::VerbStore);
    EXPECT_EQ(lex_one("validate").kind, TokenKind::VerbValidate);
    EXPECT_EQ(lex_one("validates").kind, TokenKind::VerbValidate);
    EXPECT_EQ(lex_one("process").kind, TokenKind::VerbProcess);
    EXPECT_EQ(lex_one("processes").kind, TokenKind::VerbProcess);
    EXPECT_EQ(lex_one("trigger").kind, TokenKind::VerbTrigger);
    EXPECT_EQ(lex_one("triggers").kind, TokenKind::VerbTrigger);
    EXPECT_EQ(lex_one("call").kind, TokenKind::VerbCall);
    EXPECT_EQ(lex_one("calls").kind, TokenKind::VerbCall);
}

TEST_F(LexerTest, KeywordPrefixIsIdentifier) {
    auto token = lex_one("iffy");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.string_value(), "iffy");

    EXPECT_EQ(lex_one("sender").kind, TokenKind::Identifier);
}

// Identifiers
TEST_F(LexerTest, Identifiers) {
    auto token = lex_one("email");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "email");
    EXPECT_EQ(token.string_value(), "email");
}

TEST_F(LexerTest, IdentifierWithUnderscoreAndDigits) {
    auto token = lex_one("_welcome_email2");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.string_value(), "_welcome_email2");
}

TEST_F(LexerTest, IdentifierWithInnerCapitals) {
    auto token = lex_one("userId");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.string_value(), "userId");
}

// Services
TEST_F(LexerTest, CapitalizedWordIsService) {
    auto token = lex_one("SendGrid");
    EXPECT_EQ(token.kind, TokenKind::Service);
    EXPECT_EQ(token.string_value(), "SendGrid");
}

TEST_F(LexerTest, CapitalizedVerbIsService) {
    EXPECT_EQ(lex_one("Send").kind, TokenKind::Service);
    EXPECT_EQ(lex_one("If").kind, TokenKind::Service);
}

TEST_F(LexerTest, ServiceStopsAtUnderscore) {
    auto tokens = lex("Postgre_sql");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Service);
    EXPECT_EQ(tokens[0].string_value(), "Postgre");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].string_value(), "_sql");
}

// Numbers
TEST_F(LexerTest, Integers) {
    auto token = lex_one("42");
    EXPECT_EQ(token.kind, TokenKind::IntLiteral);
    EXPECT_EQ(token.int_value(), 42);

    EXPECT_EQ(lex_one("9223372036854775807").int_value(), INT64_MAX);
}

TEST_F(LexerTest, IntegerOutOfRange) {
    auto error = lex_error("9223372036854775808");
    EXPECT_EQ(error.position, 0u);
    EXPECT_EQ(error.message, "Integer literal out of range: 9223372036854775808");
}

TEST_F(LexerTest, Floats) {
    auto token = lex_one("3.14");
    EXPECT_EQ(token.kind, TokenKind::FloatLiteral);
    EXPECT_DOUBLE_EQ(token.float_value(), 3.14);
}

TEST_F(LexerTest, TrailingDotIsPunctuation) {
    auto tokens = lex("7.");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[0].int_value(), 7);
    EXPECT_EQ(tokens[1].kind, TokenKind::Dot);
}

// Strings
TEST_F(LexerTest, DoubleQuotedString) {
    auto token = lex_one("\"hello world\"");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), "hello world");
    EXPECT_EQ(token.lexeme, "\"hello world\"");
}

TEST_F(LexerTest, BacktickString) {
    auto token = lex_one("`SELECT * FROM users`");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), "SELECT * FROM users");
}

TEST_F(LexerTest, StringEscapes) {
    auto token = lex_one(R"("a\nb\tc\\d\"e")");
    EXPECT_EQ(token.string_value(), "a\nb\tc\\d\"e");
}

TEST_F(LexerTest, UnknownEscapeKeptVerbatim) {
    auto token = lex_one(R"("\q")");
    EXPECT_EQ(token.string_value(), "\\q");
}

TEST_F(LexerTest, StringKeepsOtherQuote) {
    EXPECT_EQ(lex_one("\"it's `here`\"").string_value(), "it's `here`");
}

TEST_F(LexerTest, UnterminatedString) {
    auto error = lex_error("send \"oops");
    EXPECT_EQ(error.position, 5u);
    EXPECT_EQ(error.message, "Unterminated string literal");
}

TEST_F(LexerTest, UnterminatedStringAfterBackslash) {
    auto error = lex_error("\"abc\\");
    EXPECT_EQ(error.message, "Unterminated string literal");
}

// Punctuation
TEST_F(LexerTest, Punctuation) {
    auto tokens = lex(", . : ;");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Comma);
    EXPECT_EQ(tokens[1].kind, TokenKind::Dot);
    EXPECT_EQ(tokens[2].kind, TokenKind::Colon);
    EXPECT_EQ(tokens[3].kind, TokenKind::Semi);
}

TEST_F(LexerTest, InvalidCharacter) {
    auto error = lex_error("send @ now");
    EXPECT_EQ(error.position, 5u);
    EXPECT_EQ(error.message, "Invalid token: '@'");
}

TEST_F(LexerTest, InvalidMultiByteCharacter) {
    auto error = lex_error("x \xE2\x82\xAC");
    EXPECT_EQ(error.position, 2u);
    EXPECT_EQ(error.message, "Invalid token: '\xE2\x82\xAC'");
}

TEST_F(LexerTest, LoneSlashIsInvalid) {
    auto error = lex_error("a / b");
    EXPECT_EQ(error.position, 2u);
    EXPECT_EQ(error.message, "Invalid token: '/'");
}

// Comments
TEST_F(LexerTest, LineComment) {
    auto tokens = lex("send // trailing words\nstore");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::VerbSend);
    EXPECT_EQ(tokens[1].kind, TokenKind::VerbStore);
}

TEST_F(LexerTest, BlockComment) {
    auto tokens = lex("send /* ignored\n across lines */ store");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].kind, TokenKind::VerbStore);
    EXPECT_EQ(tokens[1].span.start.line, 2u);
}

TEST_F(LexerTest, BlockCommentsDoNotNest) {
    // The first "*/" closes the comment, leaving "c */"
    auto error = lex_error("/* a /* b */ c */");
    EXPECT_EQ(error.position, 15u);
    EXPECT_EQ(error.message, "Invalid token: '*'");
}

TEST_F(LexerTest, UnterminatedBlockComment) {
    auto error = lex_error("send /* never closed");
    EXPECT_EQ(error.position, 5u);
    EXPECT_EQ(error.message, "Unterminated block comment");
}

TEST_F(LexerTest, EmptyInput) {
    EXPECT_TRUE(lex("").empty());
    EXPECT_TRUE(lex("   \n\t // only a comment").empty());
}

// Locations
TEST_F(LexerTest, TokenSpans) {
    auto tokens = lex("if user registers\n  then send");
    ASSERT_EQ(tokens.size(), 5u);

    EXPECT_EQ(tokens[1].span.start.line, 1u);
    EXPECT_EQ(tokens[1].span.start.column, 4u);
    EXPECT_EQ(tokens[1].span.start.offset, 3u);
    EXPECT_EQ(tokens[1].span.end.offset, 7u);
    EXPECT_EQ(tokens[1].span.start.length, 4u);

    EXPECT_EQ(tokens[3].kind, TokenKind::KwThen);
    EXPECT_EQ(tokens[3].span.start.line, 2u);
    EXPECT_EQ(tokens[3].span.start.column, 3u);

    EXPECT_EQ(tokens[4].span.start.column, 8u);
}

TEST_F(LexerTest, ColumnsCountCharacters) {
    auto tokens = lex("\"\xC3\xA9\xC3\xA9\xC3\xA9\" x");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].string_value(), "\xC3\xA9\xC3\xA9\xC3\xA9");
    EXPECT_EQ(tokens[1].span.start.offset, 9u);
    EXPECT_EQ(tokens[1].span.start.column, 7u);
}

TEST_F(LexerTest, CrLfLineEndings) {
    auto tokens = lex("send\r\nstore");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].span.start.line, 2u);
    EXPECT_EQ(tokens[1].span.start.column, 1u);
}

TEST_F(LexerTest, SpansAgreeWithSourceLocations) {
    auto tokens = lex("x: \"\xC3\xA9t\xC3\xA9\" /* a\nb */ send\r\n\n  // note\nif a then call b");
    ASSERT_EQ(tokens.size(), 9u);
    for (const auto& token : tokens) {
        auto start = source_->location(token.span.start.offset);
        auto end = source_->location(token.span.end.offset);
        EXPECT_EQ(token.span.start.line, start.line) << token.lexeme;
        EXPECT_EQ(token.span.start.column, start.column) << token.lexeme;
        EXPECT_EQ(token.span.end.line, end.line) << token.lexeme;
        EXPECT_EQ(token.span.end.column, end.column) << token.lexeme;
    }
    EXPECT_EQ(tokens[3].kind, TokenKind::VerbSend);
    EXPECT_EQ(tokens[3].span.start.line, 2u);
    EXPECT_EQ(tokens[4].span.start.line, 5u);
}

TEST_F(LexerTest, LongSingleLine) {
    constexpr size_t REPEAT = 100000;
    std::string code;
    code.reserve(REPEAT * 7);
    for (size_t i = 0; i < REPEAT; ++i) {
        code += "send x ";
    }

    auto started = std::chrono::steady_clock::now();
    auto tokens = lex(code);
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(tokens.size(), REPEAT * 2);
    EXPECT_EQ(tokens.back().span.start.line, 1u);
    EXPECT_EQ(tokens.back().span.start.column, (REPEAT - 1) * 7 + 6);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count(), 5);
}

// Full statements
TEST_F(LexerTest, ConditionalStatement) {
    auto tokens = lex("if new user registers then validate email using SendGrid");
    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwIf);
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[2].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[3].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[4].kind, TokenKind::KwThen);
    EXPECT_EQ(tokens[5].kind, TokenKind::VerbValidate);
    EXPECT_EQ(tokens[6].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[7].kind, TokenKind::KwUsing);
    EXPECT_EQ(tokens[8].kind, TokenKind::Service);
}

TEST_F(LexerTest, AssignmentStatement) {
    auto tokens = lex("retries: 3");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].kind, TokenKind::Colon);
    EXPECT_EQ(tokens[2].kind, TokenKind::IntLiteral);
}

TEST_F(LexerTest, NextTokenReturnsNothingAtEnd) {
    source_ = std::make_unique<Source>(Source::from_string("send"));
    Lexer lexer(*source_);

    auto first = lexer.next_token();
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(unwrap(first).has_value());
    EXPECT_EQ(unwrap(first)->kind, TokenKind::VerbSend);

    auto second = lexer.next_token();
    ASSERT_TRUE(is_ok(second));
    EXPECT_FALSE(unwrap(second).has_value());
}

TEST_F(LexerTest, FreeTokenizeWrapsLexicalError) {
    auto result = tokenize("send #");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    ASSERT_TRUE(error.is<LexicalError>());
    EXPECT_EQ(error.as<LexicalError>().position, 5u);
}

// Token helpers
TEST(TokenTest, KindNames) {
    EXPECT_EQ(token_kind_to_string(TokenKind::KwThen), "'then'");
    EXPECT_EQ(token_kind_to_string(TokenKind::VerbSend), "verb 'send'");
    EXPECT_EQ(token_kind_to_string(TokenKind::Service), "service name");
    EXPECT_EQ(token_kind_to_string(TokenKind::Identifier), "identifier");
    EXPECT_EQ(token_kind_to_string(TokenKind::StringLiteral), "string");
    EXPECT_EQ(token_kind_to_string(TokenKind::Comma), "','");
}

TEST(TokenTest, Classification) {
    EXPECT_TRUE(is_keyword(TokenKind::KwFrom));
    EXPECT_FALSE(is_keyword(TokenKind::VerbCall));
    EXPECT_TRUE(is_verb(TokenKind::VerbCall));
    EXPECT_FALSE(is_verb(TokenKind::Identifier));
    EXPECT_TRUE(is_literal(TokenKind::FloatLiteral));
    EXPECT_FALSE(is_literal(TokenKind::Service));
}

TEST(SourceTest, LinesAndLocations) {
    auto source = Source::from_string("first\nsecond\r\nthird");
    EXPECT_EQ(source.line_count(), 3u);
    EXPECT_EQ(source.line(1), "first");
    EXPECT_EQ(source.line(2), "second");
    EXPECT_EQ(source.line(3), "third");

    auto loc = source.location(8);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 3u);
}

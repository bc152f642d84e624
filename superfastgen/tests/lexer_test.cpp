#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace sfg;
using namespace sfg::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;
    std::unique_ptr<Lexer> lexer_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        lexer_ = std::make_unique<Lexer>(*source_);
        return lexer_->tokenize();
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 1u);
        return tokens[0];
    }

    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> out;
        for (const auto& t : lex(code)) {
            out.push_back(t.kind);
        }
        return out;
    }
};

// Reserved words and built-in identifiers
TEST_F(LexerTest, ReservedWords) {
    EXPECT_EQ(lex_one("class").kind, TokenKind::KwClass);
    EXPECT_EQ(lex_one("const").kind, TokenKind::KwConst);
    EXPECT_EQ(lex_one("enum").kind, TokenKind::KwEnum);
    EXPECT_EQ(lex_one("extends").kind, TokenKind::KwExtends);
    EXPECT_EQ(lex_one("with").kind, TokenKind::KwWith);
    EXPECT_EQ(lex_one("final").kind, TokenKind::KwFinal);
    EXPECT_EQ(lex_one("null").kind, TokenKind::KwNull);
    EXPECT_EQ(lex_one("void").kind, TokenKind::KwVoid);
}

TEST_F(LexerTest, BuiltInIdentifiersAreIdentifiers) {
    auto factory = lex_one("factory");
    EXPECT_EQ(factory.kind, TokenKind::Identifier);
    EXPECT_TRUE(factory.is_word("factory"));
    EXPECT_TRUE(lex_one("required").is_word("required"));
    EXPECT_TRUE(lex_one("late").is_word("late"));
    EXPECT_TRUE(lex_one("sealed").is_word("sealed"));
}

TEST_F(LexerTest, DollarInIdentifiers) {
    auto token = lex_one("_$User");
    EXPECT_EQ(token.kind, TokenKind::Identifier);
    EXPECT_EQ(token.lexeme, "_$User");

    EXPECT_EQ(lex_one("$checkedConvert").lexeme, "$checkedConvert");
}

// Numbers
TEST_F(LexerTest, Numbers) {
    EXPECT_EQ(lex_one("42").kind, TokenKind::IntLiteral);
    EXPECT_EQ(lex_one("0xFF").kind, TokenKind::IntLiteral);
    EXPECT_EQ(lex_one("1_000").kind, TokenKind::IntLiteral);
    EXPECT_EQ(lex_one("3.14").kind, TokenKind::DoubleLiteral);
    EXPECT_EQ(lex_one("1e10").kind, TokenKind::DoubleLiteral);
    EXPECT_EQ(lex_one("2.5e-3").kind, TokenKind::DoubleLiteral);
}

TEST_F(LexerTest, IntegerFollowedByMethodCall) {
    auto tokens = lex("1.toString()");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[1].kind, TokenKind::Dot);
    EXPECT_TRUE(tokens[2].is_word("toString"));
}

// Strings
TEST_F(LexerTest, SimpleStrings) {
    auto single = lex_one("'hello'");
    EXPECT_EQ(single.kind, TokenKind::StringLiteral);
    EXPECT_EQ(single.string_value(), "hello");

    auto dbl = lex_one("\"it's\"");
    EXPECT_EQ(dbl.string_value(), "it's");
}

TEST_F(LexerTest, Escapes) {
    EXPECT_EQ(lex_one(R"('a\nb')").string_value(), "a\nb");
    EXPECT_EQ(lex_one(R"('don\'t')").string_value(), "don't");
}

TEST_F(LexerTest, RawString) {
    auto token = lex_one(R"(r'a\nb')");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.lexeme, R"(r'a\nb')");
    EXPECT_EQ(token.string_value(), R"(a\nb)");
}

TEST_F(LexerTest, RawStringIgnoresDollar) {
    auto token = lex_one("r'$notInterpolated'");
    EXPECT_FALSE(token.interpolated);
    EXPECT_EQ(token.string_value(), "$notInterpolated");
}

TEST_F(LexerTest, TripleQuotedString) {
    auto token = lex_one("'''\nline one\nline 'two'\n'''");
    EXPECT_EQ(token.kind, TokenKind::StringLiteral);
    EXPECT_EQ(token.string_value(), "line one\nline 'two'\n");
}

TEST_F(LexerTest, InterpolationIsOneToken) {
    auto tokens = lex("'Hi $name and ${user.first + '}'}!' ;");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_TRUE(tokens[0].interpolated);
    EXPECT_FALSE(tokens[0].string_value().has_value());
    EXPECT_EQ(tokens[1].kind, TokenKind::Semi);
    EXPECT_TRUE(tokens[2].is_eof());
}

TEST_F(LexerTest, UnterminatedStringIsError) {
    lex("'never closed\nclass A {}");
    EXPECT_TRUE(lexer_->has_errors());
}

// Comments
TEST_F(LexerTest, CommentsAreSkipped) {
    auto token = lex_one("// line\n/// doc\n/* block */ class");
    EXPECT_EQ(token.kind, TokenKind::KwClass);
}

TEST_F(LexerTest, NestedBlockComments) {
    auto tokens = lex("/* outer /* inner */ still comment */ enum");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwEnum);
}

TEST_F(LexerTest, UnterminatedBlockCommentIsError) {
    lex("/* open /* nested */ class A {}");
    EXPECT_TRUE(lexer_->has_errors());
}

// Operators
TEST_F(LexerTest, Punctuation) {
    EXPECT_EQ(kinds("@ ( ) { } [ ] , ; :"),
              (std::vector<TokenKind>{TokenKind::At, TokenKind::LParen, TokenKind::RParen,
                                      TokenKind::LBrace, TokenKind::RBrace, TokenKind::LBracket,
                                      TokenKind::RBracket, TokenKind::Comma, TokenKind::Semi,
                                      TokenKind::Colon, TokenKind::Eof}));
}

TEST_F(LexerTest, MultiCharOperators) {
    EXPECT_EQ(lex_one("=>").kind, TokenKind::Arrow);
    EXPECT_EQ(lex_one("?.").kind, TokenKind::QuestionDot);
    EXPECT_EQ(lex_one("??").kind, TokenKind::QuestionQuestion);
    EXPECT_EQ(lex_one("??=").kind, TokenKind::CompoundAssign);
    EXPECT_EQ(lex_one("...").kind, TokenKind::Ellipsis);
    EXPECT_EQ(lex_one("..").kind, TokenKind::DotDot);
    EXPECT_EQ(lex_one("==").kind, TokenKind::EqEq);
    EXPECT_EQ(lex_one("<<").kind, TokenKind::ShiftLeft);
}

TEST_F(LexerTest, ClosingAnglesStaySeparate) {
    // `Map<String, List<int>>` must close two type argument lists.
    auto k = kinds("List<int>>");
    EXPECT_EQ(k, (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Lt,
                                         TokenKind::Identifier, TokenKind::Gt, TokenKind::Gt,
                                         TokenKind::Eof}));
}

// Locations
TEST_F(LexerTest, TokenLocations) {
    auto tokens = lex("class A {\n  int x;\n}");
    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].span.start.line, 1u);
    EXPECT_EQ(tokens[0].span.start.column, 1u);
    EXPECT_TRUE(tokens[3].is_word("int"));
    EXPECT_EQ(tokens[3].span.start.line, 2u);
    EXPECT_EQ(tokens[3].span.start.column, 3u);
}

TEST(SourceTest, LineAccess) {
    Source source("a.dart", "first\nsecond\r\nthird");
    EXPECT_EQ(source.line_count(), 3u);
    EXPECT_EQ(source.line(1), "first");
    EXPECT_EQ(source.line(2), "second");
    EXPECT_EQ(source.line(3), "third");

    auto loc = source.location(8);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 3u);
}

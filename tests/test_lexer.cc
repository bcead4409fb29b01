#include <gtest/gtest.h>

#include "ClariceError.hpp"
#include "lexer.hpp"
#include "token.hpp"

// Helper to get token types from source
std::vector<TokenType> getTokenTypes(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    std::vector<TokenType> types;
    for (const auto& tok : tokens) {
        types.push_back(tok.type);
    }
    return types;
}

TEST(LexerTest, TokenizesIntegers) {
    Lexer lexer("123", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::INTEGER);
    EXPECT_EQ(tokens[0].value, "123");
    EXPECT_EQ(tokens[1].type, TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizesFloats) {
    Lexer lexer("3.14 2e3", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::FLOAT);
    EXPECT_EQ(tokens[0].value, "3.14");
    EXPECT_EQ(tokens[1].type, TokenType::FLOAT);
    EXPECT_EQ(tokens[1].value, "2e3");
}

TEST(LexerTest, DotDotAfterIntegerIsConcat) {
    auto types = getTokenTypes("1..3");
    ASSERT_EQ(types.size(), 4u);
    EXPECT_EQ(types[0], TokenType::INTEGER);
    EXPECT_EQ(types[1], TokenType::CONCAT);
    EXPECT_EQ(types[2], TokenType::INTEGER);
}

TEST(LexerTest, IntegerOverflowIsLexError) {
    Lexer lexer("99999999999999999999", "<test>");
    EXPECT_THROW(lexer.tokenize(), LexError);
}

TEST(LexerTest, TokenizesKeywords) {
    auto types = getTokenTypes("with as let set to if then else loop do break print prompt using from and end iter in");
    std::vector<TokenType> expected = {
        TokenType::WITH, TokenType::AS, TokenType::LET, TokenType::SET, TokenType::TO,
        TokenType::IF, TokenType::THEN, TokenType::ELSE, TokenType::LOOP, TokenType::DO,
        TokenType::BREAK, TokenType::PRINT, TokenType::PROMPT, TokenType::USING, TokenType::FROM,
        TokenType::AND, TokenType::END, TokenType::ITER, TokenType::IN, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TokenizesLiteralWords) {
    Lexer lexer("true false null", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[0].value, "true");
    EXPECT_EQ(tokens[1].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[1].value, "false");
    EXPECT_EQ(tokens[2].type, TokenType::NULL_LITERAL);
}

TEST(LexerTest, IdentifiersMayContainDigitsAndUnderscores) {
    Lexer lexer("_tmp value2 withx", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[0].value, "_tmp");
    EXPECT_EQ(tokens[1].value, "value2");
    EXPECT_EQ(tokens[2].type, TokenType::IDENTIFIER);
}

TEST(LexerTest, TokenizesOperators) {
    auto types = getTokenTypes("+ - * / % = != < <= > >= .. . , ( ) [ ]");
    std::vector<TokenType> expected = {
        TokenType::PLUS, TokenType::MINUS, TokenType::STAR, TokenType::SLASH, TokenType::PERCENT,
        TokenType::EQUALITY, TokenType::NOTEQUAL, TokenType::LESSTHAN, TokenType::LESSOREQUALTHAN,
        TokenType::GREATERTHAN, TokenType::GREATEROREQUALTHAN, TokenType::CONCAT, TokenType::DOT,
        TokenType::COMMA, TokenType::OPENPARENTHESIS, TokenType::CLOSEPARENTHESIS,
        TokenType::OPENBRACKET, TokenType::CLOSEBRACKET, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

// Strings
TEST(LexerTest, DecodesEscapes) {
    Lexer lexer(R"("a\tb\n\"q\" \\ \$")", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "a\tb\n\"q\" \\ $");
}

TEST(LexerTest, UnknownEscapeIsLexError) {
    Lexer lexer(R"("\q")", "<test>");
    EXPECT_THROW(lexer.tokenize(), LexError);
}

TEST(LexerTest, TripleQuotedStringSpansLines) {
    Lexer lexer("\"\"\"\nline one\nline two\"\"\"", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "line one\nline two");
}

TEST(LexerTest, UnterminatedStringIsNotIncomplete) {
    Lexer lexer("print \"abc\nprint 1", "<test>");
    try {
        lexer.tokenize();
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_FALSE(e.incomplete());
        EXPECT_EQ(e.location().line, 1);
        EXPECT_EQ(e.location().col, 7);
    }
}

TEST(LexerTest, UnterminatedTripleQuoteIsIncomplete) {
    Lexer lexer("print \"\"\"abc\nmore", "<test>");
    try {
        lexer.tokenize();
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_TRUE(e.incomplete());
    }
}

TEST(LexerTest, TemplateStringProducesTemplateTokens) {
    auto types = getTokenTypes("\"a ${x} b\"");
    std::vector<TokenType> expected = {
        TokenType::TEMPLATE_CHUNK, TokenType::TEMPLATE_EXPR_START, TokenType::IDENTIFIER,
        TokenType::TEMPLATE_EXPR_END, TokenType::TEMPLATE_CHUNK, TokenType::TEMPLATE_END,
        TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, EscapedDollarIsNotATemplate) {
    Lexer lexer(R"("\${x}")", "<test>");
    auto tokens = lexer.tokenize();
    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "${x}");
}

// Comments and layout
TEST(LexerTest, SkipsComments) {
    auto types = getTokenTypes("# heading\nprint 1 # trailing\n");
    ASSERT_EQ(types.size(), 3u);
    EXPECT_EQ(types[0], TokenType::PRINT);
    EXPECT_EQ(types[1], TokenType::INTEGER);
}

TEST(LexerTest, TracksLineAndColumn) {
    Lexer lexer("let x\n  set x to 3", "script.clrs");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[2].type, TokenType::SET);
    EXPECT_EQ(tokens[2].loc.line, 2);
    EXPECT_EQ(tokens[2].loc.col, 3);
    EXPECT_EQ(tokens[2].loc.filename, "script.clrs");
}

TEST(LexerTest, DefaultFilenameIsRepl) {
    Lexer lexer("x", "");
    auto tokens = lexer.tokenize();
    EXPECT_EQ(tokens[0].loc.filename, "<repl>");
}

TEST(LexerTest, InvalidCharacterCarriesLocation) {
    Lexer lexer("print 1\nprint @", "<test>");
    try {
        lexer.tokenize();
        FAIL() << "expected LexError";
    } catch (const LexError& e) {
        EXPECT_EQ(e.location().line, 2);
        EXPECT_EQ(e.location().col, 7);
        EXPECT_NE(std::string(e.what()).find("Invalid character '@'"), std::string::npos);
    }
}

TEST(LexerTest, EmptyInputIsJustEof) {
    auto types = getTokenTypes("   \n\t ");
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], TokenType::EOF_TOKEN);
}

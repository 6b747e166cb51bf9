#include <catch2/catch.hpp>

#include <declex/Frontend/Compiler/ErrorMessages.hpp>
#include <declex/Frontend/Compiler/Lexer.hpp>

#include "TestConfig.hpp"

using namespace declex::Lexer;

namespace
{
std::vector<TokenType> tokenTypes(std::string_view code, const declex::LanguageOptions& options = {})
{
    std::vector<declex::ParseError> errors;
    auto tokens = tokenize(code, options, &errors);
    UNSCOPED_INFO(declex::Tests::errorText(errors));
    REQUIRE(errors.empty());
    std::vector<TokenType> result;
    for (auto& iter : tokens)
    {
        result.push_back(iter.getTokenType());
    }
    return result;
}
} // namespace

TEST_CASE("Lexing keywords", "[lexer]")
{
    std::vector<std::string_view> keywords = {"typedef", "const",  "volatile", "restrict", "struct", "union",
                                              "enum",    "void",   "char",     "short",    "int",    "long",
                                              "float",   "double", "signed",   "unsigned", "_Bool",  "_Complex"};
    for (auto keyword : keywords)
    {
        auto tokens = tokenize(keyword, {});
        REQUIRE(tokens.size() == 1);
        CHECK(tokens[0].getTokenType() != TokenType::Identifier);
        CHECK(tokenValue(tokens[0].getTokenType()) == keyword);
        CHECK(tokens[0].getRepresentation() == keyword);
    }
    CHECK(tokenTypes("integer") == std::vector{TokenType::Identifier});
    CHECK(tokenTypes("Int") == std::vector{TokenType::Identifier});
    CHECK(tokenTypes("_bool") == std::vector{TokenType::Identifier});
}

TEST_CASE("Lexing identifiers", "[lexer]")
{
    auto tokens = tokenize("_foo bar123 Baz_", {});
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].getRepresentation() == "_foo");
    CHECK(tokens[1].getRepresentation() == "bar123");
    CHECK(tokens[2].getRepresentation() == "Baz_");
    for (auto& iter : tokens)
    {
        CHECK(iter.getTokenType() == TokenType::Identifier);
    }
}

TEST_CASE("Lexing punctuators", "[lexer]")
{
    CHECK(tokenTypes("int *p[10];")
          == std::vector{TokenType::IntKeyword, TokenType::Asterisk, TokenType::Identifier,
                         TokenType::OpenSquareBracket, TokenType::Literal, TokenType::CloseSquareBracket,
                         TokenType::SemiColon});
    CHECK(tokenTypes("(a,b)")
          == std::vector{TokenType::OpenParentheses, TokenType::Identifier, TokenType::Comma, TokenType::Identifier,
                         TokenType::CloseParentheses});
}

TEST_CASE("Lexing literals", "[lexer]")
{
    SECTION("Literals are lexed as a whole")
    {
        for (std::string_view literal : {"10", "0x1F", "010", "10u", "10ULL", "1abc", "08"})
        {
            auto tokens = tokenize(literal, {});
            REQUIRE(tokens.size() == 1);
            CHECK(tokens[0].getTokenType() == TokenType::Literal);
            CHECK(tokens[0].getRepresentation() == literal);
        }
    }
    SECTION("Identifiers can't start with a digit")
    {
        CHECK(tokenTypes("1a b") == std::vector{TokenType::Literal, TokenType::Identifier});
    }
}

TEST_CASE("Lexing offsets", "[lexer]")
{
    auto tokens = tokenize("  int\t*\n foo", {});
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].getOffset() == 2);
    CHECK(tokens[0].getEndOffset() == 5);
    CHECK(tokens[1].getOffset() == 6);
    CHECK(tokens[1].getLength() == 1);
    CHECK(tokens[2].getOffset() == 9);
    CHECK(tokens[2].getEndOffset() == 12);
}

TEST_CASE("Lexing comments", "[lexer]")
{
    SECTION("Block comments")
    {
        auto tokens = tokenize("int /* a comment */ x", {});
        REQUIRE(tokens.size() == 2);
        CHECK(tokens[1].getRepresentation() == "x");
        CHECK(tokens[1].getOffset() == 20);
    }
    SECTION("Line comments")
    {
        CHECK(tokenTypes("int // x\n y") == std::vector{TokenType::IntKeyword, TokenType::Identifier});
        CHECK(tokenTypes("int // x") == std::vector{TokenType::IntKeyword});
    }
    SECTION("Unterminated comment")
    {
        std::vector<declex::ParseError> errors;
        auto tokens = tokenize("int x /* abc", {}, &errors);
        CHECK(tokens.size() == 2);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == declex::ParseError(6, 12, declex::Errors::Lexer::UNTERMINATED_COMMENT));
        CHECK(errors[0].str() == "at 6..12: unterminated comment");
    }
}

TEST_CASE("Lexing trigraphs and digraphs", "[lexer]")
{
    SECTION("Trigraphs")
    {
        auto tokens = tokenize("x?\?(10?\?)", {});
        REQUIRE(tokens.size() == 4);
        CHECK(tokens[1].getTokenType() == TokenType::OpenSquareBracket);
        CHECK(tokens[1].getRepresentation() == "?\?(");
        CHECK(tokens[3].getTokenType() == TokenType::CloseSquareBracket);
        CHECK(tokenTypes("?\?=") == std::vector{TokenType::Miscellaneous});
    }
    SECTION("Trigraphs disabled")
    {
        declex::LanguageOptions options;
        options.allowTrigraphs = false;
        CHECK(tokenTypes("?\?(", options)
              == std::vector{TokenType::Miscellaneous, TokenType::Miscellaneous, TokenType::OpenParentheses});
    }
    SECTION("Digraphs")
    {
        CHECK(tokenTypes("x<:10:>")
              == std::vector{TokenType::Identifier, TokenType::OpenSquareBracket, TokenType::Literal,
                             TokenType::CloseSquareBracket});
        declex::LanguageOptions options;
        options.allowDigraphs = false;
        CHECK(tokenTypes("<:", options) == std::vector{TokenType::Miscellaneous, TokenType::Miscellaneous});
    }
}

TEST_CASE("Lexing miscellaneous characters", "[lexer]")
{
    auto tokens = tokenize("int = \xc3\xa4", {});
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[1].getTokenType() == TokenType::Miscellaneous);
    CHECK(tokens[1].getRepresentation() == "=");
    CHECK(tokens[2].getTokenType() == TokenType::Miscellaneous);
    CHECK(tokens[2].getRepresentation() == "\xc3\xa4");
    SECTION("Truncated UTF-8 sequence")
    {
        auto truncated = tokenize("\xe2\x82", {});
        REQUIRE(truncated.size() == 1);
        CHECK(truncated[0].getLength() == 2);
    }
}

TEST_CASE("Token names", "[lexer]")
{
    CHECK(tokenName(TokenType::Identifier) == "identifier");
    CHECK(tokenName(TokenType::Literal) == "integer");
    CHECK(tokenName(TokenType::OpenParentheses) == "'('");
    CHECK(tokenName(TokenType::IntKeyword) == "'int'");
    CHECK(tokenValue(TokenType::Identifier).empty());
}

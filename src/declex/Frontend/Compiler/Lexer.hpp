#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "LanguageOptions.hpp"
#include "ParseError.hpp"

namespace declex::Lexer
{
enum class TokenType : std::uint8_t
{
    Identifier,
    Literal,
    OpenParentheses,
    CloseParentheses,
    OpenSquareBracket,
    CloseSquareBracket,
    Asterisk,
    Comma,
    SemiColon,
    TypedefKeyword,
    ConstKeyword,
    VolatileKeyword,
    RestrictKeyword,
    StructKeyword,
    UnionKeyword,
    EnumKeyword,
    VoidKeyword,
    CharKeyword,
    ShortKeyword,
    IntKeyword,
    LongKeyword,
    FloatKeyword,
    DoubleKeyword,
    SignedKeyword,
    UnsignedKeyword,
    UnderlineBool,
    UnderlineComplex,
    Miscellaneous, ///< Any character not part of the declaration grammar
    TOKEN_MAX_VALUE = Miscellaneous
};

class Token final
{
    TokenType m_tokenType;
    std::uint64_t m_offset; ///< Byte offset of the first character in the source
    std::string_view m_representation;

public:
    Token(TokenType tokenType, std::uint64_t offset, std::string_view representation)
        : m_tokenType(tokenType), m_offset(offset), m_representation(representation)
    {
    }

    [[nodiscard]] TokenType getTokenType() const noexcept
    {
        return m_tokenType;
    }

    [[nodiscard]] std::uint64_t getOffset() const noexcept
    {
        return m_offset;
    }

    [[nodiscard]] std::uint64_t getLength() const noexcept
    {
        return m_representation.size();
    }

    [[nodiscard]] std::uint64_t getEndOffset() const noexcept
    {
        return m_offset + m_representation.size();
    }

    /**
     * Spelling of the token as written in the source. Trigraphs and digraphs are not replaced
     */
    [[nodiscard]] std::string_view getRepresentation() const noexcept
    {
        return m_representation;
    }
};

using TokenIterator = const Token*;

/**
 * Splits source into tokens. Tokens reference the source, which therefore has to outlive the result
 *
 * Problems that prevent lexing of the remaining input are appended to errors if it is not null
 */
std::vector<Token> tokenize(std::string_view source, const LanguageOptions& languageOptions,
                            std::vector<ParseError>* errors = nullptr);

/**
 * Name of the token type as used in diagnostics, eg. "'('" or "identifier"
 */
std::string_view tokenName(TokenType tokenType);

/**
 * Spelling of keywords and punctuators. Empty for identifiers, literals and miscellaneous tokens
 */
std::string_view tokenValue(TokenType tokenType);

} // namespace declex::Lexer

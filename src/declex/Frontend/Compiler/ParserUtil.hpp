#pragma once

#include <bitset>
#include <string>
#include <vector>

#include "Parser.hpp"

namespace declex::Parser
{
using TokenBitSet = std::bitset<static_cast<std::size_t>(Lexer::TokenType::TOKEN_MAX_VALUE) + 1>;

template <class... Args>
constexpr TokenBitSet fromTokenTypes(Args&&... tokenTypes)
{
    static_assert(static_cast<std::size_t>(Lexer::TokenType::TOKEN_MAX_VALUE) < 64);
    return TokenBitSet(((1ull << static_cast<std::size_t>(tokenTypes)) | ... | 0ull));
}

inline bool isIn(const TokenBitSet& set, Lexer::TokenType tokenType)
{
    return set[static_cast<std::size_t>(tokenType)];
}

constexpr TokenBitSet firstQualifierSet = fromTokenTypes(
    Lexer::TokenType::ConstKeyword, Lexer::TokenType::VolatileKeyword, Lexer::TokenType::RestrictKeyword);

constexpr TokenBitSet firstPrimitiveTypeSet = fromTokenTypes(
    Lexer::TokenType::VoidKeyword, Lexer::TokenType::CharKeyword, Lexer::TokenType::ShortKeyword,
    Lexer::TokenType::IntKeyword, Lexer::TokenType::LongKeyword, Lexer::TokenType::FloatKeyword,
    Lexer::TokenType::DoubleKeyword, Lexer::TokenType::SignedKeyword, Lexer::TokenType::UnsignedKeyword,
    Lexer::TokenType::UnderlineBool);

constexpr TokenBitSet firstRecordSet =
    fromTokenTypes(Lexer::TokenType::StructKeyword, Lexer::TokenType::UnionKeyword, Lexer::TokenType::EnumKeyword);

constexpr TokenBitSet firstQualifiedTypeSet = fromTokenTypes(
    Lexer::TokenType::ConstKeyword, Lexer::TokenType::VolatileKeyword, Lexer::TokenType::RestrictKeyword,
    Lexer::TokenType::VoidKeyword, Lexer::TokenType::CharKeyword, Lexer::TokenType::ShortKeyword,
    Lexer::TokenType::IntKeyword, Lexer::TokenType::LongKeyword, Lexer::TokenType::FloatKeyword,
    Lexer::TokenType::DoubleKeyword, Lexer::TokenType::SignedKeyword, Lexer::TokenType::UnsignedKeyword,
    Lexer::TokenType::UnderlineBool, Lexer::TokenType::StructKeyword, Lexer::TokenType::UnionKeyword,
    Lexer::TokenType::EnumKeyword, Lexer::TokenType::Identifier);

/**
 * Alternative labels used in syntax errors
 */
namespace Label
{
constexpr auto TYPE_QUALIFIER = "type qualifier";
constexpr auto TYPE = "type";
constexpr auto FUNCTION_PARAMETER = "function parameter";
} // namespace Label

Syntax::TypeQualifier toQualifier(Lexer::TokenType tokenType);

/**
 * Consumes a token of type expected. Otherwise logs an error listing alternatives, which should include
 * expected, and returns false
 */
bool expect(Lexer::TokenType expected, Lexer::TokenIterator& begin, Lexer::TokenIterator end, Context& context,
            std::vector<std::string> alternatives);

} // namespace declex::Parser

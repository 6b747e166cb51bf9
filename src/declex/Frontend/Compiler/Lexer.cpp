#include "Lexer.hpp"

#include <declex/Support/Text.hpp>

#include <optional>
#include <unordered_map>

#include <ctre.hpp>

#include "ErrorMessages.hpp"

using namespace declex::Lexer;

namespace
{
constexpr static auto IDENTIFIER_PATTERN = ctll::fixed_string{"[_a-zA-Z][_a-zA-Z0-9]*"};

// Preprocessing number. Whether it is a valid integer constant is checked by the parser
constexpr static auto LITERAL_PATTERN = ctll::fixed_string{"[0-9][_a-zA-Z0-9]*"};

constexpr static auto TRIGRAPH_PATTERN = ctll::fixed_string{R"(\?\?[=()/'<>!\-])"};

std::optional<TokenType> charactersToKeyword(std::string_view characters)
{
    static const std::unordered_map<std::string_view, TokenType> keywords = {
        {"typedef", TokenType::TypedefKeyword},   {"const", TokenType::ConstKeyword},
        {"volatile", TokenType::VolatileKeyword}, {"restrict", TokenType::RestrictKeyword},
        {"struct", TokenType::StructKeyword},     {"union", TokenType::UnionKeyword},
        {"enum", TokenType::EnumKeyword},         {"void", TokenType::VoidKeyword},
        {"char", TokenType::CharKeyword},         {"short", TokenType::ShortKeyword},
        {"int", TokenType::IntKeyword},           {"long", TokenType::LongKeyword},
        {"float", TokenType::FloatKeyword},       {"double", TokenType::DoubleKeyword},
        {"signed", TokenType::SignedKeyword},     {"unsigned", TokenType::UnsignedKeyword},
        {"_Bool", TokenType::UnderlineBool},      {"_Complex", TokenType::UnderlineComplex}};
    auto result = keywords.find(characters);
    if (result == keywords.end())
    {
        return std::nullopt;
    }
    return result->second;
}

std::optional<TokenType> charToPunctuator(char c)
{
    switch (c)
    {
        case '(': return TokenType::OpenParentheses;
        case ')': return TokenType::CloseParentheses;
        case '[': return TokenType::OpenSquareBracket;
        case ']': return TokenType::CloseSquareBracket;
        case '*': return TokenType::Asterisk;
        case ',': return TokenType::Comma;
        case ';': return TokenType::SemiColon;
        default: return std::nullopt;
    }
}
} // namespace

std::vector<Token> declex::Lexer::tokenize(std::string_view source, const LanguageOptions& languageOptions,
                                           std::vector<ParseError>* errors)
{
    std::vector<Token> result;
    std::uint64_t offset = 0;
    while (offset < source.size())
    {
        auto rest = source.substr(offset);
        if (isWhitespace(rest.front()))
        {
            offset++;
            continue;
        }
        if (rest.substr(0, 2) == "//")
        {
            auto newline = rest.find('\n');
            offset = newline == rest.npos ? source.size() : offset + newline + 1;
            continue;
        }
        if (rest.substr(0, 2) == "/*")
        {
            auto close = rest.find("*/", 2);
            if (close == rest.npos)
            {
                if (errors)
                {
                    errors->emplace_back(offset, source.size(), Errors::Lexer::UNTERMINATED_COMMENT);
                }
                break;
            }
            offset += close + 2;
            continue;
        }
        if (auto identifier = ctre::starts_with<IDENTIFIER_PATTERN>(rest))
        {
            auto view = identifier.view();
            result.emplace_back(charactersToKeyword(view).value_or(TokenType::Identifier), offset, view);
            offset += view.size();
            continue;
        }
        if (auto literal = ctre::starts_with<LITERAL_PATTERN>(rest))
        {
            auto view = literal.view();
            result.emplace_back(TokenType::Literal, offset, view);
            offset += view.size();
            continue;
        }
        if (languageOptions.allowTrigraphs)
        {
            if (auto trigraph = ctre::starts_with<TRIGRAPH_PATTERN>(rest))
            {
                auto view = trigraph.view();
                auto tokenType = TokenType::Miscellaneous;
                if (view.back() == '(')
                {
                    tokenType = TokenType::OpenSquareBracket;
                }
                else if (view.back() == ')')
                {
                    tokenType = TokenType::CloseSquareBracket;
                }
                result.emplace_back(tokenType, offset, view);
                offset += view.size();
                continue;
            }
        }
        if (languageOptions.allowDigraphs && (rest.substr(0, 2) == "<:" || rest.substr(0, 2) == ":>"))
        {
            result.emplace_back(rest.front() == '<' ? TokenType::OpenSquareBracket : TokenType::CloseSquareBracket,
                                offset, rest.substr(0, 2));
            offset += 2;
            continue;
        }
        if (auto punctuator = charToPunctuator(rest.front()))
        {
            result.emplace_back(*punctuator, offset, rest.substr(0, 1));
            offset++;
            continue;
        }
        auto step = getNumBytesForUTF8(rest);
        result.emplace_back(TokenType::Miscellaneous, offset, rest.substr(0, step));
        offset += step;
    }
    return result;
}

std::string_view declex::Lexer::tokenName(TokenType tokenType)
{
    switch (tokenType)
    {
        case TokenType::Identifier: return "identifier";
        case TokenType::Literal: return "integer";
        case TokenType::OpenParentheses: return "'('";
        case TokenType::CloseParentheses: return "')'";
        case TokenType::OpenSquareBracket: return "'['";
        case TokenType::CloseSquareBracket: return "']'";
        case TokenType::Asterisk: return "'*'";
        case TokenType::Comma: return "','";
        case TokenType::SemiColon: return "';'";
        case TokenType::TypedefKeyword: return "'typedef'";
        case TokenType::ConstKeyword: return "'const'";
        case TokenType::VolatileKeyword: return "'volatile'";
        case TokenType::RestrictKeyword: return "'restrict'";
        case TokenType::StructKeyword: return "'struct'";
        case TokenType::UnionKeyword: return "'union'";
        case TokenType::EnumKeyword: return "'enum'";
        case TokenType::VoidKeyword: return "'void'";
        case TokenType::CharKeyword: return "'char'";
        case TokenType::ShortKeyword: return "'short'";
        case TokenType::IntKeyword: return "'int'";
        case TokenType::LongKeyword: return "'long'";
        case TokenType::FloatKeyword: return "'float'";
        case TokenType::DoubleKeyword: return "'double'";
        case TokenType::SignedKeyword: return "'signed'";
        case TokenType::UnsignedKeyword: return "'unsigned'";
        case TokenType::UnderlineBool: return "'_Bool'";
        case TokenType::UnderlineComplex: return "'_Complex'";
        case TokenType::Miscellaneous: return "character";
    }
    DECLEX_UNREACHABLE;
}

std::string_view declex::Lexer::tokenValue(TokenType tokenType)
{
    switch (tokenType)
    {
        case TokenType::Identifier:
        case TokenType::Literal:
        case TokenType::Miscellaneous: return "";
        case TokenType::OpenParentheses: return "(";
        case TokenType::CloseParentheses: return ")";
        case TokenType::OpenSquareBracket: return "[";
        case TokenType::CloseSquareBracket: return "]";
        case TokenType::Asterisk: return "*";
        case TokenType::Comma: return ",";
        case TokenType::SemiColon: return ";";
        case TokenType::TypedefKeyword: return "typedef";
        case TokenType::ConstKeyword: return "const";
        case TokenType::VolatileKeyword: return "volatile";
        case TokenType::RestrictKeyword: return "restrict";
        case TokenType::StructKeyword: return "struct";
        case TokenType::UnionKeyword: return "union";
        case TokenType::EnumKeyword: return "enum";
        case TokenType::VoidKeyword: return "void";
        case TokenType::CharKeyword: return "char";
        case TokenType::ShortKeyword: return "short";
        case TokenType::IntKeyword: return "int";
        case TokenType::LongKeyword: return "long";
        case TokenType::FloatKeyword: return "float";
        case TokenType::DoubleKeyword: return "double";
        case TokenType::SignedKeyword: return "signed";
        case TokenType::UnsignedKeyword: return "unsigned";
        case TokenType::UnderlineBool: return "_Bool";
        case TokenType::UnderlineComplex: return "_Complex";
    }
    DECLEX_UNREACHABLE;
}

#include "Parser.hpp"

#include <llvm/ADT/StringRef.h>

#include <algorithm>
#include <limits>

#include <ctre.hpp>

#include "ErrorMessages.hpp"
#include "ParserUtil.hpp"

using namespace declex::Syntax;

namespace
{
constexpr static auto INTEGER_LITERAL_PATTERN =
    ctll::fixed_string{R"((0[xX][0-9a-fA-F]+|[0-9]+)([uU](ll|LL|l|L)?|(ll|LL|l|L)[uU]?)?)"};

std::string name(declex::Lexer::TokenType tokenType)
{
    auto result = declex::Lexer::tokenName(tokenType);
    return std::string(result.begin(), result.end());
}

/**
 * Number of tokens starting at begin that spell primitiveType or 0 if they don't
 */
std::size_t matchPrimitiveType(const PrimitiveType& primitiveType, declex::Lexer::TokenIterator begin,
                               declex::Lexer::TokenIterator end)
{
    auto spelling = primitiveType.getSpelling();
    std::size_t count = 0;
    while (!spelling.empty())
    {
        auto word = spelling.substr(0, spelling.find(' '));
        spelling.remove_prefix(std::min(spelling.size(), word.size() + 1));
        if (begin == end || begin->getTokenType() == declex::Lexer::TokenType::Identifier
            || begin->getRepresentation() != word)
        {
            return 0;
        }
        begin++;
        count++;
    }
    return count;
}

std::optional<PrimitiveType> parsePrimitiveType(declex::Lexer::TokenIterator& begin,
                                                declex::Lexer::TokenIterator end)
{
    std::optional<PrimitiveType> result;
    std::size_t longest = 0;
    for (auto& iter : PrimitiveType::all())
    {
        auto count = matchPrimitiveType(iter, begin, end);
        if (count > longest)
        {
            longest = count;
            result = iter;
        }
    }
    begin += longest;
    return result;
}

/**
 * A parenthesis in the position of the atom opens a nested declarator instead of a parameter list if the token after
 * it can only continue a declarator
 */
bool startsNestedDeclarator(declex::Lexer::TokenIterator next, declex::Lexer::TokenIterator end,
                            const declex::Parser::Context& context)
{
    if (next == end)
    {
        return false;
    }
    switch (next->getTokenType())
    {
        case declex::Lexer::TokenType::Asterisk:
        case declex::Lexer::TokenType::OpenParentheses:
        case declex::Lexer::TokenType::OpenSquareBracket: return true;
        case declex::Lexer::TokenType::Identifier: return !context.isTypedef(next->getRepresentation());
        default: return false;
    }
}

TypeQualifiers parseQualifiers(declex::Lexer::TokenIterator& begin, declex::Lexer::TokenIterator end)
{
    TypeQualifiers qualifiers;
    while (begin < end && declex::Parser::isIn(declex::Parser::firstQualifierSet, begin->getTokenType()))
    {
        qualifiers.insert(declex::Parser::toQualifier(begin->getTokenType()));
        begin++;
    }
    return qualifiers;
}

} // namespace

std::vector<Declaration> declex::Parser::parseTranslationUnit(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                              Context& context)
{
    std::vector<Declaration> declarations;
    while (begin < end)
    {
        begin = std::find_if_not(begin, end, [](const Lexer::Token& token) {
            return token.getTokenType() == Lexer::TokenType::SemiColon;
        });
        if (begin == end)
        {
            break;
        }
        std::vector<std::string> continuations;
        auto result = parseExternalDeclaration(begin, end, context, continuations);
        if (!result)
        {
            context.skipUntil(begin, end, Lexer::TokenType::SemiColon);
            continue;
        }
        if (begin < end && begin->getTokenType() != Lexer::TokenType::SemiColon)
        {
            continuations.emplace_back(Errors::END_OF_INPUT);
            context.unexpected(begin, end, std::move(continuations));
            context.skipUntil(begin, end, Lexer::TokenType::SemiColon);
            continue;
        }
        if (result->isTypedef())
        {
            if (auto typedefName = result->getDeclarator().getName())
            {
                context.addTypedef(*typedefName);
            }
        }
        declarations.push_back(std::move(*result));
    }
    return declarations;
}

std::optional<Declaration> declex::Parser::parseExternalDeclaration(Lexer::TokenIterator& begin,
                                                                    Lexer::TokenIterator end, Context& context,
                                                                    std::vector<std::string>& continuations)
{
    auto depthReset = context.saveNestingDepth();
    bool isTypedef = false;
    if (begin < end && begin->getTokenType() == Lexer::TokenType::TypedefKeyword)
    {
        isTypedef = true;
        begin++;
    }
    auto qualifiedType = parseQualifiedType(begin, end, context);
    if (!qualifiedType)
    {
        return {};
    }
    auto declarator = parseDeclarator(begin, end, context, continuations);
    if (!declarator)
    {
        return {};
    }
    if (!isTypedef)
    {
        return Declaration(std::move(*qualifiedType), std::move(*declarator));
    }
    auto qualifiers = qualifiedType->getQualifiers();
    qualifiers.insert(TypeQualifier::Typedef);
    return Declaration(QualifiedType(qualifiers, qualifiedType->getType()), std::move(*declarator));
}

std::optional<Declaration> declex::Parser::parseParameterDeclaration(Lexer::TokenIterator& begin,
                                                                     Lexer::TokenIterator end, Context& context,
                                                                     std::vector<std::string>& continuations)
{
    auto qualifiedType = parseQualifiedType(begin, end, context);
    if (!qualifiedType)
    {
        return {};
    }
    auto declarator = parseDeclarator(begin, end, context, continuations);
    if (!declarator)
    {
        return {};
    }
    return Declaration(std::move(*qualifiedType), std::move(*declarator));
}

std::optional<QualifiedType> declex::Parser::parseQualifiedType(Lexer::TokenIterator& begin,
                                                                Lexer::TokenIterator end, Context& context)
{
    auto qualifiers = parseQualifiers(begin, end);
    if (begin == end)
    {
        context.unexpected(begin, end, {Label::TYPE_QUALIFIER, Label::TYPE});
        return {};
    }
    if (isIn(firstPrimitiveTypeSet, begin->getTokenType()))
    {
        auto primitiveType = parsePrimitiveType(begin, end);
        DECLEX_ASSERT(primitiveType);
        return QualifiedType(qualifiers, *primitiveType);
    }
    if (isIn(firstRecordSet, begin->getTokenType()))
    {
        auto kind = begin->getTokenType() == Lexer::TokenType::StructKeyword ?
                        RecordKind::Struct :
                        (begin->getTokenType() == Lexer::TokenType::UnionKeyword ? RecordKind::Union :
                                                                                   RecordKind::Enum);
        begin++;
        if (begin == end || begin->getTokenType() != Lexer::TokenType::Identifier)
        {
            context.unexpected(begin, end, {name(Lexer::TokenType::Identifier)});
            return {};
        }
        auto tag = begin->getRepresentation();
        begin++;
        return QualifiedType(qualifiers, RecordType(kind, tag));
    }
    if (begin->getTokenType() == Lexer::TokenType::Identifier)
    {
        auto identifier = begin->getRepresentation();
        if (!context.isTypedef(identifier))
        {
            context.log(ParseError(begin->getOffset(), begin->getEndOffset(),
                                   Errors::Parser::N_IS_USED_AS_A_TYPE_BUT_HAS_NOT_BEEN_DEFINED.args(identifier)));
            return {};
        }
        begin++;
        return QualifiedType(qualifiers, CustomType(identifier));
    }
    context.unexpected(begin, end, {Label::TYPE_QUALIFIER, Label::TYPE});
    return {};
}

std::optional<Declarator> declex::Parser::parseDeclarator(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                          Context& context, std::vector<std::string>& continuations)
{
    std::vector<TypeQualifiers> pointers;
    while (begin < end && begin->getTokenType() == Lexer::TokenType::Asterisk)
    {
        context.increaseNestingDepth(begin);
        begin++;
        pointers.push_back(parseQualifiers(begin, end));
    }
    auto directDeclarator = parseDirectDeclarator(begin, end, context, continuations, !pointers.empty());
    if (!directDeclarator)
    {
        return {};
    }
    // The pointer written first applies last
    auto result = std::move(*directDeclarator);
    for (auto iter = pointers.rbegin(); iter != pointers.rend(); iter++)
    {
        result = Declarator(PointerDeclarator(std::move(result), *iter));
    }
    return result;
}

std::optional<Declarator> declex::Parser::parseDirectDeclarator(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                                Context& context,
                                                                std::vector<std::string>& continuations,
                                                                bool afterPointer)
{
    std::optional<Declarator> atom;
    if (begin < end && begin->getTokenType() == Lexer::TokenType::Identifier)
    {
        atom.emplace(IdentifierDeclarator(begin->getRepresentation()));
        begin++;
    }
    else if (begin < end && begin->getTokenType() == Lexer::TokenType::OpenParentheses
             && startsNestedDeclarator(begin + 1, end, context))
    {
        context.increaseNestingDepth(begin);
        begin++;
        std::vector<std::string> innerContinuations;
        auto declarator = parseDeclarator(begin, end, context, innerContinuations);
        if (!declarator)
        {
            return {};
        }
        innerContinuations.push_back(name(Lexer::TokenType::CloseParentheses));
        if (!expect(Lexer::TokenType::CloseParentheses, begin, end, context, std::move(innerContinuations)))
        {
            return {};
        }
        atom = std::move(declarator);
    }

    auto result = atom ? std::move(*atom) : Declarator();
    bool hasSuffix = false;
    while (begin < end
           && (begin->getTokenType() == Lexer::TokenType::OpenSquareBracket
               || begin->getTokenType() == Lexer::TokenType::OpenParentheses))
    {
        context.increaseNestingDepth(begin);
        hasSuffix = true;
        if (begin->getTokenType() == Lexer::TokenType::OpenParentheses)
        {
            begin++;
            auto parameters = parseParameterList(begin, end, context);
            if (!parameters)
            {
                return {};
            }
            result = Declarator(FunctionDeclarator(std::move(result), std::move(*parameters)));
            continue;
        }

        begin++;
        std::optional<std::size_t> size;
        if (begin < end && begin->getTokenType() == Lexer::TokenType::Literal)
        {
            size = parseArraySize(begin, context);
            if (!size)
            {
                return {};
            }
            begin++;
            if (!expect(Lexer::TokenType::CloseSquareBracket, begin, end, context,
                        {name(Lexer::TokenType::CloseSquareBracket)}))
            {
                return {};
            }
        }
        else if (!expect(Lexer::TokenType::CloseSquareBracket, begin, end, context,
                         {name(Lexer::TokenType::Literal), name(Lexer::TokenType::CloseSquareBracket)}))
        {
            return {};
        }
        result = Declarator(ArrayDeclarator(std::move(result), size));
    }

    if (atom || hasSuffix)
    {
        continuations = {name(Lexer::TokenType::OpenSquareBracket), name(Lexer::TokenType::OpenParentheses)};
    }
    else if (afterPointer)
    {
        continuations = {Label::TYPE_QUALIFIER, name(Lexer::TokenType::Asterisk),
                         name(Lexer::TokenType::Identifier), name(Lexer::TokenType::OpenParentheses),
                         name(Lexer::TokenType::OpenSquareBracket)};
    }
    else
    {
        continuations = {name(Lexer::TokenType::Asterisk), name(Lexer::TokenType::Identifier),
                         name(Lexer::TokenType::OpenParentheses), name(Lexer::TokenType::OpenSquareBracket)};
    }
    return result;
}

std::optional<std::vector<Declaration>> declex::Parser::parseParameterList(Lexer::TokenIterator& begin,
                                                                           Lexer::TokenIterator end, Context& context)
{
    auto openParentheses = begin - 1;
    if (begin < end && begin->getTokenType() == Lexer::TokenType::CloseParentheses)
    {
        if (context.getLanguageOptions().warnUnprototypedFunctions)
        {
            context.log(Message::warning(Errors::AT_N_N_N.args(openParentheses->getOffset(), begin->getEndOffset(),
                                                               Errors::Parser::FUNCTION_DECLARATION_WITHOUT_A_PROTOTYPE)));
        }
        begin++;
        return std::vector<Declaration>{};
    }
    if (end - begin >= 2 && begin->getTokenType() == Lexer::TokenType::VoidKeyword
        && (begin + 1)->getTokenType() == Lexer::TokenType::CloseParentheses)
    {
        begin += 2;
        return std::vector<Declaration>{};
    }

    std::vector<Declaration> parameters;
    while (true)
    {
        if (begin == end || !isIn(firstQualifiedTypeSet, begin->getTokenType()))
        {
            context.unexpected(begin, end, {Label::FUNCTION_PARAMETER, name(Lexer::TokenType::CloseParentheses)});
            return {};
        }
        std::vector<std::string> continuations;
        {
            auto depthReset = context.saveNestingDepth();
            auto parameter = parseParameterDeclaration(begin, end, context, continuations);
            if (!parameter)
            {
                return {};
            }
            parameters.push_back(std::move(*parameter));
        }
        if (begin < end && begin->getTokenType() == Lexer::TokenType::Comma)
        {
            begin++;
            if (begin < end && begin->getTokenType() == Lexer::TokenType::CloseParentheses)
            {
                begin++;
                return std::move(parameters);
            }
            continue;
        }
        continuations.push_back(name(Lexer::TokenType::Comma));
        continuations.push_back(name(Lexer::TokenType::CloseParentheses));
        if (!expect(Lexer::TokenType::CloseParentheses, begin, end, context, std::move(continuations)))
        {
            return {};
        }
        return std::move(parameters);
    }
}

std::optional<std::size_t> declex::Parser::parseArraySize(Lexer::TokenIterator literal, Context& context)
{
    auto text = literal->getRepresentation();
    if (!ctre::match<INTEGER_LITERAL_PATTERN>(text))
    {
        context.log(ParseError(literal->getOffset(), literal->getEndOffset(),
                               Errors::Parser::INVALID_INTEGER_LITERAL_N.args(text)));
        return {};
    }
    auto digits = llvm::StringRef(text.data(), text.size()).rtrim("uUlL");
    unsigned radix = 10;
    if (digits.startswith("0x") || digits.startswith("0X"))
    {
        radix = 16;
        digits = digits.drop_front(2);
    }
    else if (digits.size() > 1 && digits.front() == '0')
    {
        radix = 8;
        auto invalid = digits.find_first_of("89");
        if (invalid != llvm::StringRef::npos)
        {
            context.log(ParseError(literal->getOffset(), literal->getEndOffset(),
                                   Errors::Parser::INVALID_DIGIT_N_IN_OCTAL_CONSTANT.args(digits[invalid])));
            return {};
        }
    }
    unsigned long long value;
    if (digits.getAsInteger(radix, value) || value > std::numeric_limits<std::size_t>::max())
    {
        context.log(ParseError(literal->getOffset(), literal->getEndOffset(), Errors::Parser::NUMBER_TOO_LARGE));
        return {};
    }
    return static_cast<std::size_t>(value);
}

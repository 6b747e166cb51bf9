#include "Parser.hpp"

#include <declex/Support/Text.hpp>

#include <algorithm>
#include <iterator>

#include "ErrorMessages.hpp"
#include "ParserUtil.hpp"

declex::Parser::ParseResult declex::Parser::parse(std::string_view source, ParserState& state,
                                                  const LanguageOptions& languageOptions, llvm::raw_ostream* reporter)
{
    std::vector<ParseError> lexerErrors;
    auto tokens = Lexer::tokenize(source, languageOptions, &lexerErrors);
    Context context(source, state, languageOptions, reporter);
    std::vector<Syntax::Declaration> declarations;
    const auto* begin = tokens.data();
    try
    {
        declarations = parseTranslationUnit(begin, tokens.data() + tokens.size(), context);
    }
    catch (const FatalParserError&)
    {
        // The error has already been logged and no further statements are parsed
    }
    auto& errors = context.getErrors();
    std::move(lexerErrors.begin(), lexerErrors.end(), std::back_inserter(errors));
    if (!errors.empty())
    {
        return std::move(errors);
    }
    return std::move(declarations);
}

declex::Parser::ParseResult declex::Parser::parse(std::string_view source)
{
    ParserState state;
    return parse(source, state);
}

void declex::Parser::ParserState::addTypedef(std::string_view name)
{
    DECLEX_ASSERT(!name.empty());
    m_typedefs.emplace(name);
}

bool declex::Parser::ParserState::isTypedef(std::string_view name) const
{
    return m_typedefs.find(name) != m_typedefs.end();
}

declex::Parser::Context::Context(std::string_view source, ParserState& state, const LanguageOptions& languageOptions,
                                 llvm::raw_ostream* reporter)
    : m_source(source), m_state(state), m_languageOptions(languageOptions), m_reporter(reporter)
{
}

void declex::Parser::Context::addTypedef(std::string_view name)
{
    m_state.addTypedef(name);
}

bool declex::Parser::Context::isTypedef(std::string_view name) const
{
    return m_state.isTypedef(name);
}

void declex::Parser::Context::log(ParseError error)
{
    m_errors.push_back(std::move(error));
}

void declex::Parser::Context::log(const Message& message)
{
    if (m_reporter)
    {
        *m_reporter << message;
    }
}

void declex::Parser::Context::unexpected(Lexer::TokenIterator begin, Lexer::TokenIterator end,
                                         std::vector<std::string> expected)
{
    if (begin == end)
    {
        log(ParseError(m_source.size(), m_source.size(), std::move(expected), std::nullopt));
        return;
    }
    log(ParseError(begin->getOffset(), begin->getEndOffset(), std::move(expected),
                   to_string(begin->getRepresentation())));
}

void declex::Parser::Context::skipUntil(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                        Lexer::TokenType tokenType) const
{
    begin = std::find_if(begin, end, [tokenType](const Lexer::Token& token) { return token.getTokenType() == tokenType; });
}

declex::ValueReset<std::uint64_t> declex::Parser::Context::saveNestingDepth()
{
    return ValueReset<std::uint64_t>(m_nestingDepth, m_nestingDepth);
}

void declex::Parser::Context::increaseNestingDepth(Lexer::TokenIterator token)
{
    auto maxNestingDepth = std::min(m_languageOptions.maxNestingDepth, LanguageOptions::NESTING_DEPTH_LIMIT);
    if (++m_nestingDepth <= maxNestingDepth)
    {
        return;
    }
    log(ParseError(token->getOffset(), token->getEndOffset(),
                   Errors::Parser::MAXIMUM_NESTING_DEPTH_OF_N_EXCEEDED.args(maxNestingDepth)));
    throw FatalParserError();
}

declex::Syntax::TypeQualifier declex::Parser::toQualifier(Lexer::TokenType tokenType)
{
    switch (tokenType)
    {
        case Lexer::TokenType::ConstKeyword: return Syntax::TypeQualifier::Const;
        case Lexer::TokenType::VolatileKeyword: return Syntax::TypeQualifier::Volatile;
        case Lexer::TokenType::RestrictKeyword: return Syntax::TypeQualifier::Restrict;
        default: DECLEX_UNREACHABLE;
    }
}

bool declex::Parser::expect(Lexer::TokenType expected, Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                            Context& context, std::vector<std::string> alternatives)
{
    if (begin == end || begin->getTokenType() != expected)
    {
        context.unexpected(begin, end, std::move(alternatives));
        return false;
    }
    begin++;
    return true;
}

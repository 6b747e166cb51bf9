#pragma once

#include <llvm/Support/raw_ostream.h>

#include <declex/Support/Util.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "LanguageOptions.hpp"
#include "Lexer.hpp"
#include "Message.hpp"
#include "ParseError.hpp"
#include "Syntax.hpp"

namespace declex::Parser
{
/**
 * Names introduced by typedef declarations. Reusing one instance across calls to parse makes typedefs of earlier
 * inputs visible to later ones
 */
class ParserState final
{
    std::set<std::string, std::less<>> m_typedefs;

public:
    void addTypedef(std::string_view name);

    [[nodiscard]] bool isTypedef(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_typedefs.size();
    }
};

using ParseResult = std::variant<std::vector<Syntax::Declaration>, std::vector<ParseError>>;

/**
 * Parses zero or more declarations separated by semicolons
 *
 * The returned declarations reference source. Only warnings are written to reporter, errors are part of the result
 */
ParseResult parse(std::string_view source, ParserState& state, const LanguageOptions& languageOptions = {},
                  llvm::raw_ostream* reporter = nullptr);

ParseResult parse(std::string_view source);

class FatalParserError final : public std::exception
{
public:
    const char* what() const noexcept override
    {
        return "fatal parser error";
    }
};

class Context final
{
    std::string_view m_source;
    ParserState& m_state;
    const LanguageOptions& m_languageOptions;
    llvm::raw_ostream* m_reporter;
    std::vector<ParseError> m_errors;
    std::uint64_t m_nestingDepth = 0;

public:
    Context(std::string_view source, ParserState& state, const LanguageOptions& languageOptions,
            llvm::raw_ostream* reporter = nullptr);

    void addTypedef(std::string_view name);

    [[nodiscard]] bool isTypedef(std::string_view name) const;

    void log(ParseError error);

    void log(const Message& message);

    /**
     * Logs an error for the token at begin, or for the end of input if begin == end
     */
    void unexpected(Lexer::TokenIterator begin, Lexer::TokenIterator end, std::vector<std::string> expected);

    [[nodiscard]] std::vector<ParseError>& getErrors() noexcept
    {
        return m_errors;
    }

    [[nodiscard]] const LanguageOptions& getLanguageOptions() const noexcept
    {
        return m_languageOptions;
    }

    void skipUntil(Lexer::TokenIterator& begin, Lexer::TokenIterator end, Lexer::TokenType tokenType) const;

    /**
     * Restores the current nesting depth when the returned object goes out of scope
     */
    [[nodiscard]] ValueReset<std::uint64_t> saveNestingDepth();

    /**
     * Adds one level of declarator nesting opened by token. Throws FatalParserError after logging an error if the
     * maximum nesting depth is exceeded
     */
    void increaseNestingDepth(Lexer::TokenIterator token);
};

std::vector<Syntax::Declaration> parseTranslationUnit(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                      Context& context);

std::optional<Syntax::Declaration> parseExternalDeclaration(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                            Context& context, std::vector<std::string>& continuations);

std::optional<Syntax::Declaration> parseParameterDeclaration(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                             Context& context,
                                                             std::vector<std::string>& continuations);

std::optional<Syntax::QualifiedType> parseQualifiedType(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                        Context& context);

/**
 * continuations receives the alternatives that could still have extended the declarator where parsing stopped.
 * Callers add what may follow the declarator when composing an error
 */
std::optional<Syntax::Declarator> parseDeclarator(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                  Context& context, std::vector<std::string>& continuations);

std::optional<Syntax::Declarator> parseDirectDeclarator(Lexer::TokenIterator& begin, Lexer::TokenIterator end,
                                                        Context& context, std::vector<std::string>& continuations,
                                                        bool afterPointer);

std::optional<std::vector<Syntax::Declaration>> parseParameterList(Lexer::TokenIterator& begin,
                                                                   Lexer::TokenIterator end, Context& context);

std::optional<std::size_t> parseArraySize(Lexer::TokenIterator literal, Context& context);

} // namespace declex::Parser

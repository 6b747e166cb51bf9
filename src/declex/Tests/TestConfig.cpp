#include "TestConfig.hpp"

#include <llvm/Support/raw_ostream.h>

std::vector<declex::Syntax::Declaration> declex::Tests::parseSuccess(std::string_view source,
                                                                     Parser::ParserState& state,
                                                                     const LanguageOptions& options)
{
    std::string buffer;
    llvm::raw_string_ostream ss(buffer);
    auto result = Parser::parse(source, state, options, &ss);
    if (auto* errors = std::get_if<std::vector<ParseError>>(&result))
    {
        UNSCOPED_INFO(errorText(*errors));
    }
    REQUIRE(std::holds_alternative<std::vector<Syntax::Declaration>>(result));
    return std::move(declex::get<std::vector<Syntax::Declaration>>(result));
}

std::vector<declex::Syntax::Declaration> declex::Tests::parseSuccess(std::string_view source,
                                                                     const LanguageOptions& options)
{
    Parser::ParserState state;
    return parseSuccess(source, state, options);
}

declex::Syntax::Declaration declex::Tests::parseSingle(std::string_view source)
{
    auto declarations = parseSuccess(source);
    REQUIRE(declarations.size() == 1);
    return std::move(declarations.front());
}

std::vector<declex::ParseError> declex::Tests::parseFailure(std::string_view source, Parser::ParserState& state,
                                                            const LanguageOptions& options)
{
    auto result = Parser::parse(source, state, options);
    REQUIRE(std::holds_alternative<std::vector<ParseError>>(result));
    auto errors = std::move(declex::get<std::vector<ParseError>>(result));
    REQUIRE_FALSE(errors.empty());
    return errors;
}

std::vector<declex::ParseError> declex::Tests::parseFailure(std::string_view source, const LanguageOptions& options)
{
    Parser::ParserState state;
    return parseFailure(source, state, options);
}

std::string declex::Tests::errorText(const std::vector<ParseError>& errors)
{
    std::string result;
    for (auto& iter : errors)
    {
        result += iter.str();
        result += '\n';
    }
    return result;
}

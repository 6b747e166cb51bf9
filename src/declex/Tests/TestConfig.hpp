#pragma once

#include <catch2/catch.hpp>

#include <declex/Frontend/Compiler/LanguageOptions.hpp>
#include <declex/Frontend/Compiler/ParseError.hpp>
#include <declex/Frontend/Compiler/Parser.hpp>
#include <declex/Frontend/Compiler/Syntax.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace declex::Tests
{
/**
 * Parses source, which has to outlive the result, and requires it to be free of errors
 */
std::vector<Syntax::Declaration> parseSuccess(std::string_view source, Parser::ParserState& state,
                                              const LanguageOptions& options = {});

std::vector<Syntax::Declaration> parseSuccess(std::string_view source, const LanguageOptions& options = {});

Syntax::Declaration parseSingle(std::string_view source);

std::vector<ParseError> parseFailure(std::string_view source, Parser::ParserState& state,
                                     const LanguageOptions& options = {});

std::vector<ParseError> parseFailure(std::string_view source, const LanguageOptions& options = {});

/**
 * Plain text of the errors, one per line, as printed in a session
 */
std::string errorText(const std::vector<ParseError>& errors);

} // namespace declex::Tests

struct ProducesError : Catch::Matchers::StdString::ContainsMatcher
{
    ProducesError(const std::string& comparator)
        : ContainsMatcher(Catch::Matchers::StdString::CasedString("error: " + comparator, Catch::CaseSensitive::Yes))
    {
    }
};

struct ProducesWarning : Catch::Matchers::StdString::ContainsMatcher
{
    ProducesWarning(const std::string& comparator)
        : ContainsMatcher(Catch::Matchers::StdString::CasedString("warning: " + comparator, Catch::CaseSensitive::Yes))
    {
    }
};

struct ProducesNoWarnings : Catch::Matchers::StdString::ContainsMatcher
{
    ProducesNoWarnings()
        : ContainsMatcher(Catch::Matchers::StdString::CasedString("warning: ", Catch::CaseSensitive::Yes))
    {
    }

    bool match(const std::string& source) const override
    {
        return !ContainsMatcher::match(source);
    }

    std::string describe() const override
    {
        return "Produces no warnings";
    }
};

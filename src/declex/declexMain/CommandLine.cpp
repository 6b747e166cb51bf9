#include "CommandLine.hpp"

#include <llvm/ADT/StringRef.h>

#include <declex/Frontend/Compiler/ErrorMessages.hpp>
#include <declex/Support/Util.hpp>

#include <algorithm>
#include <array>

namespace
{
constexpr std::array<std::pair<std::string_view, std::string_view>, 7> OPTIONS = {{
    {"--color=<when>", "Colorize explanations: auto, always or never"},
    {"--html", "Write explanations as HTML using <span> elements"},
    {"--max-depth=<n>", "Maximum nesting depth of a declarator, at most 1024"},
    {"-W[no-]unprototyped", "Warn about functions declared with an empty parameter list"},
    {"--version", "Print version"},
    {"--help", "Display all options"},
    {"--", "Treat all following arguments as declarations"},
}};

std::optional<std::string_view> optionValue(std::string_view argument, std::string_view option,
                                            llvm::ArrayRef<std::string_view> arguments, std::size_t& index)
{
    if (argument.size() > option.size() && argument.substr(0, option.size()) == option
        && argument[option.size()] == '=')
    {
        return argument.substr(option.size() + 1);
    }
    if (argument != option || index + 1 >= arguments.size())
    {
        return std::nullopt;
    }
    return arguments[++index];
}

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

} // namespace

std::optional<declex::CommandLine> declex::CommandLine::parse(llvm::ArrayRef<std::string_view> arguments,
                                                              llvm::raw_ostream* reporter)
{
    auto error = [reporter](std::string text) {
        if (reporter)
        {
            *reporter << Message::error(std::move(text));
        }
    };

    CommandLine result;
    bool onlyDeclarations = false;
    for (std::size_t i = 0; i < arguments.size(); i++)
    {
        auto argument = arguments[i];
        if (onlyDeclarations || argument.empty() || argument.front() != '-')
        {
            result.m_declarations.push_back(argument);
            continue;
        }
        if (argument == "--")
        {
            onlyDeclarations = true;
        }
        else if (argument == "--help" || argument == "-help")
        {
            result.m_help = true;
        }
        else if (argument == "--version")
        {
            result.m_version = true;
        }
        else if (argument == "--html")
        {
            result.m_html = true;
        }
        else if (argument == "-Wunprototyped")
        {
            result.m_languageOptions.warnUnprototypedFunctions = true;
        }
        else if (argument == "-Wno-unprototyped")
        {
            result.m_languageOptions.warnUnprototypedFunctions = false;
        }
        else if (startsWith(argument, "--color"))
        {
            auto value = optionValue(argument, "--color", arguments, i);
            if (!value)
            {
                if (argument == "--color")
                {
                    error(Errors::CLI::EXPECTED_ARGUMENT_AFTER_N.args(argument));
                }
                else
                {
                    error(Errors::CLI::UNKNOWN_OPTION_N.args(argument));
                }
                return std::nullopt;
            }
            if (*value == "auto")
            {
                result.m_color = ColorChoice::Auto;
            }
            else if (*value == "always")
            {
                result.m_color = ColorChoice::Always;
            }
            else if (*value == "never")
            {
                result.m_color = ColorChoice::Never;
            }
            else
            {
                error(Errors::CLI::INVALID_VALUE_N_FOR_N.args(*value, "--color"));
                return std::nullopt;
            }
        }
        else if (startsWith(argument, "--max-depth"))
        {
            auto value = optionValue(argument, "--max-depth", arguments, i);
            if (!value)
            {
                if (argument == "--max-depth")
                {
                    error(Errors::CLI::EXPECTED_ARGUMENT_AFTER_N.args(argument));
                }
                else
                {
                    error(Errors::CLI::UNKNOWN_OPTION_N.args(argument));
                }
                return std::nullopt;
            }
            std::uint64_t depth;
            if (llvm::StringRef(value->data(), value->size()).getAsInteger(10, depth)
                || depth > LanguageOptions::NESTING_DEPTH_LIMIT)
            {
                error(Errors::CLI::INVALID_VALUE_N_FOR_N.args(*value, "--max-depth"));
                return std::nullopt;
            }
            result.m_languageOptions.maxNestingDepth = depth;
        }
        else
        {
            error(Errors::CLI::UNKNOWN_OPTION_N.args(argument));
            return std::nullopt;
        }
    }
    return result;
}

void declex::CommandLine::printHelp(llvm::raw_ostream& os) const
{
    detail::CommandLine::printHelp(os, {OPTIONS.begin(), OPTIONS.end()});
}

void declex::detail::CommandLine::printHelp(llvm::raw_ostream& os,
                                            std::vector<std::pair<std::string_view, std::string_view>> options)
{
    if (options.empty())
    {
        return;
    }
    const auto maxLen = std::max_element(options.begin(), options.end(), [](const auto& lhs, const auto& rhs) {
                            return lhs.first.size() < rhs.first.size();
                        })->first.size();
    constexpr auto indentStep = 4;
    auto width = roundUpTo(maxLen, indentStep);

    for (auto [cli, description] : options)
    {
        os.write(cli.data(), cli.size());
        os.indent(width - cli.size() + indentStep).write(description.data(), description.size()) << '\n';
    }
    os.flush();
}

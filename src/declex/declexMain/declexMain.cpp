#include "declexMain.hpp"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Process.h>
#include <llvm/Support/WithColor.h>

#include <declex/Frontend/Compiler/ErrorMessages.hpp>
#include <declex/Frontend/Compiler/Explainer.hpp>
#include <declex/Frontend/Compiler/Highlight.hpp>
#include <declex/Frontend/Compiler/Parser.hpp>
#include <declex/declexMain/CommandLine.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace
{
constexpr auto WARRANTY_NOTICE = "This program comes with ABSOLUTELY NO WARRANTY.\n"
                                 "This is free software, and you are welcome to redistribute it\n"
                                 "under certain conditions; type `@license' for details.\n";

constexpr auto LICENSE_NOTICE = "This program is free software: you can redistribute it and/or modify\n"
                                "it under the terms of the GNU General Public License as published by\n"
                                "the Free Software Foundation, either version 3 of the License, or\n"
                                "(at your option) any later version.\n"
                                "\n"
                                "This program is distributed in the hope that it will be useful,\n"
                                "but WITHOUT ANY WARRANTY; without even the implied warranty of\n"
                                "MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the\n"
                                "GNU General Public License for more details.\n"
                                "\n"
                                "You should have received a copy of the GNU General Public License\n"
                                "along with this program.  If not, see <https://www.gnu.org/licenses/>.\n";

void printVersion(llvm::raw_ostream& os)
{
    os << "declex version " << DECLEX_VERSION << '\n';
    os.flush();
}

void printCommands(llvm::raw_ostream& os)
{
    declex::detail::CommandLine::printHelp(os, {{"@help", "Display all commands"},
                                                {"@license", "Print license information"},
                                                {"@quit", "End the session"},
                                                {"<declaration>", "Explain a declaration"}});
}

class Session final
{
    declex::Parser::ParserState m_state;
    const declex::LanguageOptions& m_languageOptions;
    const declex::Formatter& m_formatter;
    llvm::ColorMode m_colorMode;
    llvm::raw_ostream* m_reporter;
    llvm::raw_ostream* m_out;

public:
    Session(const declex::LanguageOptions& languageOptions, const declex::Formatter& formatter,
            llvm::ColorMode colorMode, llvm::raw_ostream* reporter, llvm::raw_ostream* out)
        : m_languageOptions(languageOptions),
          m_formatter(formatter),
          m_colorMode(colorMode),
          m_reporter(reporter),
          m_out(out)
    {
    }

    /**
     * Returns false if source contained errors
     */
    bool explain(std::string_view source)
    {
        auto result = declex::Parser::parse(source, m_state, m_languageOptions, m_reporter);
        if (auto* errors = std::get_if<std::vector<declex::ParseError>>(&result))
        {
            if (m_reporter)
            {
                llvm::WithColor(*m_reporter, llvm::raw_ostream::RED, true, false, m_colorMode)
                    << declex::Errors::CLI::ERRORS_PARSING_DECLARATION << '\n';
                for (auto& iter : *errors)
                {
                    *m_reporter << "  " << iter << '\n';
                }
                m_reporter->flush();
            }
            return false;
        }
        if (!m_out)
        {
            return true;
        }
        auto& declarations = declex::get<std::vector<declex::Syntax::Declaration>>(result);
        for (auto& iter : declarations)
        {
            declex::explain(iter).render(m_formatter, *m_out);
            if (declarations.size() > 1)
            {
                *m_out << ';';
            }
            *m_out << '\n';
        }
        m_out->flush();
        return true;
    }

    /**
     * Processes lines from input until it is exhausted or the user quits. Returns false if any line failed
     */
    bool run(std::istream& input, bool interactive)
    {
        if (interactive && m_reporter)
        {
            printVersion(*m_reporter);
            *m_reporter << WARRANTY_NOTICE << '\n';
            m_reporter->flush();
        }
        bool success = true;
        std::string line;
        while (true)
        {
            if (interactive && m_out)
            {
                *m_out << "> ";
                m_out->flush();
            }
            if (!std::getline(input, line))
            {
                break;
            }
            auto trimmed = llvm::StringRef(line).trim();
            if (trimmed.empty())
            {
                continue;
            }
            if (!trimmed.startswith("@"))
            {
                success = explain(line) && success;
                continue;
            }
            if (trimmed == "@quit")
            {
                break;
            }
            if (trimmed == "@license")
            {
                if (m_reporter)
                {
                    printVersion(*m_reporter);
                    *m_reporter << LICENSE_NOTICE;
                    m_reporter->flush();
                }
            }
            else if (trimmed == "@help")
            {
                if (m_out)
                {
                    printCommands(*m_out);
                }
            }
            else
            {
                if (m_reporter)
                {
                    *m_reporter << declex::Message::error(declex::Errors::CLI::UNKNOWN_COMMAND_N.args(trimmed.str()));
                }
                success = false;
            }
        }
        return success;
    }
};

void applyColorChoice(llvm::raw_ostream* os, declex::ColorChoice choice)
{
    if (!os)
    {
        return;
    }
    switch (choice)
    {
        case declex::ColorChoice::Auto: os->enable_colors(os->has_colors()); break;
        case declex::ColorChoice::Always: os->enable_colors(true); break;
        case declex::ColorChoice::Never: os->enable_colors(false); break;
    }
}

} // namespace

int declex::main(llvm::MutableArrayRef<std::string_view> elements, std::istream& input, llvm::raw_ostream* reporter,
                 llvm::raw_ostream* out)
{
    applyColorChoice(reporter, ColorChoice::Auto);
    auto cli = CommandLine::parse(elements, reporter);
    if (!cli)
    {
        return 1;
    }
    if (cli->help())
    {
        if (out)
        {
            cli->printHelp(*out);
        }
        return 0;
    }
    if (cli->version())
    {
        if (out)
        {
            printVersion(*out);
        }
        return 0;
    }

    applyColorChoice(reporter, cli->getColor());
    applyColorChoice(out, cli->getColor());
    llvm::ColorMode colorMode = llvm::ColorMode::Auto;
    switch (cli->getColor())
    {
        case ColorChoice::Auto: break;
        case ColorChoice::Always: colorMode = llvm::ColorMode::Enable; break;
        case ColorChoice::Never: colorMode = llvm::ColorMode::Disable; break;
    }

    std::unique_ptr<Formatter> formatter;
    if (cli->html())
    {
        formatter = std::make_unique<HtmlFormatter>();
    }
    else if (out && out->colors_enabled())
    {
        formatter = std::make_unique<ColorFormatter>();
    }
    else
    {
        formatter = std::make_unique<PlainFormatter>();
    }

    Session session(cli->getLanguageOptions(), *formatter, colorMode, reporter, out);
    if (!cli->getDeclarations().empty())
    {
        bool success = true;
        for (auto iter : cli->getDeclarations())
        {
            success = session.explain(iter) && success;
        }
        return success ? 0 : 1;
    }
    bool interactive = &input == &std::cin && llvm::sys::Process::StandardInIsUserInput();
    return session.run(input, interactive) ? 0 : 1;
}

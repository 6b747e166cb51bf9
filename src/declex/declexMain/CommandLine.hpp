#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/raw_ostream.h>

#include <declex/Frontend/Compiler/LanguageOptions.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace declex
{
enum class ColorChoice
{
    Auto,
    Always,
    Never
};

class CommandLine final
{
    bool m_help = false;
    bool m_version = false;
    bool m_html = false;
    ColorChoice m_color = ColorChoice::Auto;
    LanguageOptions m_languageOptions;
    std::vector<std::string_view> m_declarations;

public:
    /**
     * Returns std::nullopt after writing an error to reporter if an option is unknown or has an invalid value.
     * Every argument that is not an option is a declaration
     */
    static std::optional<CommandLine> parse(llvm::ArrayRef<std::string_view> arguments,
                                            llvm::raw_ostream* reporter = nullptr);

    [[nodiscard]] bool help() const noexcept
    {
        return m_help;
    }

    [[nodiscard]] bool version() const noexcept
    {
        return m_version;
    }

    [[nodiscard]] bool html() const noexcept
    {
        return m_html;
    }

    [[nodiscard]] ColorChoice getColor() const noexcept
    {
        return m_color;
    }

    [[nodiscard]] const LanguageOptions& getLanguageOptions() const noexcept
    {
        return m_languageOptions;
    }

    [[nodiscard]] const std::vector<std::string_view>& getDeclarations() const noexcept
    {
        return m_declarations;
    }

    void printHelp(llvm::raw_ostream& os) const;
};

namespace detail::CommandLine
{
void printHelp(llvm::raw_ostream& os, std::vector<std::pair<std::string_view, std::string_view>> options);
} // namespace detail::CommandLine

} // namespace declex

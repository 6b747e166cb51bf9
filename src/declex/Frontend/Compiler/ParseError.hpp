#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/raw_ostream.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace declex
{
/**
 * A recoverable problem found while lexing or parsing a declaration.
 *
 * Spans are byte offsets into the source text, end exclusive. An error at the end of the input has an empty span
 * located at the size of the input.
 */
class ParseError final
{
    struct Unexpected
    {
        std::vector<std::string> expected;
        std::optional<std::string> found;
    };

    std::uint64_t m_start;
    std::uint64_t m_end;
    std::variant<Unexpected, std::string> m_reason;

public:
    /**
     * Syntax error. found is the spelling of the token encountered or std::nullopt at the end of input
     */
    ParseError(std::uint64_t start, std::uint64_t end, std::vector<std::string> expected,
               std::optional<std::string> found);

    /**
     * Error with a custom message
     */
    ParseError(std::uint64_t start, std::uint64_t end, std::string message);

    [[nodiscard]] std::uint64_t getStart() const noexcept
    {
        return m_start;
    }

    [[nodiscard]] std::uint64_t getEnd() const noexcept
    {
        return m_end;
    }

    [[nodiscard]] bool isCustom() const noexcept
    {
        return std::holds_alternative<std::string>(m_reason);
    }

    /**
     * Alternatives that would have been valid at the error location. Empty for errors with a custom message
     */
    [[nodiscard]] llvm::ArrayRef<std::string> getExpected() const;

    [[nodiscard]] std::optional<std::string_view> getFound() const;

    /**
     * Text of the error without the location prefix
     */
    [[nodiscard]] std::string getMessage() const;

    [[nodiscard]] std::string str() const;

    bool operator==(const ParseError& rhs) const;

    bool operator!=(const ParseError& rhs) const;
};

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, const ParseError& error);

} // namespace declex

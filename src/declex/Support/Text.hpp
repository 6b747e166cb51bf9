#pragma once

#include <llvm/Support/ConvertUTF.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "Util.hpp"

namespace declex
{
constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

/**
 * Length in bytes of the UTF-8 sequence starting at the front of text. Never larger than text itself
 */
inline std::size_t getNumBytesForUTF8(std::string_view text)
{
    DECLEX_ASSERT(!text.empty());
    std::size_t step = llvm::getNumBytesForUTF8(static_cast<llvm::UTF8>(text.front()));
    for (std::size_t i = 1; i < step; i++)
    {
        if (i == text.size() || (static_cast<std::uint8_t>(text[i]) & 0b11000000) != 0b10000000)
        {
            return i;
        }
    }
    return step;
}

inline std::string to_string(std::string_view stringView)
{
    return std::string(stringView.begin(), stringView.end());
}

} // namespace declex

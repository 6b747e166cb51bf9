#pragma once

#include <cstdint>

namespace declex
{
struct LanguageOptions
{
    /**
     * Upper bound applied to maxNestingDepth. Parsing, explaining and destroying a declarator all recurse once per
     * level and must stay within the stack of the calling thread
     */
    constexpr static std::uint64_t NESTING_DEPTH_LIMIT = 1024;

    std::uint64_t maxNestingDepth = 256;
    bool warnUnprototypedFunctions = false;
    bool allowTrigraphs = true;
    bool allowDigraphs = true;
};
} // namespace declex

#pragma once

#include <string_view>

#include "Highlight.hpp"
#include "Syntax.hpp"

namespace declex
{
/**
 * Describes declaration in English, eg. "int *p[10]" becomes "an array named p of 10 pointers to ints"
 *
 * Declarations with the typedef marker are described as the type they define
 */
HighlightedText explain(const Syntax::Declaration& declaration);

/**
 * Indefinite article including a trailing space to put in front of noun. Empty if noun is empty
 */
std::string_view articleFor(std::string_view noun);

/**
 * Suffix turning noun into its plural. Empty if noun is empty
 */
std::string_view pluralSuffixFor(std::string_view noun);

} // namespace declex

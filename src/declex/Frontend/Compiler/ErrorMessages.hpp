#pragma once

#include "Message.hpp"

namespace declex::Errors
{
constexpr auto AT_N_N_N = Format("at {}..{}: {}");

constexpr auto EXPECTED_N_BUT_FOUND_N = Format("expected {}, but found {}");

constexpr auto END_OF_INPUT = "end of input";

namespace Lexer
{
constexpr auto UNTERMINATED_COMMENT = "unterminated comment";
} // namespace Lexer

namespace Parser
{
constexpr auto N_IS_USED_AS_A_TYPE_BUT_HAS_NOT_BEEN_DEFINED = Format("\"{}\" is used as a type but has not been defined");

constexpr auto NUMBER_TOO_LARGE = "number too large to fit in target type";

constexpr auto INVALID_DIGIT_N_IN_OCTAL_CONSTANT = Format("invalid digit '{}' in octal constant");

constexpr auto INVALID_INTEGER_LITERAL_N = Format("invalid integer literal '{}'");

constexpr auto MAXIMUM_NESTING_DEPTH_OF_N_EXCEEDED = Format("maximum declarator nesting depth of {} exceeded");

constexpr auto FUNCTION_DECLARATION_WITHOUT_A_PROTOTYPE =
    "function declaration without a prototype; use '(void)' to declare a function without parameters";
} // namespace Parser

namespace CLI
{
constexpr auto UNKNOWN_OPTION_N = Format("unknown option '{}'");

constexpr auto INVALID_VALUE_N_FOR_N = Format("invalid value '{}' for '{}'");

constexpr auto EXPECTED_ARGUMENT_AFTER_N = Format("expected argument after '{}'");

constexpr auto ERRORS_PARSING_DECLARATION = "Error(s) parsing declaration:";

constexpr auto UNKNOWN_COMMAND_N = Format("unknown command '{}'; type @help for a list of commands");
} // namespace CLI

} // namespace declex::Errors

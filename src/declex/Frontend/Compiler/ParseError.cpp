#include "ParseError.hpp"

#include <declex/Support/Util.hpp>

#include "ErrorMessages.hpp"

declex::ParseError::ParseError(std::uint64_t start, std::uint64_t end, std::vector<std::string> expected,
                               std::optional<std::string> found)
    : m_start(start), m_end(end), m_reason(Unexpected{std::move(expected), std::move(found)})
{
    DECLEX_ASSERT(m_start <= m_end);
}

declex::ParseError::ParseError(std::uint64_t start, std::uint64_t end, std::string message)
    : m_start(start), m_end(end), m_reason(std::move(message))
{
    DECLEX_ASSERT(m_start <= m_end);
}

llvm::ArrayRef<std::string> declex::ParseError::getExpected() const
{
    if (auto* unexpected = std::get_if<Unexpected>(&m_reason))
    {
        return unexpected->expected;
    }
    return {};
}

std::optional<std::string_view> declex::ParseError::getFound() const
{
    if (auto* unexpected = std::get_if<Unexpected>(&m_reason); unexpected && unexpected->found)
    {
        return std::string_view(*unexpected->found);
    }
    return std::nullopt;
}

std::string declex::ParseError::getMessage() const
{
    return match(
        m_reason, [](const std::string& message) -> std::string { return message; },
        [](const Unexpected& unexpected) -> std::string {
            std::string expected;
            switch (unexpected.expected.size())
            {
                case 0: break;
                case 1: expected = unexpected.expected.front(); break;
                case 2: expected = static_cast<std::string>(Format::List(", ", " or ", unexpected.expected)); break;
                default: expected = static_cast<std::string>(Format::List(", ", ", or ", unexpected.expected)); break;
            }
            if (!unexpected.found)
            {
                return Errors::EXPECTED_N_BUT_FOUND_N.args(expected, Errors::END_OF_INPUT);
            }
            return Errors::EXPECTED_N_BUT_FOUND_N.args(expected, "'" + *unexpected.found + "'");
        });
}

std::string declex::ParseError::str() const
{
    return Errors::AT_N_N_N.args(m_start, m_end, getMessage());
}

bool declex::ParseError::operator==(const ParseError& rhs) const
{
    if (m_start != rhs.m_start || m_end != rhs.m_end || isCustom() != rhs.isCustom())
    {
        return false;
    }
    return getExpected() == rhs.getExpected() && getFound() == rhs.getFound() && getMessage() == rhs.getMessage();
}

bool declex::ParseError::operator!=(const ParseError& rhs) const
{
    return !(rhs == *this);
}

llvm::raw_ostream& declex::operator<<(llvm::raw_ostream& os, const declex::ParseError& error)
{
    return os << error.str();
}

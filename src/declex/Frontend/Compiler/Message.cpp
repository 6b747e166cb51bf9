#include "Message.hpp"

#include <llvm/Support/WithColor.h>

#include <declex/Support/Util.hpp>

#include <algorithm>

#include <ctre.hpp>

namespace
{
constexpr static auto pattern = ctll::fixed_string{R"(\{\})"};
} // namespace

std::string declex::Format::format(std::vector<std::string> args) const
{
    std::reverse(args.begin(), args.end());
    std::string result;
    auto stringView = std::string_view(m_format);
    for (const auto& iter : ctre::range<pattern>(stringView))
    {
        auto view = iter.view();
        result.insert(result.end(), stringView.data(), view.data());
        DECLEX_ASSERT(!args.empty());
        stringView.remove_prefix(std::distance(stringView.data(), view.data() + view.size()));
        result += args.back();
        args.pop_back();
    }
    result += stringView;
    DECLEX_ASSERT(args.empty());
    return result;
}

declex::Format::List::operator std::string() const
{
    std::string result;
    for (auto iter = m_strings.begin(); iter != m_strings.end(); iter++)
    {
        result += *iter;
        if (m_strings.end() - iter > 2)
        {
            result += m_delimiter;
        }
        else if (iter != m_strings.end() - 1)
        {
            result += m_lastInbetween;
        }
    }
    return result;
}

llvm::raw_ostream& declex::operator<<(llvm::raw_ostream& os, const declex::Message& message)
{
    auto colorMode = os.colors_enabled() ? llvm::ColorMode::Enable : llvm::ColorMode::Disable;
    switch (message.m_severity)
    {
        case Severity::None: break;
        case Severity::Error: llvm::WithColor(os, os.RED, true, false, colorMode) << "error: "; break;
        case Severity::Warning: llvm::WithColor(os, os.MAGENTA, true, false, colorMode) << "warning: "; break;
        case Severity::Note: llvm::WithColor(os, os.CYAN, true, false, colorMode) << "note: "; break;
    }
    os << message.m_text << '\n';
    os.flush();
    return os;
}

#include "Highlight.hpp"

#include <llvm/Support/WithColor.h>

#include <declex/Support/Util.hpp>

bool declex::Segment::operator==(const Segment& rhs) const
{
    return highlight == rhs.highlight && text == rhs.text;
}

bool declex::Segment::operator!=(const Segment& rhs) const
{
    return !(rhs == *this);
}

void declex::HighlightedText::push(Segment segment)
{
    m_segments.push_back(std::move(segment));
}

void declex::HighlightedText::pushStr(std::string_view text)
{
    if (!m_segments.empty() && m_segments.back().highlight == Highlight::None)
    {
        m_segments.back().text += text;
        return;
    }
    m_segments.push_back({std::string(text.begin(), text.end()), Highlight::None});
}

void declex::HighlightedText::append(const HighlightedText& other)
{
    m_segments.insert(m_segments.end(), other.m_segments.begin(), other.m_segments.end());
}

declex::HighlightedText declex::HighlightedText::coalesced() const
{
    std::vector<Segment> result;
    for (auto& iter : m_segments)
    {
        if (!result.empty() && result.back().highlight == iter.highlight)
        {
            result.back().text += iter.text;
            continue;
        }
        result.push_back(iter);
    }
    return HighlightedText(std::move(result));
}

std::string declex::HighlightedText::str() const
{
    std::string result;
    for (auto& iter : m_segments)
    {
        result += iter.text;
    }
    return result;
}

std::string declex::HighlightedText::render(const Formatter& formatter) const
{
    std::string result;
    llvm::raw_string_ostream ss(result);
    render(formatter, ss);
    ss.flush();
    return result;
}

void declex::HighlightedText::render(const Formatter& formatter, llvm::raw_ostream& os) const
{
    formatter.format(os, *this);
}

bool declex::HighlightedText::operator==(const HighlightedText& rhs) const
{
    return m_segments == rhs.m_segments;
}

bool declex::HighlightedText::operator!=(const HighlightedText& rhs) const
{
    return !(rhs == *this);
}

void declex::PlainFormatter::format(llvm::raw_ostream& os, const HighlightedText& text) const
{
    for (auto& iter : text)
    {
        os << iter.text;
    }
}

std::optional<llvm::raw_ostream::Colors> declex::ColorFormatter::colorFor(Highlight highlight) const
{
    switch (highlight)
    {
        case Highlight::None: return {};
        case Highlight::Qualifier: return m_colors.qualifier;
        case Highlight::PrimitiveType: return m_colors.primitiveType;
        case Highlight::UserDefinedType: return m_colors.userDefinedType;
        case Highlight::Ident: return m_colors.identifier;
        case Highlight::Number: return m_colors.number;
        case Highlight::QuasiKeyword: return m_colors.quasiKeyword;
    }
    DECLEX_UNREACHABLE;
}

void declex::ColorFormatter::format(llvm::raw_ostream& os, const HighlightedText& text) const
{
    auto colorsEnabled = os.colors_enabled();
    os.enable_colors(true);
    for (auto& iter : text)
    {
        if (iter.text.empty())
        {
            continue;
        }
        auto color = colorFor(iter.highlight);
        if (!color)
        {
            os << iter.text;
            continue;
        }
        llvm::WithColor(os, *color, false, false, llvm::ColorMode::Enable) << iter.text;
    }
    os.enable_colors(colorsEnabled);
}

const std::optional<std::string>& declex::HtmlFormatter::classFor(Highlight highlight) const
{
    static const std::optional<std::string> none;
    switch (highlight)
    {
        case Highlight::None: return none;
        case Highlight::Qualifier: return m_classes.qualifier;
        case Highlight::PrimitiveType: return m_classes.primitiveType;
        case Highlight::UserDefinedType: return m_classes.userDefinedType;
        case Highlight::Ident: return m_classes.identifier;
        case Highlight::Number: return m_classes.number;
        case Highlight::QuasiKeyword: return m_classes.quasiKeyword;
    }
    DECLEX_UNREACHABLE;
}

void declex::HtmlFormatter::format(llvm::raw_ostream& os, const HighlightedText& text) const
{
    for (auto& iter : text)
    {
        if (iter.text.empty())
        {
            continue;
        }
        auto& cssClass = classFor(iter.highlight);
        if (!cssClass)
        {
            os << escapeHtml(iter.text);
            continue;
        }
        os << "<span class=\"" << escapeHtml(*cssClass) << "\">" << escapeHtml(iter.text) << "</span>";
    }
}

std::string declex::escapeHtml(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (auto iter : text)
    {
        switch (iter)
        {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&#39;"; break;
            default: result += iter; break;
        }
    }
    return result;
}

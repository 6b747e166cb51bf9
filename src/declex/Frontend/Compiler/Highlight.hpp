#pragma once

#include <llvm/Support/raw_ostream.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace declex
{
/**
 * Semantic category of a piece of an explanation. Formatters decide how each category is presented
 */
enum class Highlight
{
    None,
    Qualifier,
    PrimitiveType,
    UserDefinedType,
    Ident,
    Number,
    QuasiKeyword ///< English words standing in for C constructs such as "pointer" or "function"
};

struct Segment
{
    std::string text;
    Highlight highlight = Highlight::None;

    bool operator==(const Segment& rhs) const;

    bool operator!=(const Segment& rhs) const;
};

class Formatter;

class HighlightedText final
{
    std::vector<Segment> m_segments;

public:
    using const_iterator = std::vector<Segment>::const_iterator;

    HighlightedText() = default;

    explicit HighlightedText(std::vector<Segment> segments) : m_segments(std::move(segments)) {}

    void push(Segment segment);

    /**
     * Appends text without highlighting. Merges into the last segment if that one has no highlighting either
     */
    void pushStr(std::string_view text);

    void append(const HighlightedText& other);

    /**
     * Copy of this text where adjacent segments with the same highlight are merged
     */
    [[nodiscard]] HighlightedText coalesced() const;

    /**
     * Text of all segments without any highlighting
     */
    [[nodiscard]] std::string str() const;

    [[nodiscard]] std::string render(const Formatter& formatter) const;

    void render(const Formatter& formatter, llvm::raw_ostream& os) const;

    [[nodiscard]] const std::vector<Segment>& getSegments() const noexcept
    {
        return m_segments;
    }

    [[nodiscard]] const_iterator begin() const noexcept
    {
        return m_segments.begin();
    }

    [[nodiscard]] const_iterator end() const noexcept
    {
        return m_segments.end();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_segments.empty();
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return m_segments.size();
    }

    const Segment& operator[](std::size_t index) const
    {
        return m_segments[index];
    }

    bool operator==(const HighlightedText& rhs) const;

    bool operator!=(const HighlightedText& rhs) const;
};

class Formatter
{
public:
    virtual ~Formatter() = default;

    virtual void format(llvm::raw_ostream& os, const HighlightedText& text) const = 0;
};

class PlainFormatter final : public Formatter
{
public:
    void format(llvm::raw_ostream& os, const HighlightedText& text) const override;
};

/**
 * Writes ANSI colour escapes regardless of whether the stream is a terminal
 */
class ColorFormatter final : public Formatter
{
public:
    struct ColorMap
    {
        llvm::raw_ostream::Colors qualifier = llvm::raw_ostream::CYAN;
        llvm::raw_ostream::Colors primitiveType = llvm::raw_ostream::YELLOW;
        llvm::raw_ostream::Colors userDefinedType = llvm::raw_ostream::MAGENTA;
        llvm::raw_ostream::Colors identifier = llvm::raw_ostream::RED;
        llvm::raw_ostream::Colors number = llvm::raw_ostream::BLUE;
        llvm::raw_ostream::Colors quasiKeyword = llvm::raw_ostream::GREEN;
    };

private:
    ColorMap m_colors;

    [[nodiscard]] std::optional<llvm::raw_ostream::Colors> colorFor(Highlight highlight) const;

public:
    ColorFormatter() = default;

    explicit ColorFormatter(ColorMap colors) : m_colors(colors) {}

    void format(llvm::raw_ostream& os, const HighlightedText& text) const override;
};

/**
 * Wraps highlighted segments in <span> elements with a CSS class. A highlight without a class is written as escaped
 * text only
 */
class HtmlFormatter final : public Formatter
{
public:
    struct ClassMap
    {
        std::optional<std::string> qualifier = "qualifier";
        std::optional<std::string> primitiveType = "primitive-type";
        std::optional<std::string> userDefinedType = "user-defined-type";
        std::optional<std::string> identifier = "identifier";
        std::optional<std::string> number = "number";
        std::optional<std::string> quasiKeyword = "quasi-keyword";
    };

private:
    ClassMap m_classes;

    [[nodiscard]] const std::optional<std::string>& classFor(Highlight highlight) const;

public:
    HtmlFormatter() = default;

    explicit HtmlFormatter(ClassMap classes) : m_classes(std::move(classes)) {}

    void format(llvm::raw_ostream& os, const HighlightedText& text) const override;
};

std::string escapeHtml(std::string_view text);

} // namespace declex

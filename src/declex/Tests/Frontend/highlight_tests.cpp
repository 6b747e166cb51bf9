#include <catch2/catch.hpp>

#include <llvm/Support/raw_ostream.h>

#include <declex/Frontend/Compiler/Highlight.hpp>

using namespace Catch::Matchers;
using declex::Highlight;

namespace
{
declex::HighlightedText sample()
{
    return declex::HighlightedText({{"pt", Highlight::PrimitiveType},
                                    {"id", Highlight::Ident},
                                    {"tq", Highlight::Qualifier},
                                    {"10", Highlight::Number},
                                    {"udt", Highlight::UserDefinedType},
                                    {"", Highlight::None},
                                    {"quasi", Highlight::QuasiKeyword}});
}
} // namespace

TEST_CASE("Highlighted text building", "[highlight]")
{
    SECTION("pushStr merges unhighlighted text")
    {
        declex::HighlightedText text;
        text.pushStr("a ");
        text.pushStr("b");
        text.push({"int", Highlight::PrimitiveType});
        text.pushStr(" c");
        REQUIRE(text.size() == 3);
        CHECK(text[0] == declex::Segment{"a b", Highlight::None});
        CHECK(text[2] == declex::Segment{" c", Highlight::None});
        CHECK(text.str() == "a bint c");
    }
    SECTION("push keeps segments apart")
    {
        declex::HighlightedText text;
        text.push({"a", Highlight::None});
        text.push({"b", Highlight::None});
        CHECK(text.size() == 2);
        auto coalesced = text.coalesced();
        REQUIRE(coalesced.size() == 1);
        CHECK(coalesced[0].text == "ab");
    }
    SECTION("Coalescing only merges equal highlights")
    {
        declex::HighlightedText text({{"const", Highlight::Qualifier},
                                      {" restrict", Highlight::Qualifier},
                                      {" ", Highlight::None},
                                      {"int", Highlight::PrimitiveType}});
        auto coalesced = text.coalesced();
        REQUIRE(coalesced.size() == 3);
        CHECK(coalesced[0] == declex::Segment{"const restrict", Highlight::Qualifier});
        CHECK(coalesced.str() == text.str());
        CHECK(text.size() == 4);
    }
    SECTION("append")
    {
        declex::HighlightedText text;
        text.pushStr("x");
        declex::HighlightedText other;
        other.pushStr("y");
        text.append(other);
        CHECK(text.size() == 2);
        CHECK(text.str() == "xy");
        CHECK(text != other);
    }
}

TEST_CASE("Plain formatter", "[highlight]")
{
    CHECK(sample().render(declex::PlainFormatter{}) == "ptidtq10udtquasi");
    CHECK(declex::HighlightedText().render(declex::PlainFormatter{}).empty());
}

TEST_CASE("HTML formatter", "[highlight]")
{
    SECTION("Default classes")
    {
        CHECK(sample().render(declex::HtmlFormatter{})
              == "<span class=\"primitive-type\">pt</span>"
                 "<span class=\"identifier\">id</span>"
                 "<span class=\"qualifier\">tq</span>"
                 "<span class=\"number\">10</span>"
                 "<span class=\"user-defined-type\">udt</span>"
                 "<span class=\"quasi-keyword\">quasi</span>");
    }
    SECTION("Highlight without class")
    {
        declex::HtmlFormatter::ClassMap classes;
        classes.identifier = std::nullopt;
        auto html = sample().render(declex::HtmlFormatter(classes));
        CHECK_THAT(html, Contains("</span>id<span"));
        CHECK_THAT(html, !Contains("identifier"));
    }
    SECTION("Escaping")
    {
        declex::HighlightedText text({{"a < b", Highlight::None}, {"\"&'>", Highlight::Ident}});
        CHECK(text.render(declex::HtmlFormatter{})
              == "a &lt; b<span class=\"identifier\">&quot;&amp;&#39;&gt;</span>");
        CHECK(declex::escapeHtml("plain") == "plain");
    }
}

TEST_CASE("Color formatter", "[highlight]")
{
    std::string buffer;
    llvm::raw_string_ostream ss(buffer);
    sample().render(declex::ColorFormatter{}, ss);
    ss.flush();
    CHECK_THAT(buffer, Contains("\033["));
    CHECK_THAT(buffer, Contains("quasi"));
    CHECK(buffer != "ptidtq10udtquasi");
    CHECK_FALSE(ss.colors_enabled());

    SECTION("Unhighlighted text is written as is")
    {
        declex::HighlightedText text;
        text.pushStr("just text");
        CHECK(text.render(declex::ColorFormatter{}) == "just text");
    }
    SECTION("Custom colors")
    {
        declex::ColorFormatter::ColorMap colors;
        colors.number = llvm::raw_ostream::RED;
        declex::HighlightedText text({{"10", Highlight::Number}});
        CHECK(text.render(declex::ColorFormatter(colors)) != text.render(declex::ColorFormatter{}));
    }
}

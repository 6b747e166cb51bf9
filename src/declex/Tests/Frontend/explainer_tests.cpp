#include <catch2/catch.hpp>

#include <declex/Frontend/Compiler/Explainer.hpp>

#include "TestConfig.hpp"

using declex::Highlight;
using declex::Segment;

namespace
{
declex::HighlightedText explains(std::string_view source, declex::Parser::ParserState& state)
{
    auto declarations = declex::Tests::parseSuccess(source, state);
    REQUIRE(declarations.size() == 1);
    return declex::explain(declarations[0]).coalesced();
}

declex::HighlightedText explains(std::string_view source)
{
    declex::Parser::ParserState state;
    return explains(source, state);
}

std::string explainsText(std::string_view source)
{
    return explains(source).str();
}

Segment none(std::string text)
{
    return {std::move(text), Highlight::None};
}

Segment qualifier(std::string text)
{
    return {std::move(text), Highlight::Qualifier};
}

Segment primitiveType(std::string text)
{
    return {std::move(text), Highlight::PrimitiveType};
}

Segment userDefinedType(std::string text)
{
    return {std::move(text), Highlight::UserDefinedType};
}

Segment ident(std::string text)
{
    return {std::move(text), Highlight::Ident};
}

Segment number(std::string text)
{
    return {std::move(text), Highlight::Number};
}

Segment quasiKeyword(std::string text)
{
    return {std::move(text), Highlight::QuasiKeyword};
}

void checkSegments(const declex::HighlightedText& text, const std::vector<Segment>& expected)
{
    INFO(text.str());
    REQUIRE(text.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); i++)
    {
        INFO("Segment " << i);
        CHECK(text[i].text == expected[i].text);
        CHECK(text[i].highlight == expected[i].highlight);
    }
}
} // namespace

TEST_CASE("Explain articles and plurals", "[explainer]")
{
    CHECK(declex::articleFor("int") == "an ");
    CHECK(declex::articleFor("array") == "an ");
    CHECK(declex::articleFor("unsigned int") == "an ");
    CHECK(declex::articleFor("cow") == "a ");
    CHECK(declex::articleFor("const") == "a ");
    CHECK(declex::articleFor("").empty());

    CHECK(declex::pluralSuffixFor("cat") == "s");
    CHECK(declex::pluralSuffixFor("int") == "s");
    CHECK(declex::pluralSuffixFor("box") == "es");
    CHECK(declex::pluralSuffixFor("bus") == "es");
    CHECK(declex::pluralSuffixFor("").empty());
}

TEST_CASE("Explain simple declarations", "[explainer]")
{
    checkSegments(explains("int x"), {none("an "), primitiveType("int"), none(" named "), ident("x")});
    CHECK(explainsText("signed int x") == "a signed int named x");
    CHECK(explainsText("unsigned long long int n") == "an unsigned long long int named n");
    CHECK(explainsText("int") == "an int");
    checkSegments(explains("const int x"),
                  {none("a "), qualifier("const"), none(" "), primitiveType("int"), none(" named "), ident("x")});
    checkSegments(explains("struct point p"),
                  {none("a "), userDefinedType("struct point"), none(" named "), ident("p")});
    CHECK(explainsText("const volatile enum color c") == "a const volatile enum color named c");
}

TEST_CASE("Explain every primitive type", "[explainer]")
{
    for (auto& iter : declex::Syntax::PrimitiveType::all())
    {
        std::string source(iter.getSpelling());
        source += " foo";
        std::string expected(declex::articleFor(iter.getSpelling()));
        expected += iter.getSpelling();
        expected += " named foo";
        CHECK(explains(source).str() == expected);
    }
}

TEST_CASE("Explain parenthesized declarators", "[explainer]")
{
    CHECK(explainsText("int (*p)[10]") != explainsText("int *p[10]"));
    CHECK(explainsText("int (x)") == explainsText("int x"));
    CHECK(explainsText("int ((*f))(void)") == "a pointer named f to a function that takes no parameters and returns an int");
}

TEST_CASE("Explain pointers", "[explainer]")
{
    checkSegments(explains("int *p"), {none("a "), quasiKeyword("pointer"), none(" named "), ident("p"),
                                       none(" to an "), primitiveType("int")});
    CHECK(explainsText("char ***p") == "a pointer named p to a pointer to a pointer to a char");
    checkSegments(explains("int *const restrict x"),
                  {none("a "), qualifier("const restrict"), none(" "), quasiKeyword("pointer"), none(" named "),
                   ident("x"), none(" to an "), primitiveType("int")});
    CHECK(explainsText("const char *const str") == "a const pointer named str to a const char");
    CHECK(explainsText("int *const *p") == "a pointer named p to a const pointer to an int");
    CHECK(explainsText("int *") == "a pointer to an int");
}

TEST_CASE("Explain arrays", "[explainer]")
{
    checkSegments(explains("int arr[]"), {none("an "), quasiKeyword("array"), none(" named "), ident("arr"),
                                          none(" of "), primitiveType("int"), none("s")});
    checkSegments(explains("int arr[10]"),
                  {none("an "), quasiKeyword("array"), none(" named "), ident("arr"), none(" of "), number("10"),
                   none(" "), primitiveType("int"), none("s")});
    CHECK(explainsText("int arr[10][20]") == "an array named arr of 10 arrays of 20 ints");
    CHECK(explainsText("int *arr[10]") == "an array named arr of 10 pointers to ints");
    CHECK(explainsText("int (*p)[10]") == "a pointer named p to an array of 10 ints");
    CHECK(explainsText("struct point p[]") == "an array named p of struct points");
    CHECK(explainsText("char *const p[]") == "an array named p of const pointers to chars");
    CHECK(explainsText("int x[0x10]") == "an array named x of 16 ints");
}

TEST_CASE("Explain functions", "[explainer]")
{
    checkSegments(explains("void func()"),
                  {none("a "), quasiKeyword("function"), none(" named "), ident("func"),
                   none(" that takes no parameters and returns a "), primitiveType("void")});
    CHECK(explainsText("void func(void)") == "a function named func that takes no parameters and returns a void");
    CHECK(explainsText("int foo(const char *)")
          == "a function named foo that takes (a pointer to a const char) and returns an int");
    CHECK(explainsText("int foo(const char *bar)")
          == "a function named foo that takes (a pointer named bar to a const char) and returns an int");
    CHECK(explainsText("int (*)(const char *)")
          == "a pointer to a function that takes (a pointer to a const char) and returns an int");
    CHECK(explainsText("int add(int a, int b)")
          == "a function named add that takes (an int named a and an int named b) and returns an int");
    CHECK(explainsText("void print(int a, char *b, float c)")
          == "a function named print that takes (an int named a, a pointer named b to a char, and a float named c) "
             "and returns a void");
    CHECK(explainsText("char *(*(*bar)[5])(int)")
          == "a pointer named bar to an array of 5 pointers to functions that take (an int) and return a pointer to "
             "a char");
}

TEST_CASE("Explain typedefs", "[explainer]")
{
    CHECK(explainsText("typedef char *") == "a type defined as a pointer to a char");
    checkSegments(explains("typedef struct point point_t"),
                  {none("a type named "), userDefinedType("point_t"), none(" defined as a "),
                   userDefinedType("struct point")});
    CHECK(explainsText("typedef const char *string") == "a type named string defined as a pointer to a const char");
    CHECK(explainsText("typedef int nums[]") == "a type named nums defined as an array of ints");
    CHECK(explainsText("typedef int (*compare_t)(const void *, const void *)")
          == "a type named compare_t defined as a pointer to a function that takes (a pointer to a const void and a "
             "pointer to a const void) and returns an int");
}

TEST_CASE("Explain typedef names", "[explainer]")
{
    declex::Parser::ParserState state;
    explains("typedef unsigned long size_t", state);
    checkSegments(explains("size_t n", state), {none("a "), userDefinedType("size_t"), none(" named "), ident("n")});
    CHECK(explains("const size_t *sizes[4]", state).str() == "an array named sizes of 4 pointers to const size_ts");
}

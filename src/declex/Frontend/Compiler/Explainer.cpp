#include "Explainer.hpp"

#include <declex/Support/Util.hpp>

#include <optional>

using namespace declex::Syntax;

namespace
{
enum class Plurality
{
    Singular,
    Plural
};

/**
 * Partial explanation of a declarator. name is the identifier that has not been placed in text yet
 */
struct Explanation
{
    declex::HighlightedText text;
    Plurality plurality = Plurality::Singular;
    std::optional<std::string_view> name;
};

declex::HighlightedText explainQualifiedType(const QualifiedType& qualifiedType)
{
    auto highlight = std::holds_alternative<PrimitiveType>(qualifiedType.getType()) ?
                         declex::Highlight::PrimitiveType :
                         declex::Highlight::UserDefinedType;
    declex::HighlightedText result;
    if (!qualifiedType.getQualifiers().empty())
    {
        result.push({qualifiedType.getQualifiers().str(), declex::Highlight::Qualifier});
        result.push({" ", declex::Highlight::None});
    }
    result.push({typeName(qualifiedType.getType()), highlight});
    return result;
}

void appendBaseType(Explanation& explanation, const declex::HighlightedText& baseType)
{
    DECLEX_ASSERT(!baseType.empty());
    switch (explanation.plurality)
    {
        case Plurality::Singular:
            explanation.text.pushStr(declex::articleFor(baseType[0].text));
            explanation.text.append(baseType);
            break;
        case Plurality::Plural:
            explanation.text.append(baseType);
            explanation.text.pushStr(declex::pluralSuffixFor(baseType[baseType.size() - 1].text));
            break;
    }
}

void explainParameters(declex::HighlightedText& text, const std::vector<Declaration>& parameters)
{
    switch (parameters.size())
    {
        case 0: text.pushStr("no parameters"); return;
        case 1:
            text.pushStr("(");
            text.append(declex::explain(parameters[0]));
            text.pushStr(")");
            return;
        case 2:
            text.pushStr("(");
            text.append(declex::explain(parameters[0]));
            text.pushStr(" and ");
            text.append(declex::explain(parameters[1]));
            text.pushStr(")");
            return;
        default: break;
    }
    text.pushStr("(");
    for (auto iter = parameters.begin(); iter != parameters.end() - 1; iter++)
    {
        text.append(declex::explain(*iter));
        text.pushStr(", ");
    }
    text.pushStr("and ");
    text.append(declex::explain(parameters.back()));
    text.pushStr(")");
}

/**
 * Walks the declarator from the declared name outwards. With skipName the name is left pending so that the caller
 * can place it
 */
Explanation explainDeclarator(const Declarator& declarator, bool skipName)
{
    return declex::match(
        declarator.getVariant(), [](const AnonymousDeclarator&) { return Explanation{}; },
        [](const IdentifierDeclarator& identifier) {
            Explanation explanation;
            explanation.name = identifier.getName();
            return explanation;
        },
        [skipName](const PointerDeclarator& pointer) {
            auto explanation = explainDeclarator(pointer.getInner(), skipName);
            auto& text = explanation.text;
            if (explanation.plurality == Plurality::Singular)
            {
                text.pushStr("a ");
            }
            if (!pointer.getQualifiers().empty())
            {
                text.push({pointer.getQualifiers().str(), declex::Highlight::Qualifier});
                text.pushStr(" ");
            }
            text.push({explanation.plurality == Plurality::Singular ? "pointer" : "pointers",
                       declex::Highlight::QuasiKeyword});
            text.pushStr(" ");
            if (explanation.name && !skipName)
            {
                text.pushStr("named ");
                text.push({std::string(*explanation.name), declex::Highlight::Ident});
                text.pushStr(" ");
                explanation.name.reset();
            }
            text.pushStr("to ");
            return explanation;
        },
        [skipName](const ArrayDeclarator& array) {
            auto explanation = explainDeclarator(array.getInner(), skipName);
            auto& text = explanation.text;
            if (explanation.plurality == Plurality::Singular)
            {
                text.pushStr("an ");
                text.push({"array", declex::Highlight::QuasiKeyword});
            }
            else
            {
                text.push({"arrays", declex::Highlight::QuasiKeyword});
            }
            if (explanation.name && !skipName)
            {
                text.pushStr(" named ");
                text.push({std::string(*explanation.name), declex::Highlight::Ident});
                explanation.name.reset();
            }
            text.pushStr(" of ");
            if (array.getSize())
            {
                text.push({std::to_string(*array.getSize()), declex::Highlight::Number});
                text.pushStr(" ");
            }
            explanation.plurality = Plurality::Plural;
            return explanation;
        },
        [skipName](const FunctionDeclarator& function) {
            auto explanation = explainDeclarator(function.getInner(), skipName);
            auto& text = explanation.text;
            auto name = skipName ? std::nullopt : explanation.name;
            if (explanation.plurality == Plurality::Plural)
            {
                // Only arrays are plural and they consume the name
                DECLEX_ASSERT(!name);
                text.push({"functions", declex::Highlight::QuasiKeyword});
                text.pushStr(" that take ");
            }
            else if (!name)
            {
                text.pushStr("a ");
                text.push({"function", declex::Highlight::QuasiKeyword});
                text.pushStr(" that takes ");
            }
            else
            {
                text.pushStr("a ");
                text.push({"function", declex::Highlight::QuasiKeyword});
                text.pushStr(" named ");
                text.push({std::string(*name), declex::Highlight::Ident});
                text.pushStr(" that takes ");
                explanation.name.reset();
            }
            explainParameters(text, function.getParameters());
            text.pushStr(explanation.plurality == Plurality::Singular ? " and returns " : " and return ");
            explanation.plurality = Plurality::Singular;
            return explanation;
        });
}

declex::HighlightedText explainTypedef(const Declaration& declaration)
{
    DECLEX_ASSERT(declaration.isTypedef());
    auto qualifiers = declaration.getBaseType().getQualifiers();
    qualifiers.remove(TypeQualifier::Typedef);
    auto baseType = explainQualifiedType(QualifiedType(qualifiers, declaration.getBaseType().getType()));

    auto explanation = explainDeclarator(declaration.getDeclarator(), true);
    declex::HighlightedText result;
    result.pushStr("a type");
    if (explanation.name)
    {
        result.pushStr(" named ");
        result.push({std::string(*explanation.name), declex::Highlight::UserDefinedType});
    }
    result.pushStr(" defined as ");
    result.append(explanation.text);
    explanation.text = std::move(result);
    appendBaseType(explanation, baseType);
    return std::move(explanation.text);
}

} // namespace

declex::HighlightedText declex::explain(const Syntax::Declaration& declaration)
{
    if (declaration.isTypedef())
    {
        return explainTypedef(declaration);
    }
    auto explanation = explainDeclarator(declaration.getDeclarator(), false);
    appendBaseType(explanation, explainQualifiedType(declaration.getBaseType()));
    if (explanation.name)
    {
        explanation.text.pushStr(" named ");
        explanation.text.push({std::string(*explanation.name), Highlight::Ident});
    }
    return std::move(explanation.text);
}

std::string_view declex::articleFor(std::string_view noun)
{
    if (noun.empty())
    {
        return "";
    }
    switch (noun.front())
    {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u': return "an ";
        default: return "a ";
    }
}

std::string_view declex::pluralSuffixFor(std::string_view noun)
{
    if (noun.empty())
    {
        return "";
    }
    switch (noun.back())
    {
        case 's':
        case 'x':
        case 'z': return "es";
        default: return "s";
    }
}

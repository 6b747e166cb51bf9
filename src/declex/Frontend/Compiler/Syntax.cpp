#include "Syntax.hpp"

#include <declex/Support/Util.hpp>

#include <array>

namespace
{
constexpr std::array PRIMITIVE_TYPES = {
    declex::Syntax::PrimitiveType("unsigned long long int"),
    declex::Syntax::PrimitiveType("unsigned long long"),
    declex::Syntax::PrimitiveType("unsigned long int"),
    declex::Syntax::PrimitiveType("unsigned short int"),
    declex::Syntax::PrimitiveType("unsigned short"),
    declex::Syntax::PrimitiveType("unsigned long"),
    declex::Syntax::PrimitiveType("unsigned int"),
    declex::Syntax::PrimitiveType("unsigned char"),
    declex::Syntax::PrimitiveType("unsigned"),
    declex::Syntax::PrimitiveType("signed long long int"),
    declex::Syntax::PrimitiveType("signed long long"),
    declex::Syntax::PrimitiveType("signed long int"),
    declex::Syntax::PrimitiveType("signed long"),
    declex::Syntax::PrimitiveType("signed short int"),
    declex::Syntax::PrimitiveType("signed short"),
    declex::Syntax::PrimitiveType("signed char"),
    declex::Syntax::PrimitiveType("signed int"),
    declex::Syntax::PrimitiveType("signed"),
    declex::Syntax::PrimitiveType("long long int"),
    declex::Syntax::PrimitiveType("long double _Complex"),
    declex::Syntax::PrimitiveType("long double"),
    declex::Syntax::PrimitiveType("long long"),
    declex::Syntax::PrimitiveType("long int"),
    declex::Syntax::PrimitiveType("long"),
    declex::Syntax::PrimitiveType("short int"),
    declex::Syntax::PrimitiveType("short"),
    declex::Syntax::PrimitiveType("float _Complex"),
    declex::Syntax::PrimitiveType("float"),
    declex::Syntax::PrimitiveType("double _Complex"),
    declex::Syntax::PrimitiveType("double"),
    declex::Syntax::PrimitiveType("void"),
    declex::Syntax::PrimitiveType("char"),
    declex::Syntax::PrimitiveType("int"),
    declex::Syntax::PrimitiveType("_Bool"),
};
} // namespace

llvm::ArrayRef<declex::Syntax::PrimitiveType> declex::Syntax::PrimitiveType::all()
{
    return PRIMITIVE_TYPES;
}

bool declex::Syntax::PrimitiveType::operator==(const PrimitiveType& rhs) const
{
    return m_spelling == rhs.m_spelling;
}

bool declex::Syntax::PrimitiveType::operator!=(const PrimitiveType& rhs) const
{
    return !(rhs == *this);
}

std::string_view declex::Syntax::spelling(RecordKind recordKind)
{
    switch (recordKind)
    {
        case RecordKind::Struct: return "struct";
        case RecordKind::Union: return "union";
        case RecordKind::Enum: return "enum";
    }
    DECLEX_UNREACHABLE;
}

bool declex::Syntax::RecordType::operator==(const RecordType& rhs) const
{
    return m_kind == rhs.m_kind && m_tag == rhs.m_tag;
}

bool declex::Syntax::RecordType::operator!=(const RecordType& rhs) const
{
    return !(rhs == *this);
}

bool declex::Syntax::CustomType::operator==(const CustomType& rhs) const
{
    return m_name == rhs.m_name;
}

bool declex::Syntax::CustomType::operator!=(const CustomType& rhs) const
{
    return !(rhs == *this);
}

std::string declex::Syntax::typeName(const Type& type)
{
    return match(
        type,
        [](const PrimitiveType& primitiveType) -> std::string {
            auto spelling = primitiveType.getSpelling();
            return std::string(spelling.begin(), spelling.end());
        },
        [](const RecordType& recordType) -> std::string {
            std::string result(spelling(recordType.getKind()));
            result += ' ';
            result += recordType.getTag();
            return result;
        },
        [](const CustomType& customType) -> std::string {
            auto name = customType.getName();
            return std::string(name.begin(), name.end());
        });
}

declex::Syntax::TypeQualifiers::TypeQualifiers(std::initializer_list<TypeQualifier> qualifiers)
{
    for (auto iter : qualifiers)
    {
        insert(iter);
    }
}

void declex::Syntax::TypeQualifiers::insert(TypeQualifier qualifier) noexcept
{
    m_bits |= static_cast<std::uint8_t>(qualifier);
}

void declex::Syntax::TypeQualifiers::remove(TypeQualifier qualifier) noexcept
{
    m_bits &= ~static_cast<std::uint8_t>(qualifier);
}

bool declex::Syntax::TypeQualifiers::contains(TypeQualifier qualifier) const noexcept
{
    return m_bits & static_cast<std::uint8_t>(qualifier);
}

std::string declex::Syntax::TypeQualifiers::str() const
{
    std::string result;
    for (auto [qualifier, text] : {std::pair{TypeQualifier::Const, "const"}, std::pair{TypeQualifier::Volatile, "volatile"},
                                   std::pair{TypeQualifier::Restrict, "restrict"}})
    {
        if (!contains(qualifier))
        {
            continue;
        }
        if (!result.empty())
        {
            result += ' ';
        }
        result += text;
    }
    return result;
}

bool declex::Syntax::TypeQualifiers::operator==(const TypeQualifiers& rhs) const
{
    return m_bits == rhs.m_bits;
}

bool declex::Syntax::TypeQualifiers::operator!=(const TypeQualifiers& rhs) const
{
    return !(rhs == *this);
}

bool declex::Syntax::QualifiedType::operator==(const QualifiedType& rhs) const
{
    return m_qualifiers == rhs.m_qualifiers && m_type == rhs.m_type;
}

bool declex::Syntax::QualifiedType::operator!=(const QualifiedType& rhs) const
{
    return !(rhs == *this);
}

bool declex::Syntax::IdentifierDeclarator::operator==(const IdentifierDeclarator& rhs) const
{
    return m_name == rhs.m_name;
}

bool declex::Syntax::IdentifierDeclarator::operator!=(const IdentifierDeclarator& rhs) const
{
    return !(rhs == *this);
}

declex::Syntax::PointerDeclarator::PointerDeclarator(Declarator&& inner, TypeQualifiers qualifiers)
    : m_inner(std::make_unique<Declarator>(std::move(inner))), m_qualifiers(qualifiers)
{
    DECLEX_ASSERT(!m_qualifiers.contains(TypeQualifier::Typedef));
}

declex::Syntax::PointerDeclarator::~PointerDeclarator() = default;

declex::Syntax::PointerDeclarator::PointerDeclarator(PointerDeclarator&&) noexcept = default;

declex::Syntax::PointerDeclarator& declex::Syntax::PointerDeclarator::operator=(PointerDeclarator&&) noexcept = default;

const declex::Syntax::Declarator& declex::Syntax::PointerDeclarator::getInner() const
{
    return *m_inner;
}

bool declex::Syntax::PointerDeclarator::operator==(const PointerDeclarator& rhs) const
{
    return m_qualifiers == rhs.m_qualifiers && *m_inner == *rhs.m_inner;
}

bool declex::Syntax::PointerDeclarator::operator!=(const PointerDeclarator& rhs) const
{
    return !(rhs == *this);
}

declex::Syntax::ArrayDeclarator::ArrayDeclarator(Declarator&& inner, std::optional<std::size_t> size)
    : m_inner(std::make_unique<Declarator>(std::move(inner))), m_size(size)
{
}

declex::Syntax::ArrayDeclarator::~ArrayDeclarator() = default;

declex::Syntax::ArrayDeclarator::ArrayDeclarator(ArrayDeclarator&&) noexcept = default;

declex::Syntax::ArrayDeclarator& declex::Syntax::ArrayDeclarator::operator=(ArrayDeclarator&&) noexcept = default;

const declex::Syntax::Declarator& declex::Syntax::ArrayDeclarator::getInner() const
{
    return *m_inner;
}

bool declex::Syntax::ArrayDeclarator::operator==(const ArrayDeclarator& rhs) const
{
    return m_size == rhs.m_size && *m_inner == *rhs.m_inner;
}

bool declex::Syntax::ArrayDeclarator::operator!=(const ArrayDeclarator& rhs) const
{
    return !(rhs == *this);
}

declex::Syntax::FunctionDeclarator::FunctionDeclarator(Declarator&& inner, std::vector<Declaration>&& parameters)
    : m_inner(std::make_unique<Declarator>(std::move(inner))), m_parameters(std::move(parameters))
{
}

declex::Syntax::FunctionDeclarator::~FunctionDeclarator() = default;

declex::Syntax::FunctionDeclarator::FunctionDeclarator(FunctionDeclarator&&) noexcept = default;

declex::Syntax::FunctionDeclarator&
    declex::Syntax::FunctionDeclarator::operator=(FunctionDeclarator&&) noexcept = default;

const declex::Syntax::Declarator& declex::Syntax::FunctionDeclarator::getInner() const
{
    return *m_inner;
}

bool declex::Syntax::FunctionDeclarator::operator==(const FunctionDeclarator& rhs) const
{
    return m_parameters == rhs.m_parameters && *m_inner == *rhs.m_inner;
}

bool declex::Syntax::FunctionDeclarator::operator!=(const FunctionDeclarator& rhs) const
{
    return !(rhs == *this);
}

std::optional<std::string_view> declex::Syntax::Declarator::getName() const
{
    return match(
        m_variant, [](const AnonymousDeclarator&) -> std::optional<std::string_view> { return std::nullopt; },
        [](const IdentifierDeclarator& identifier) -> std::optional<std::string_view> {
            return identifier.getName();
        },
        [](const auto& wrapper) -> std::optional<std::string_view> { return wrapper.getInner().getName(); });
}

bool declex::Syntax::Declarator::operator==(const Declarator& rhs) const
{
    return m_variant == rhs.m_variant;
}

bool declex::Syntax::Declarator::operator!=(const Declarator& rhs) const
{
    return !(rhs == *this);
}

declex::Syntax::Declaration::Declaration(QualifiedType baseType, Declarator&& declarator)
    : m_baseType(std::move(baseType)), m_declarator(std::move(declarator))
{
}

bool declex::Syntax::Declaration::operator==(const Declaration& rhs) const
{
    return m_baseType == rhs.m_baseType && m_declarator == rhs.m_declarator;
}

bool declex::Syntax::Declaration::operator!=(const Declaration& rhs) const
{
    return !(rhs == *this);
}

#pragma once

#include <llvm/ADT/ArrayRef.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * This uses EBNF syntax meaning that: { <A> } means 0 to infinite amount of times and [ <A> ] 0 or 1 times
 *
 * All names are views into the source text the nodes were parsed from
 */

namespace declex::Syntax
{
class Declarator;

class Declaration;

/**
 * <PrimitiveType> ::= one of the builtin type specifier sequences such as <TokenType::UnsignedKeyword>
 * <TokenType::LongKeyword> <TokenType::IntKeyword>
 */
class PrimitiveType final
{
    std::string_view m_spelling;

public:
    constexpr explicit PrimitiveType(std::string_view spelling) : m_spelling(spelling) {}

    [[nodiscard]] constexpr std::string_view getSpelling() const noexcept
    {
        return m_spelling;
    }

    /**
     * Every builtin type specifier sequence that is recognized. Words are separated by a single space
     */
    static llvm::ArrayRef<PrimitiveType> all();

    bool operator==(const PrimitiveType& rhs) const;

    bool operator!=(const PrimitiveType& rhs) const;
};

enum class RecordKind : std::uint8_t
{
    Struct,
    Union,
    Enum
};

std::string_view spelling(RecordKind recordKind);

/**
 * <RecordType> ::= <TokenType::StructKeyword> | <TokenType::UnionKeyword> | <TokenType::EnumKeyword>
 * <TokenType::Identifier>
 */
class RecordType final
{
    RecordKind m_kind;
    std::string_view m_tag;

public:
    RecordType(RecordKind kind, std::string_view tag) : m_kind(kind), m_tag(tag) {}

    [[nodiscard]] RecordKind getKind() const noexcept
    {
        return m_kind;
    }

    [[nodiscard]] std::string_view getTag() const noexcept
    {
        return m_tag;
    }

    bool operator==(const RecordType& rhs) const;

    bool operator!=(const RecordType& rhs) const;
};

/**
 * <CustomType> ::= <TokenType::Identifier>
 *
 * Only valid if the identifier has been previously declared by a typedef
 */
class CustomType final
{
    std::string_view m_name;

public:
    explicit CustomType(std::string_view name) : m_name(name) {}

    [[nodiscard]] std::string_view getName() const noexcept
    {
        return m_name;
    }

    bool operator==(const CustomType& rhs) const;

    bool operator!=(const CustomType& rhs) const;
};

using Type = std::variant<PrimitiveType, RecordType, CustomType>;

/**
 * Name of the type as written in C, eg. "unsigned int" or "struct point"
 */
std::string typeName(const Type& type);

enum class TypeQualifier : std::uint8_t
{
    Const = 1u << 0,
    Volatile = 1u << 1,
    Restrict = 1u << 2,
    Typedef = 1u << 3, ///< Not a real qualifier. Marks a declaration that defines a type name
};

class TypeQualifiers final
{
    std::uint8_t m_bits = 0;

public:
    TypeQualifiers() = default;

    TypeQualifiers(std::initializer_list<TypeQualifier> qualifiers);

    void insert(TypeQualifier qualifier) noexcept;

    void remove(TypeQualifier qualifier) noexcept;

    [[nodiscard]] bool contains(TypeQualifier qualifier) const noexcept;

    [[nodiscard]] bool empty() const noexcept
    {
        return m_bits == 0;
    }

    /**
     * Qualifiers separated by spaces in the order const, volatile and restrict. Typedef is never part of the result
     */
    [[nodiscard]] std::string str() const;

    bool operator==(const TypeQualifiers& rhs) const;

    bool operator!=(const TypeQualifiers& rhs) const;
};

/**
 * <QualifiedType> ::= { <TokenType::ConstKeyword> | <TokenType::VolatileKeyword> | <TokenType::RestrictKeyword> }
 * <Type>
 */
class QualifiedType final
{
    TypeQualifiers m_qualifiers;
    Type m_type;

public:
    QualifiedType(TypeQualifiers qualifiers, Type type) : m_qualifiers(qualifiers), m_type(std::move(type)) {}

    [[nodiscard]] const TypeQualifiers& getQualifiers() const noexcept
    {
        return m_qualifiers;
    }

    [[nodiscard]] const Type& getType() const noexcept
    {
        return m_type;
    }

    bool operator==(const QualifiedType& rhs) const;

    bool operator!=(const QualifiedType& rhs) const;
};

/**
 * Declarator without a name as used in abstract declarators
 */
class AnonymousDeclarator final
{
public:
    bool operator==(const AnonymousDeclarator&) const
    {
        return true;
    }

    bool operator!=(const AnonymousDeclarator&) const
    {
        return false;
    }
};

/**
 * <IdentifierDeclarator> ::= <TokenType::Identifier>
 */
class IdentifierDeclarator final
{
    std::string_view m_name;

public:
    explicit IdentifierDeclarator(std::string_view name) : m_name(name) {}

    [[nodiscard]] std::string_view getName() const noexcept
    {
        return m_name;
    }

    bool operator==(const IdentifierDeclarator& rhs) const;

    bool operator!=(const IdentifierDeclarator& rhs) const;
};

/**
 * <PointerDeclarator> ::= <TokenType::Asterisk> { <TokenType::ConstKeyword> | <TokenType::VolatileKeyword> |
 * <TokenType::RestrictKeyword> } <Declarator>
 *
 * The qualifiers apply to the pointer itself
 */
class PointerDeclarator final
{
    std::unique_ptr<Declarator> m_inner;
    TypeQualifiers m_qualifiers;

public:
    PointerDeclarator(Declarator&& inner, TypeQualifiers qualifiers);

    ~PointerDeclarator();

    PointerDeclarator(PointerDeclarator&&) noexcept;

    PointerDeclarator& operator=(PointerDeclarator&&) noexcept;

    [[nodiscard]] const Declarator& getInner() const;

    [[nodiscard]] const TypeQualifiers& getQualifiers() const noexcept
    {
        return m_qualifiers;
    }

    bool operator==(const PointerDeclarator& rhs) const;

    bool operator!=(const PointerDeclarator& rhs) const;
};

/**
 * <ArrayDeclarator> ::= <Declarator> <TokenType::OpenSquareBracket> [<TokenType::Literal>]
 * <TokenType::CloseSquareBracket>
 */
class ArrayDeclarator final
{
    std::unique_ptr<Declarator> m_inner;
    std::optional<std::size_t> m_size;

public:
    ArrayDeclarator(Declarator&& inner, std::optional<std::size_t> size);

    ~ArrayDeclarator();

    ArrayDeclarator(ArrayDeclarator&&) noexcept;

    ArrayDeclarator& operator=(ArrayDeclarator&&) noexcept;

    [[nodiscard]] const Declarator& getInner() const;

    [[nodiscard]] const std::optional<std::size_t>& getSize() const noexcept
    {
        return m_size;
    }

    bool operator==(const ArrayDeclarator& rhs) const;

    bool operator!=(const ArrayDeclarator& rhs) const;
};

/**
 * <FunctionDeclarator> ::= <Declarator> <TokenType::OpenParentheses> [ <TokenType::VoidKeyword> | <Declaration> {
 * <TokenType::Comma> <Declaration> } [<TokenType::Comma>] ] <TokenType::CloseParentheses>
 *
 * A parameter list consisting of just 'void' results in no parameters
 */
class FunctionDeclarator final
{
    std::unique_ptr<Declarator> m_inner;
    std::vector<Declaration> m_parameters;

public:
    FunctionDeclarator(Declarator&& inner, std::vector<Declaration>&& parameters);

    ~FunctionDeclarator();

    FunctionDeclarator(FunctionDeclarator&&) noexcept;

    FunctionDeclarator& operator=(FunctionDeclarator&&) noexcept;

    [[nodiscard]] const Declarator& getInner() const;

    [[nodiscard]] const std::vector<Declaration>& getParameters() const noexcept
    {
        return m_parameters;
    }

    bool operator==(const FunctionDeclarator& rhs) const;

    bool operator!=(const FunctionDeclarator& rhs) const;
};

/**
 * <Declarator> ::= { <TokenType::Asterisk> { <TypeQualifier> } } <Atom> { <Suffix> }
 *
 * <Atom> ::= [ <TokenType::Identifier> | <TokenType::OpenParentheses> <Declarator> <TokenType::CloseParentheses> ]
 *
 * Nesting follows C's inside out reading order. The innermost declarator is the name being declared
 */
class Declarator final
{
public:
    using variant =
        std::variant<AnonymousDeclarator, IdentifierDeclarator, PointerDeclarator, ArrayDeclarator, FunctionDeclarator>;

private:
    variant m_variant;

public:
    Declarator() : m_variant(AnonymousDeclarator{}) {}

    explicit Declarator(variant&& alternative) : m_variant(std::move(alternative)) {}

    [[nodiscard]] const variant& getVariant() const noexcept
    {
        return m_variant;
    }

    /**
     * Name of the innermost identifier if there is one
     */
    [[nodiscard]] std::optional<std::string_view> getName() const;

    bool operator==(const Declarator& rhs) const;

    bool operator!=(const Declarator& rhs) const;
};

/**
 * <Declaration> ::= [<TokenType::TypedefKeyword>] <QualifiedType> <Declarator>
 *
 * A leading typedef is recorded as TypeQualifier::Typedef in the base type
 */
class Declaration final
{
    QualifiedType m_baseType;
    Declarator m_declarator;

public:
    Declaration(QualifiedType baseType, Declarator&& declarator);

    [[nodiscard]] const QualifiedType& getBaseType() const noexcept
    {
        return m_baseType;
    }

    [[nodiscard]] const Declarator& getDeclarator() const noexcept
    {
        return m_declarator;
    }

    [[nodiscard]] bool isTypedef() const noexcept
    {
        return m_baseType.getQualifiers().contains(TypeQualifier::Typedef);
    }

    bool operator==(const Declaration& rhs) const;

    bool operator!=(const Declaration& rhs) const;
};

} // namespace declex::Syntax

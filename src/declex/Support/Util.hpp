#pragma once

#include <cstdio>
#include <cstdlib>
#include <type_traits>
#include <utility>
#include <variant>

#ifdef NDEBUG

    #ifndef DECLEX_USE_ASSERTS

        #if defined(__clang__) || defined(__GNUC__)

            #define DECLEX_UNREACHABLE       \
                do                           \
                    __builtin_unreachable(); \
                while (0)

            #define DECLEX_ASSERT(...) \
                if (__VA_ARGS__)       \
                    ;                  \
                else                   \
                    __builtin_unreachable()

        #elif defined(_MSC_VER)

            #define DECLEX_UNREACHABLE \
                do                     \
                    __assume(false);   \
                while (0)

            #define DECLEX_ASSERT(...) __assume((bool)(__VA_ARGS__))

        #else

            #define DECLEX_UNREACHABLE

            #define DECLEX_ASSERT(...)

        #endif

    #else

        #define DECLEX_UNREACHABLE \
            do                     \
                std::abort();      \
            while (0)

        #define DECLEX_ASSERT(...)                                                 \
            do                                                                     \
            {                                                                      \
                if (!(__VA_ARGS__))                                                \
                {                                                                  \
                    fprintf(stderr, __FILE__ ":%d: " #__VA_ARGS__ "\n", __LINE__); \
                    std::abort();                                                  \
                }                                                                  \
            } while (0)

    #endif

#else

    #define DECLEX_ASSERT(...)                                                 \
        do                                                                     \
        {                                                                      \
            if (!(__VA_ARGS__))                                                \
            {                                                                  \
                fprintf(stderr, __FILE__ ":%d: " #__VA_ARGS__ "\n", __LINE__); \
                std::abort();                                                  \
            }                                                                  \
        } while (0)

    #define DECLEX_UNREACHABLE                                                           \
        do                                                                               \
        {                                                                                \
            std::abort(); /* So that the compiler sees code afterwards is unreachable */ \
        } while (0)

#endif

namespace declex
{
template <typename T, typename Variant>
constexpr decltype(auto) get(Variant&& variant) noexcept
{
    DECLEX_ASSERT(!variant.valueless_by_exception() && std::holds_alternative<T>(variant));
    auto* value = std::get_if<T>(&variant);
    DECLEX_ASSERT(value);
    if constexpr (std::is_lvalue_reference_v<Variant>)
    {
        return *value;
    }
    else
    {
        return std::move(*value);
    }
}

namespace detail
{
template <class... Ts>
struct overload : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;
} // namespace detail

template <typename Variant, typename... Matchers>
constexpr decltype(auto) match(Variant&& variant, Matchers&&... matchers)
{
    DECLEX_ASSERT(!variant.valueless_by_exception());
    return std::visit(detail::overload{std::forward<Matchers>(matchers)...}, std::forward<Variant>(variant));
}

template <class T1, class T2>
constexpr T1 roundUpTo(T1 number, T2 multiple)
{
    static_assert(std::is_integral_v<T1> && std::is_integral_v<T2>);
    if (multiple == 0)
    {
        return number;
    }

    auto remainder = number % multiple;
    if (remainder == 0)
    {
        return number;
    }

    return number + multiple - remainder;
}

/**
 * Assigns a previously saved value back to a variable when going out of scope
 */
template <class T>
class ValueReset final
{
    T& m_valueRef;
    T m_valueToReset;

public:
    ValueReset(T& valueRef, T valueToReset) : m_valueRef(valueRef), m_valueToReset(std::move(valueToReset)) {}

    ~ValueReset()
    {
        m_valueRef = std::move(m_valueToReset);
    }

    ValueReset(const ValueReset&) = delete;
    ValueReset& operator=(const ValueReset&) = delete;
    ValueReset(ValueReset&&) = delete;
    ValueReset& operator=(ValueReset&&) = delete;
};

} // namespace declex

#pragma once

#include <llvm/Support/raw_ostream.h>

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace declex
{
class Format final
{
    const char* m_format;

    [[nodiscard]] std::string format(std::vector<std::string> args) const;

    template <class T>
    static std::string toString(T&& value)
    {
        using U = std::decay_t<T>;
        if constexpr (std::is_convertible_v<U, std::string>)
        {
            return value;
        }
        else if constexpr (std::is_same_v<U, std::string_view>)
        {
            return std::string(value.begin(), value.end());
        }
        else if constexpr (std::is_same_v<U, char>)
        {
            return std::string(1, value);
        }
        else
        {
            return std::to_string(value);
        }
    }

public:
    class List final
    {
        std::string m_delimiter;
        std::string m_lastInbetween;
        std::vector<std::string> m_strings;

    public:
        template <class... Args>
        List(std::string delimiter, std::string lastInbetween, Args&&... args)
            : m_delimiter(std::move(delimiter)),
              m_lastInbetween(std::move(lastInbetween)),
              m_strings({toString(args)...})
        {
        }

        List(std::string delimiter, std::string lastInbetween, std::vector<std::string> args)
            : m_delimiter(std::move(delimiter)), m_lastInbetween(std::move(lastInbetween)), m_strings(std::move(args))
        {
        }

        explicit operator std::string() const;
    };

    constexpr explicit Format(const char* format) : m_format(format) {}

    template <class... Args>
    std::string args(Args&&... args) const
    {
        return format({toString(args)...});
    }
};

enum class Severity
{
    None,
    Error,
    Warning,
    Note
};

class Message final
{
    Severity m_severity = Severity::None;
    std::string m_text;

public:
    Message() = default;

    Message(Severity severity, std::string text) : m_severity(severity), m_text(std::move(text)) {}

    [[nodiscard]] Severity getSeverity() const
    {
        return m_severity;
    }

    [[nodiscard]] const std::string& getText() const
    {
        return m_text;
    }

    static Message error(std::string text)
    {
        return Message(Severity::Error, std::move(text));
    }

    static Message warning(std::string text)
    {
        return Message(Severity::Warning, std::move(text));
    }

    static Message note(std::string text)
    {
        return Message(Severity::Note, std::move(text));
    }

    friend llvm::raw_ostream& operator<<(llvm::raw_ostream& os, const Message& message);
};

llvm::raw_ostream& operator<<(llvm::raw_ostream& os, const Message& message);

} // namespace declex

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace vat
{

enum class BakeErrorKind : uint8_t
{
    None,
    PreconditionError,
    CapacityError,
    IndexError,
    ConfigurationError,
    Count
};

inline const char* GetBakeErrorKindName(BakeErrorKind kind)
{
    switch (kind)
    {
    case BakeErrorKind::None:
        return "None";
    case BakeErrorKind::PreconditionError:
        return "PreconditionError";
    case BakeErrorKind::CapacityError:
        return "CapacityError";
    case BakeErrorKind::IndexError:
        return "IndexError";
    case BakeErrorKind::ConfigurationError:
        return "ConfigurationError";
    default:
        return "Unknown";
    }
}

// Result of a validation step or a whole bake pass. A failed status means
// nothing has been written.
class BakeStatus
{
public:
    BakeStatus() = default;

    static BakeStatus Ok() { return BakeStatus(); }
    static BakeStatus Error(BakeErrorKind kind, std::string message) { return BakeStatus(kind, std::move(message)); }

    bool IsOk() const { return m_Kind == BakeErrorKind::None; }
    explicit operator bool() const { return IsOk(); }

    BakeErrorKind GetKind() const { return m_Kind; }
    const std::string& GetMessage() const { return m_Message; }

private:
    BakeStatus(BakeErrorKind kind, std::string message)
    : m_Kind(kind), m_Message(std::move(message))
    {
    }

    BakeErrorKind m_Kind { BakeErrorKind::None };
    std::string m_Message;
};

// 8192 -> "8,192"
inline std::string FormatCount(uint64_t value)
{
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);
    for (size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (digits.size() - i) % 3 == 0)
            result.push_back(',');
        result.push_back(digits[i]);
    }
    return result;
}

} // namespace vat

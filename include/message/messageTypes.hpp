#pragma once

#include "utils/utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

using MessageBuffer = std::vector<std::byte>;
using MessageView = std::span<const std::byte>;

enum class MessageFormat : std::uint8_t { JSON = 0x01, XML = 0x02 };

constexpr const char* toStr(MessageFormat f) {
    switch (f) {
    case MessageFormat::JSON:
        return "JSON";
    case MessageFormat::XML:
        return "XML";
    default:
        return "UNKNOWN_FORMAT";
    }
}

inline std::ostream& operator<<(std::ostream& os, MessageFormat f) { return os << toStr(f); }

// case-insensitive "json" / "xml"
inline std::optional<MessageFormat> parseFormat(std::string_view s) {
    if (utils::equalsNoCase(s, "json")) return MessageFormat::JSON;
    if (utils::equalsNoCase(s, "xml")) return MessageFormat::XML;
    return std::nullopt;
}

namespace fields {
constexpr std::string_view RECIPIENT = "recipient";
constexpr std::string_view JSON_TEXT = "message";
constexpr std::string_view XML_TEXT = "body";
constexpr std::string_view XML_ROOT = "XMLMessage";
} // namespace fields

#pragma once

#include "message/statusCodes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace utils {

struct TextViolation {
    statusCodes::SerializationStatus status;
    std::size_t offset;
    std::uint32_t codePoint; // 0 for ill-formed sequences
};

// XML 1.0 Char production
constexpr bool isXmlChar(std::uint32_t cp) noexcept {
    return cp == 0x09 || cp == 0x0A || cp == 0x0D || (cp >= 0x20 && cp <= 0xD7FF) ||
           (cp >= 0xE000 && cp <= 0xFFFD) || (cp >= 0x10000 && cp <= 0x10FFFF);
}

// First ill-formed UTF-8 sequence; any code point is accepted.
std::optional<TextViolation> validateUtf8(std::string_view text) noexcept;

// First byte offset at which text stops being well-formed UTF-8 or leaves
// the XML character range.
std::optional<TextViolation> validateXmlText(std::string_view text) noexcept;

} // namespace utils

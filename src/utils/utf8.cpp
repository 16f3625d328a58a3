#include "utils/utf8.hpp"

namespace utils {

namespace {
TextViolation illFormed(std::size_t offset) {
    return TextViolation{statusCodes::SerializationStatus::INVALID_UTF8, offset, 0};
}

std::optional<TextViolation> walk(std::string_view text, bool xmlChars) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);

        std::uint32_t cp = 0;
        std::uint32_t minCp = 0;
        std::size_t len = 0;

        if (lead < 0x80) {
            cp = lead;
            len = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            minCp = 0x80;
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            minCp = 0x800;
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            minCp = 0x10000;
            len = 4;
        } else {
            return illFormed(i);
        }

        if (i + len > text.size()) return illFormed(i);

        for (std::size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return illFormed(i);
            cp = (cp << 6) | (cont & 0x3F);
        }

        // overlong, surrogate, or past the last plane
        if (cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return illFormed(i);
        }

        if (xmlChars && !isXmlChar(cp)) {
            return TextViolation{statusCodes::SerializationStatus::INVALID_XML_CHAR, i,
                                 cp};
        }

        i += len;
    }

    return std::nullopt;
}

} // namespace

std::optional<TextViolation> validateUtf8(std::string_view text) noexcept {
    return walk(text, false);
}

std::optional<TextViolation> validateXmlText(std::string_view text) noexcept {
    return walk(text, true);
}

} // namespace utils

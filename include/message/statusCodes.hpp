#pragma once

#include <cstdint>

namespace statusCodes {
enum class SerializationStatus : uint8_t {
    NULLSTATUS = 0x00,
    INVALID_UTF8 = 0x01,
    INVALID_XML_CHAR = 0x02,
    CODEC_FAILURE = 0x03
};

constexpr const char* toStr(SerializationStatus s) {
    switch (s) {
    case SerializationStatus::NULLSTATUS:
        return "NULLSTATUS";
    case SerializationStatus::INVALID_UTF8:
        return "INVALID_UTF8";
    case SerializationStatus::INVALID_XML_CHAR:
        return "INVALID_XML_CHAR";
    case SerializationStatus::CODEC_FAILURE:
        return "CODEC_FAILURE";
    default:
        return "UNKNOWN_SERIALIZATION_STATUS";
    }
}
} // namespace statusCodes

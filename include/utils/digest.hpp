#pragma once

#include "message/messageTypes.hpp"

#include <string>

namespace utils {
// Lowercase hex SHA-256 of the given bytes. Throws std::runtime_error if
// OpenSSL fails.
std::string sha256Hex(MessageView bytes);
} // namespace utils

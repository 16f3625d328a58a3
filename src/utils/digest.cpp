#include "utils/digest.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace utils {

std::string sha256Hex(MessageView bytes) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int len = 0;

    if (EVP_Digest(bytes.data(), bytes.size(), md.data(), &len, EVP_sha256(),
                   nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    static constexpr char hexDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(hexDigits[md[i] >> 4]);
        out.push_back(hexDigits[md[i] & 0x0F]);
    }
    return out;
}

} // namespace utils

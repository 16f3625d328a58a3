#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>

template <typename T>
    requires std::is_enum_v<T>
constexpr auto operator+(T a) noexcept {
    return static_cast<std::underlying_type_t<T>>(a);
}

namespace utils {
// `lower` must already be lowercase ASCII
constexpr bool equalsNoCase(std::string_view s, std::string_view lower) noexcept {
    if (s.size() != lower.size()) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if (c != lower[i]) return false;
    }
    return true;
}
} // namespace utils

#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace fastaclass {

// ASCII whitespace: space, \t, \n, \v, \f, \r and the separators
// \x1c-\x1f. Non-ASCII (multi-byte) spaces are left alone.
inline bool is_space(char c) {
    auto b = static_cast<unsigned char>(c);
    return std::isspace(b) != 0 || (b >= 0x1c && b <= 0x1f);
}

// Remove leading and trailing whitespace as defined by is_space().
inline std::string_view trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start]))
        start++;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1]))
        end--;
    return s.substr(start, end - start);
}

inline void to_upper_inplace(std::string& s) {
    for (auto& c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace fastaclass

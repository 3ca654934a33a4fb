#ifndef TOON_CHARCONV_HPP
#define TOON_CHARCONV_HPP

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstddef>
#include <string>
#include <system_error>

namespace toonenc {

// Shortest round-trip digits of a finite double in scientific form
// ("d.ddde+XX").  Apple clang's libc++ and libstdc++ before 11 lack
// floating-point std::to_chars; there we search %.*e precisions for the
// first one that reads back exactly.

inline std::string double_to_scientific(double value) {
#if !defined(_LIBCPP_VERSION) && defined(__cpp_lib_to_chars)
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (res.ec != std::errc{}) {
        return std::string();
    }
    return std::string(buf, res.ptr);
#else
    char buf[64];
    for (int precision = 0; precision <= 17; precision++) {
        int len = std::snprintf(buf, sizeof(buf), "%.*e", precision, value);
        if (len <= 0 || static_cast<std::size_t>(len) >= sizeof(buf)) {
            return std::string();
        }
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }

    // snprintf honours LC_NUMERIC; the radix is the only non-digit before 'e'
    std::string out(buf);
    for (std::size_t i = 0; i < out.size() && out[i] != 'e'; i++) {
        char c = out[i];
        if (c != '-' && (c < '0' || c > '9')) {
            out.replace(i, 1, ".");
            std::size_t j = i + 1;
            while (j < out.size() && out[j] != 'e' && (out[j] < '0' || out[j] > '9')) {
                j++;
            }
            out.erase(i + 1, j - i - 1);
            break;
        }
    }
    return out;
#endif
}

}  // namespace toonenc

#endif  // TOON_CHARCONV_HPP

#include "toon_primitives.hpp"
#include "toon_buffer.hpp"
#include "toon_charconv.hpp"
#include <cmath>
#include <cstdlib>

namespace toonenc {

namespace {

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Byte length of the whitespace code point starting at s[pos], 0 if none.
// Covers the ASCII set plus the Unicode space separators, line/paragraph
// separators and the BOM.
size_t whitespace_len_at(std::string_view s, size_t pos) {
    auto u = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    size_t rem = s.size() - pos;
    unsigned char c = u(pos);

    if (c == ' ' || (c >= 0x09 && c <= 0x0d)) return 1;
    if (rem >= 2 && c == 0xc2 && u(pos + 1) == 0xa0) return 2;
    if (rem < 3) return 0;

    unsigned char c1 = u(pos + 1), c2 = u(pos + 2);
    if (c == 0xe1 && c1 == 0x9a && c2 == 0x80) return 3;
    if (c == 0xe2 && c1 == 0x80 &&
        ((c2 >= 0x80 && c2 <= 0x8a) || c2 == 0xa8 || c2 == 0xa9 || c2 == 0xaf)) return 3;
    if (c == 0xe2 && c1 == 0x81 && c2 == 0x9f) return 3;
    if (c == 0xe3 && c1 == 0x80 && c2 == 0x80) return 3;
    if (c == 0xef && c1 == 0xbb && c2 == 0xbf) return 3;
    return 0;
}

bool has_leading_whitespace(std::string_view s) {
    return !s.empty() && whitespace_len_at(s, 0) > 0;
}

bool has_trailing_whitespace(std::string_view s) {
    if (s.empty()) return false;
    // Longest whitespace sequence is three bytes
    for (size_t len = 1; len <= 3 && len <= s.size(); len++) {
        if (whitespace_len_at(s, s.size() - len) == len) return true;
    }
    return false;
}

void strip_trailing_fraction_zeros(std::string& s) {
    if (s.find('.') == std::string::npos) return;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
}

} // namespace

std::string encode_number(double n) {
    if (!std::isfinite(n)) return "null";
    if (n == 0.0) return "0";

    // "-d.ddde+XX"
    std::string sci = double_to_scientific(n);
    size_t e_pos = sci.find('e');
    if (sci.empty() || e_pos == std::string::npos) return "null";

    size_t i = 0;
    std::string sign;
    if (sci[0] == '-') {
        sign = "-";
        i = 1;
    }

    std::string mantissa = sci.substr(i, e_pos - i);
    int exp = std::atoi(sci.c_str() + e_pos + 1);

    std::string int_part = mantissa;
    std::string frac_part;
    size_t dot = mantissa.find('.');
    if (dot != std::string::npos) {
        int_part = mantissa.substr(0, dot);
        frac_part = mantissa.substr(dot + 1);
    }

    std::string digits = int_part + frac_part;
    long new_pos = static_cast<long>(int_part.size()) + exp;

    std::string out;
    if (new_pos <= 0) {
        size_t first = digits.find_first_not_of('0');
        if (first == std::string::npos) return "0";
        out = "0." + std::string(static_cast<size_t>(-new_pos), '0') + digits.substr(first);
    } else if (static_cast<size_t>(new_pos) >= digits.size()) {
        out = digits + std::string(static_cast<size_t>(new_pos) - digits.size(), '0');
    } else {
        out = digits.substr(0, new_pos) + "." + digits.substr(new_pos);
    }

    // Leading zeros, keeping the one before the radix
    size_t lead = 0;
    while (lead + 1 < out.size() && out[lead] == '0' && is_digit(out[lead + 1])) {
        lead++;
    }
    out.erase(0, lead);
    strip_trailing_fraction_zeros(out);

    return sign + out;
}

bool looks_like_number(std::string_view s) {
    size_t i = 0;
    size_t n = s.size();

    if (i < n && s[i] == '-') i++;
    if (i >= n || !is_digit(s[i])) return false;

    if (s[i] == '0') {
        i++;
    } else {
        while (i < n && is_digit(s[i])) i++;
    }

    if (i < n && s[i] == '.') {
        i++;
        if (i >= n || !is_digit(s[i])) return false;
        while (i < n && is_digit(s[i])) i++;
    }

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < n && (s[i] == '+' || s[i] == '-')) i++;
        if (i >= n || !is_digit(s[i])) return false;
        while (i < n && is_digit(s[i])) i++;
    }

    return i == n;
}

bool needs_quotes(std::string_view s, char delimiter) {
    if (s.empty()) return true;
    if (has_leading_whitespace(s) || has_trailing_whitespace(s)) return true;
    if (s == "true" || s == "false" || s == "null") return true;
    if (looks_like_number(s)) return true;
    if (s[0] == '-') return true;

    for (char c : s) {
        if (static_cast<unsigned char>(c) < 0x20) return true;
        if (c == '"' || c == '\\' || c == ':') return true;
        if (c == delimiter || c == ',' || c == '\t') return true;
    }
    return false;
}

std::string escape_quoted(std::string_view s) {
    WriteBuffer buf(s.size() + 2);
    buf.append_quoted(s);
    std::string_view quoted = buf.view();
    return std::string(quoted.substr(1, quoted.size() - 2));
}

std::string encode_string(std::string_view s, char delimiter) {
    if (!needs_quotes(s, delimiter)) {
        return std::string(s);
    }
    WriteBuffer buf(s.size() + 2);
    buf.append_quoted(s);
    return buf.str();
}

std::string encode_key(std::string_view key) {
    return encode_string(key, DELIM_COMMA);
}

std::string encode_primitive(const Value& v, char delimiter) {
    switch (v.kind) {
        case ValueKind::V_NULL:
            return "null";
        case ValueKind::V_BOOL:
            return v.bool_val ? "true" : "false";
        case ValueKind::V_NUMBER:
            return encode_number(v.number_val);
        case ValueKind::V_STRING:
            return encode_string(v.string_val, delimiter);
        default:
            break;
    }
    return "null";
}

} // namespace toonenc

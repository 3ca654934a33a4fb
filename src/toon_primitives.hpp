#ifndef TOON_PRIMITIVES_HPP
#define TOON_PRIMITIVES_HPP

#include <string>
#include <string_view>
#include "toon_value.hpp"

namespace toonenc {

// Row/inline delimiters
constexpr char DELIM_COMMA = ',';
constexpr char DELIM_TAB = '\t';

// Plain decimal rendering of a number: shortest round-trip digits, no
// exponent, no redundant zeros. Non-finite input renders as "null".
std::string encode_number(double n);

// s as-is, or double-quoted and escaped when it could be misread
std::string encode_string(std::string_view s, char delimiter = DELIM_COMMA);

// Object keys and tabular field names always quote against ','
std::string encode_key(std::string_view key);

// null / true / false / number / string token; v must be primitive
std::string encode_primitive(const Value& v, char delimiter = DELIM_COMMA);

bool needs_quotes(std::string_view s, char delimiter);

// -?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?
bool looks_like_number(std::string_view s);

std::string escape_quoted(std::string_view s);

} // namespace toonenc

#endif // TOON_PRIMITIVES_HPP

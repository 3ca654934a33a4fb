#ifndef TOON_HOST_HPP
#define TOON_HOST_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <utility>
#include "toon_value.hpp"

namespace toonenc {

// Host value kinds, classified once when the value is built
enum class HostKind {
    H_NULL,
    H_BOOL,
    H_NUMBER,
    H_STRING,
    H_BIGINT,
    H_UNDEFINED,
    H_DATE,
    H_FUNCTION,
    H_SYMBOL,
    H_ARRAY,
    H_OBJECT,
    H_INSTANCE
};

// Arbitrary input value prior to normalization.
//
// Numbers may be non-finite or negative zero. Dates hold milliseconds since
// the Unix epoch. Big integers hold their decimal digits. Instances stand for
// any structured type that is not a plain record and carry a type name plus
// the text they render as.
struct HostValue {
    HostKind kind = HostKind::H_NULL;

    bool bool_val = false;
    double number_val = 0.0;
    std::string string_val;   // string, bigint digits, instance text
    std::string type_name;    // instance type, function/symbol name

    std::vector<HostValuePtr> array_items;
    std::vector<std::pair<std::string, HostValuePtr>> object_items;

    // Append to an array
    HostValue& push(HostValuePtr v);

    // Set an object field; replacing keeps the original position. Fields
    // pushed onto object_items directly may repeat a key: normalization
    // then keeps the first position and the last value.
    HostValue& set(const std::string& key, HostValuePtr v);

    static HostValuePtr make_null();
    static HostValuePtr make_bool(bool v);
    static HostValuePtr make_number(double v);
    static HostValuePtr make_string(const std::string& v);
    static HostValuePtr make_string(std::string_view v);
    static HostValuePtr make_string(const char* v);
    static HostValuePtr make_bigint(const std::string& digits);
    static HostValuePtr make_undefined();
    static HostValuePtr make_date(double epoch_ms);
    static HostValuePtr make_function(const std::string& name = "");
    static HostValuePtr make_symbol(const std::string& description = "");
    static HostValuePtr make_array();
    static HostValuePtr make_array(std::vector<HostValuePtr> items);
    static HostValuePtr make_object();
    static HostValuePtr make_instance(const std::string& type_name,
                                      const std::string& text);
};

// Name used in diagnostics ("bigint", "Date", an instance's type, ...)
std::string host_type_name(const HostValue& v);

// ISO-8601 rendering of epoch milliseconds (YYYY-MM-DDTHH:MM:SS.sssZ).
// Returns false for non-finite or out-of-range timestamps.
bool format_iso8601(double epoch_ms, std::string& out);

} // namespace toonenc

#endif // TOON_HOST_HPP

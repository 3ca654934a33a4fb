#ifndef TOON_VALUE_HPP
#define TOON_VALUE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <utility>

namespace toonenc {

struct HostValue;
using HostValuePtr = std::shared_ptr<HostValue>;

struct Value;
using ValuePtr = std::shared_ptr<Value>;

// Canonical value kinds
enum class ValueKind {
    V_NULL,
    V_BOOL,
    V_NUMBER,
    V_STRING,
    V_ARRAY,
    V_OBJECT
};

// Canonical value tree. Numbers are finite and never negative zero, object
// keys are unique and keep insertion order.
struct Value {
    ValueKind kind = ValueKind::V_NULL;

    bool bool_val = false;
    double number_val = 0.0;
    std::string string_val;

    std::vector<ValuePtr> array_items;
    std::vector<std::pair<std::string, ValuePtr>> object_items;

    bool is_primitive() const {
        return kind != ValueKind::V_ARRAY && kind != ValueKind::V_OBJECT;
    }

    // Returns nullptr when key is absent
    ValuePtr find(std::string_view key) const;

    // Structural equality; object field order is significant
    bool equals(const Value& other) const;

    // Rebuild as a host value (used to re-run normalization)
    HostValuePtr to_host() const;

    static ValuePtr make_null();
    static ValuePtr make_bool(bool v);
    static ValuePtr make_number(double v);
    static ValuePtr make_string(const std::string& v);
    static ValuePtr make_string(std::string_view v);
    static ValuePtr make_string(const char* v);
    static ValuePtr make_array();
    static ValuePtr make_object();
};

} // namespace toonenc

#endif // TOON_VALUE_HPP

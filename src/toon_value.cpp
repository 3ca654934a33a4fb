#include "toon_value.hpp"
#include "toon_host.hpp"

namespace toonenc {

ValuePtr Value::make_null() {
    return std::make_shared<Value>();
}

ValuePtr Value::make_bool(bool v) {
    auto node = std::make_shared<Value>();
    node->kind = ValueKind::V_BOOL;
    node->bool_val = v;
    return node;
}

ValuePtr Value::make_number(double v) {
    auto node = std::make_shared<Value>();
    node->kind = ValueKind::V_NUMBER;
    node->number_val = v;
    return node;
}

ValuePtr Value::make_string(const std::string& v) {
    auto node = std::make_shared<Value>();
    node->kind = ValueKind::V_STRING;
    node->string_val = v;
    return node;
}

ValuePtr Value::make_string(std::string_view v) {
    return make_string(std::string(v));
}

ValuePtr Value::make_string(const char* v) {
    return make_string(std::string(v));
}

ValuePtr Value::make_array() {
    auto node = std::make_shared<Value>();
    node->kind = ValueKind::V_ARRAY;
    return node;
}

ValuePtr Value::make_object() {
    auto node = std::make_shared<Value>();
    node->kind = ValueKind::V_OBJECT;
    return node;
}

ValuePtr Value::find(std::string_view key) const {
    for (const auto& item : object_items) {
        if (item.first == key) return item.second;
    }
    return nullptr;
}

bool Value::equals(const Value& other) const {
    if (kind != other.kind) return false;

    switch (kind) {
        case ValueKind::V_NULL:
            return true;
        case ValueKind::V_BOOL:
            return bool_val == other.bool_val;
        case ValueKind::V_NUMBER:
            return number_val == other.number_val;
        case ValueKind::V_STRING:
            return string_val == other.string_val;
        case ValueKind::V_ARRAY:
            if (array_items.size() != other.array_items.size()) return false;
            for (size_t i = 0; i < array_items.size(); i++) {
                if (!array_items[i]->equals(*other.array_items[i])) return false;
            }
            return true;
        case ValueKind::V_OBJECT:
            if (object_items.size() != other.object_items.size()) return false;
            for (size_t i = 0; i < object_items.size(); i++) {
                if (object_items[i].first != other.object_items[i].first) return false;
                if (!object_items[i].second->equals(*other.object_items[i].second)) return false;
            }
            return true;
    }

    return false;
}

HostValuePtr Value::to_host() const {
    switch (kind) {
        case ValueKind::V_NULL:
            return HostValue::make_null();
        case ValueKind::V_BOOL:
            return HostValue::make_bool(bool_val);
        case ValueKind::V_NUMBER:
            return HostValue::make_number(number_val);
        case ValueKind::V_STRING:
            return HostValue::make_string(string_val);
        case ValueKind::V_ARRAY: {
            auto out = HostValue::make_array();
            for (const auto& item : array_items) {
                out->push(item->to_host());
            }
            return out;
        }
        case ValueKind::V_OBJECT: {
            auto out = HostValue::make_object();
            for (const auto& item : object_items) {
                out->set(item.first, item.second->to_host());
            }
            return out;
        }
    }

    return HostValue::make_null();
}

} // namespace toonenc

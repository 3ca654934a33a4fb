#include "toon_host.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace toonenc {

namespace {

// Largest timestamp magnitude a date may hold (100,000,000 days)
constexpr double MAX_EPOCH_MS = 8.64e15;
constexpr int64_t MS_PER_DAY = 86400000;

HostValuePtr make_kind(HostKind kind) {
    auto node = std::make_shared<HostValue>();
    node->kind = kind;
    return node;
}

// Days since 1970-01-01 to proleptic Gregorian y/m/d
void civil_from_days(int64_t z, int64_t& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

} // namespace

HostValue& HostValue::push(HostValuePtr v) {
    array_items.push_back(std::move(v));
    return *this;
}

HostValue& HostValue::set(const std::string& key, HostValuePtr v) {
    for (auto& item : object_items) {
        if (item.first == key) {
            item.second = std::move(v);
            return *this;
        }
    }
    object_items.emplace_back(key, std::move(v));
    return *this;
}

HostValuePtr HostValue::make_null() {
    return make_kind(HostKind::H_NULL);
}

HostValuePtr HostValue::make_bool(bool v) {
    auto node = make_kind(HostKind::H_BOOL);
    node->bool_val = v;
    return node;
}

HostValuePtr HostValue::make_number(double v) {
    auto node = make_kind(HostKind::H_NUMBER);
    node->number_val = v;
    return node;
}

HostValuePtr HostValue::make_string(const std::string& v) {
    auto node = make_kind(HostKind::H_STRING);
    node->string_val = v;
    return node;
}

HostValuePtr HostValue::make_string(std::string_view v) {
    return make_string(std::string(v));
}

HostValuePtr HostValue::make_string(const char* v) {
    return make_string(std::string(v));
}

HostValuePtr HostValue::make_bigint(const std::string& digits) {
    auto node = make_kind(HostKind::H_BIGINT);
    node->string_val = digits;
    return node;
}

HostValuePtr HostValue::make_undefined() {
    return make_kind(HostKind::H_UNDEFINED);
}

HostValuePtr HostValue::make_date(double epoch_ms) {
    auto node = make_kind(HostKind::H_DATE);
    node->number_val = epoch_ms;
    return node;
}

HostValuePtr HostValue::make_function(const std::string& name) {
    auto node = make_kind(HostKind::H_FUNCTION);
    node->type_name = name;
    return node;
}

HostValuePtr HostValue::make_symbol(const std::string& description) {
    auto node = make_kind(HostKind::H_SYMBOL);
    node->type_name = description;
    return node;
}

HostValuePtr HostValue::make_array() {
    return make_kind(HostKind::H_ARRAY);
}

HostValuePtr HostValue::make_array(std::vector<HostValuePtr> items) {
    auto node = make_kind(HostKind::H_ARRAY);
    node->array_items = std::move(items);
    return node;
}

HostValuePtr HostValue::make_object() {
    return make_kind(HostKind::H_OBJECT);
}

HostValuePtr HostValue::make_instance(const std::string& type_name,
                                      const std::string& text) {
    auto node = make_kind(HostKind::H_INSTANCE);
    node->type_name = type_name;
    node->string_val = text;
    return node;
}

std::string host_type_name(const HostValue& v) {
    switch (v.kind) {
        case HostKind::H_NULL:      return "null";
        case HostKind::H_BOOL:      return "boolean";
        case HostKind::H_NUMBER:    return "number";
        case HostKind::H_STRING:    return "string";
        case HostKind::H_BIGINT:    return "bigint";
        case HostKind::H_UNDEFINED: return "undefined";
        case HostKind::H_DATE:      return "Date";
        case HostKind::H_FUNCTION:  return "function";
        case HostKind::H_SYMBOL:    return "symbol";
        case HostKind::H_ARRAY:     return "array";
        case HostKind::H_OBJECT:    return "object";
        case HostKind::H_INSTANCE:
            return v.type_name.empty() ? std::string("object") : v.type_name;
    }
    return "unknown";
}

bool format_iso8601(double epoch_ms, std::string& out) {
    if (!std::isfinite(epoch_ms) || std::fabs(epoch_ms) > MAX_EPOCH_MS) {
        return false;
    }

    const int64_t ms = static_cast<int64_t>(std::trunc(epoch_ms));
    int64_t days = ms / MS_PER_DAY;
    int64_t ms_of_day = ms % MS_PER_DAY;
    if (ms_of_day < 0) {
        ms_of_day += MS_PER_DAY;
        days--;
    }

    int64_t y;
    int m, d;
    civil_from_days(days, y, m, d);

    const int hh = static_cast<int>(ms_of_day / 3600000);
    const int mi = static_cast<int>((ms_of_day / 60000) % 60);
    const int ss = static_cast<int>((ms_of_day / 1000) % 60);
    const int mss = static_cast<int>(ms_of_day % 1000);

    char buf[48];
    if (y >= 0 && y <= 9999) {
        snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                 static_cast<int>(y), m, d, hh, mi, ss, mss);
    } else {
        snprintf(buf, sizeof(buf), "%c%06lld-%02d-%02dT%02d:%02d:%02d.%03dZ",
                 y < 0 ? '-' : '+', static_cast<long long>(y < 0 ? -y : y),
                 m, d, hh, mi, ss, mss);
    }
    out = buf;
    return true;
}

} // namespace toonenc

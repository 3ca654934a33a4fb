#include "toon_normalize.hpp"
#include <cmath>
#include <unordered_map>
#include <utility>

namespace toonenc {

namespace {

struct CoercionInfo {
    const char* type;
    const char* message;
};

const CoercionInfo COERCIONS[] = {
    {"non_finite", "non-finite number(s) coerced to null"},
    {"bigint", "big integer(s) converted to decimal strings"},
    {"date", "date(s) converted to ISO-8601 strings"},
    {"invalid_date", "invalid date(s) coerced to null"},
    {"missing_value", "missing value(s) coerced to null"},
    {"dropped_field", "field(s) with missing values dropped"},
    {"unrepresentable", "function or symbol value(s) coerced to null"},
    {"instance", "value(s) of non-plain object types converted to strings"},
};

using Field = std::pair<std::string, HostValuePtr>;

// Fields as HostValue::set leaves them: first position, last value per key
std::vector<Field> unique_fields(const HostValue& v) {
    std::vector<Field> out;
    std::unordered_map<std::string, size_t> index;
    out.reserve(v.object_items.size());
    for (const auto& item : v.object_items) {
        auto it = index.find(item.first);
        if (it != index.end()) {
            out[it->second].second = item.second;
            continue;
        }
        index.emplace(item.first, out.size());
        out.push_back(item);
    }
    return out;
}

double canonical_zero(double n) {
    // -0 == 0, so this also clears the sign bit
    return n == 0.0 ? 0.0 : n;
}

} // namespace

Normalizer::Normalizer(const NormalizeOptions& opts) : opts_(opts) {}

ValuePtr Normalizer::normalize(const HostValue& v) {
    path_.clear();
    coercions_.clear();

    if (opts_.mode == NormalizeMode::STRICT) {
        return normalize_strict(v, 0);
    }
    return normalize_sanitize(v, 0);
}

std::vector<Warning> Normalizer::warnings() const {
    std::vector<Warning> out;
    for (const auto& info : COERCIONS) {
        auto it = coercions_.find(info.type);
        if (it == coercions_.end()) continue;
        out.push_back(Warning(info.type, std::to_string(it->second) + " " + info.message));
    }
    return out;
}

void Normalizer::check_depth(int depth) {
    if (depth > opts_.max_depth) {
        throw DepthExceededError(opts_.max_depth, current_path());
    }
}

void Normalizer::note(const std::string& type) {
    if (opts_.warn) {
        coercions_[type]++;
    }
}

std::string Normalizer::current_path() const {
    std::string out = "$";
    for (const auto& seg : path_) {
        if (!seg.empty() && seg[0] == '[') {
            out += seg;
        } else {
            out += "." + seg;
        }
    }
    return out;
}

ValuePtr Normalizer::normalize_strict(const HostValue& v, int depth) {
    check_depth(depth);

    switch (v.kind) {
        case HostKind::H_NULL:
            return Value::make_null();

        case HostKind::H_BOOL:
            return Value::make_bool(v.bool_val);

        case HostKind::H_STRING:
            return Value::make_string(v.string_val);

        case HostKind::H_NUMBER:
            if (!std::isfinite(v.number_val)) {
                throw InvalidValueError("Non-finite number in strict mode", "number", current_path());
            }
            return Value::make_number(canonical_zero(v.number_val));

        case HostKind::H_ARRAY: {
            auto out = Value::make_array();
            out->array_items.reserve(v.array_items.size());
            for (size_t i = 0; i < v.array_items.size(); i++) {
                path_.push_back("[" + std::to_string(i) + "]");
                out->array_items.push_back(normalize_strict(*v.array_items[i], depth + 1));
                path_.pop_back();
            }
            return out;
        }

        case HostKind::H_OBJECT: {
            auto out = Value::make_object();
            for (const auto& item : unique_fields(v)) {
                path_.push_back(item.first);
                out->object_items.emplace_back(item.first, normalize_strict(*item.second, depth + 1));
                path_.pop_back();
            }
            return out;
        }

        default:
            break;
    }

    std::string type = host_type_name(v);
    throw InvalidValueError("Non-JSON type in strict mode: " + type, type, current_path());
}

ValuePtr Normalizer::normalize_sanitize(const HostValue& v, int depth) {
    check_depth(depth);

    switch (v.kind) {
        case HostKind::H_NULL:
            return Value::make_null();

        case HostKind::H_BOOL:
            return Value::make_bool(v.bool_val);

        case HostKind::H_STRING:
            return Value::make_string(v.string_val);

        case HostKind::H_NUMBER:
            if (!std::isfinite(v.number_val)) {
                note("non_finite");
                return Value::make_null();
            }
            return Value::make_number(canonical_zero(v.number_val));

        case HostKind::H_BIGINT:
            note("bigint");
            return Value::make_string(v.string_val);

        case HostKind::H_UNDEFINED:
            note("missing_value");
            return Value::make_null();

        case HostKind::H_FUNCTION:
        case HostKind::H_SYMBOL:
            note("unrepresentable");
            return Value::make_null();

        case HostKind::H_DATE: {
            std::string iso;
            if (!format_iso8601(v.number_val, iso)) {
                note("invalid_date");
                return Value::make_null();
            }
            note("date");
            return Value::make_string(iso);
        }

        case HostKind::H_ARRAY: {
            // Missing elements become null so indices stay aligned
            auto out = Value::make_array();
            out->array_items.reserve(v.array_items.size());
            for (size_t i = 0; i < v.array_items.size(); i++) {
                path_.push_back("[" + std::to_string(i) + "]");
                out->array_items.push_back(normalize_sanitize(*v.array_items[i], depth + 1));
                path_.pop_back();
            }
            return out;
        }

        case HostKind::H_OBJECT: {
            auto out = Value::make_object();
            for (const auto& item : unique_fields(v)) {
                if (item.second->kind == HostKind::H_UNDEFINED) {
                    note("dropped_field");
                    continue;
                }
                path_.push_back(item.first);
                out->object_items.emplace_back(item.first, normalize_sanitize(*item.second, depth + 1));
                path_.pop_back();
            }
            return out;
        }

        case HostKind::H_INSTANCE:
            note("instance");
            return Value::make_string(v.string_val);
    }

    return Value::make_null();
}

ValuePtr normalize(const HostValue& v, NormalizeMode mode) {
    NormalizeOptions opts;
    opts.mode = mode;
    opts.warn = false;
    Normalizer normalizer(opts);
    return normalizer.normalize(v);
}

} // namespace toonenc

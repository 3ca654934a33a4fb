#include "toon_encoder.hpp"
#include "toon_buffer.hpp"
#include "toon_normalize.hpp"
#include "toon_primitives.hpp"
#include <stdexcept>
#include <unordered_set>

namespace toonenc {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

// Tab when any string cell holds a comma; other kinds are not scanned
char choose_delimiter(const std::vector<const Value*>& values) {
    for (const Value* v : values) {
        if (v->kind == ValueKind::V_STRING &&
            v->string_val.find(',') != std::string::npos) {
            return DELIM_TAB;
        }
    }
    return DELIM_COMMA;
}

// Shared key set of a run of objects, in first-object order.
// Returns false when any object's keys differ from the first one's.
bool same_key_set(const std::vector<ValuePtr>& objs, std::vector<std::string>& keys) {
    keys.clear();
    if (objs.empty()) return true;

    std::unordered_set<std::string> first;
    for (const auto& item : objs[0]->object_items) {
        keys.push_back(item.first);
        first.insert(item.first);
    }

    for (size_t i = 1; i < objs.size(); i++) {
        const auto& items = objs[i]->object_items;
        if (items.size() != keys.size()) return false;
        for (const auto& item : items) {
            if (first.count(item.first) == 0) return false;
        }
    }
    return true;
}

std::string array_header(size_t n) {
    return "[" + std::to_string(n) + "]";
}

} // namespace

Encoder::Encoder(const EncodeOptions& opts) : opts_(opts) {
    if (opts_.indent < 0) {
        throw std::invalid_argument("indent must be non-negative");
    }
}

std::string Encoder::indent_str(int level) const {
    return std::string(static_cast<size_t>(level) * static_cast<size_t>(opts_.indent), ' ');
}

std::string Encoder::reindent_block(const std::string& block, int levels) const {
    if (block.empty()) return "";

    const std::string prefix = indent_str(levels);
    std::string out;
    size_t start = 0;
    while (true) {
        size_t nl = block.find('\n', start);
        size_t end = (nl == std::string::npos) ? block.size() : nl;
        if (end > start) out += prefix;
        out.append(block, start, end - start);
        if (nl == std::string::npos) break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

void Encoder::check_depth(int depth) const {
    if (depth > opts_.max_depth) {
        throw DepthExceededError(opts_.max_depth);
    }
}

EncodedArray Encoder::encode_array(const Value& arr, int indent, int depth) const {
    const auto& items = arr.array_items;
    const size_t n = items.size();
    if (n > 0) check_depth(depth + 1);

    EncodedArray enc;

    bool all_primitives = true;
    bool all_objects = n > 0;
    for (const auto& item : items) {
        if (!item->is_primitive()) all_primitives = false;
        if (item->kind != ValueKind::V_OBJECT) all_objects = false;
    }

    if (all_primitives) {
        std::vector<const Value*> cells;
        for (const auto& item : items) cells.push_back(item.get());

        enc.kind = ArrayLayout::INLINE;
        enc.header = array_header(n);
        enc.delimiter = choose_delimiter(cells);
        for (size_t i = 0; i < n; i++) {
            if (i > 0) enc.body += enc.delimiter;
            enc.body += encode_primitive(*items[i], enc.delimiter);
        }
        return enc;
    }

    std::vector<std::string> keys;
    if (all_objects && same_key_set(items, keys)) {
        bool primitive_values_only = true;
        std::vector<const Value*> cells;
        cells.reserve(n * keys.size());
        for (const auto& row : items) {
            for (const auto& key : keys) {
                ValuePtr cell = row->find(key);
                if (!cell || !cell->is_primitive()) {
                    primitive_values_only = false;
                    break;
                }
                cells.push_back(cell.get());
            }
            if (!primitive_values_only) break;
        }

        if (primitive_values_only) {
            if (!cells.empty()) check_depth(depth + 2);

            enc.kind = ArrayLayout::TABULAR;
            enc.delimiter = choose_delimiter(cells);
            enc.fields = keys;

            // Field names always use ',' regardless of the row delimiter
            std::string field_list;
            for (size_t j = 0; j < keys.size(); j++) {
                if (j > 0) field_list += ',';
                field_list += encode_key(keys[j]);
            }
            enc.header = array_header(n) + "{" + field_list + "}";

            const std::string row_indent = indent_str(indent + 1);
            std::vector<std::string> lines;
            lines.reserve(n);
            size_t c = 0;
            for (size_t i = 0; i < n; i++) {
                std::string line = row_indent;
                for (size_t j = 0; j < keys.size(); j++, c++) {
                    if (j > 0) line += enc.delimiter;
                    line += encode_primitive(*cells[c], enc.delimiter);
                }
                lines.push_back(std::move(line));
            }
            enc.body = join_lines(lines);
            return enc;
        }
    }

    enc.kind = ArrayLayout::LIST;
    enc.header = array_header(n);
    std::vector<std::string> lines;
    lines.reserve(n);
    for (const auto& item : items) {
        lines.push_back(encode_list_item(*item, indent + 1, depth + 1));
    }
    enc.body = join_lines(lines);
    return enc;
}

std::string Encoder::encode_object_field(const std::string& key, const Value& v,
                                         int indent, int depth) const {
    const std::string ind = indent_str(indent);
    const std::string k = encode_key(key);

    if (v.is_primitive()) {
        return ind + k + ": " + encode_primitive(v, DELIM_COMMA);
    }

    if (v.kind == ValueKind::V_ARRAY) {
        EncodedArray enc = encode_array(v, indent, depth);
        if (enc.kind == ArrayLayout::INLINE) {
            return ind + k + enc.header + ": " + enc.body;
        }
        return enc.body.empty() ? ind + k + enc.header + ":"
                                : ind + k + enc.header + ":\n" + enc.body;
    }

    if (v.object_items.empty()) return ind + k + ":";

    std::string body = encode_object(v, indent + 1, depth);
    return body.empty() ? ind + k + ":" : ind + k + ":\n" + body;
}

std::string Encoder::encode_object(const Value& obj, int indent, int depth) const {
    if (!obj.object_items.empty()) check_depth(depth + 1);

    std::vector<std::string> lines;
    lines.reserve(obj.object_items.size());
    for (const auto& item : obj.object_items) {
        lines.push_back(encode_object_field(item.first, *item.second, indent, depth + 1));
    }
    return join_lines(lines);
}

std::string Encoder::encode_list_item(const Value& v, int indent, int depth) const {
    const std::string ind = indent_str(indent);

    if (v.is_primitive()) {
        return ind + "- " + encode_primitive(v, DELIM_COMMA);
    }

    if (v.kind == ValueKind::V_ARRAY) {
        EncodedArray enc = encode_array(v, indent, depth);
        if (enc.kind == ArrayLayout::INLINE) {
            return ind + "- " + enc.header + ": " + enc.body;
        }
        return enc.body.empty() ? ind + "- " + enc.header + ":"
                                : ind + "- " + enc.header + ":\n" + enc.body;
    }

    if (v.object_items.empty()) return ind + "-";
    check_depth(depth + 1);

    // First field shares the dash line, the rest sit one level deeper
    const std::string& first_key = v.object_items[0].first;
    const Value& first_val = *v.object_items[0].second;
    const std::string first_token = encode_key(first_key);

    std::string first_line;
    std::vector<std::string> tail;

    if (first_val.is_primitive()) {
        first_line = ind + "- " + first_token + ": " + encode_primitive(first_val, DELIM_COMMA);
    } else if (first_val.kind == ValueKind::V_ARRAY) {
        EncodedArray enc = encode_array(first_val, indent, depth + 1);
        if (enc.kind == ArrayLayout::INLINE) {
            first_line = ind + "- " + first_token + enc.header + ": " + enc.body;
        } else {
            first_line = ind + "- " + first_token + enc.header + ":";
            if (!enc.body.empty()) {
                if (enc.kind == ArrayLayout::TABULAR) {
                    tail.push_back(reindent_block(enc.body, 1));
                } else {
                    tail.push_back(enc.body);
                }
            }
        }
    } else {
        first_line = ind + "- " + first_token + ":";
        std::string nested = encode_object(first_val, indent + 1, depth + 1);
        if (!nested.empty()) tail.push_back(nested);
    }

    for (size_t i = 1; i < v.object_items.size(); i++) {
        const auto& item = v.object_items[i];
        tail.push_back(encode_object_field(item.first, *item.second, indent + 1, depth + 1));
    }

    std::vector<std::string> rest;
    for (auto& block : tail) {
        if (!block.empty()) rest.push_back(std::move(block));
    }
    return rest.empty() ? first_line : first_line + "\n" + join_lines(rest);
}

std::string Encoder::encode_value(const Value& v) const {
    WriteBuffer buf;

    if (v.is_primitive()) {
        buf.append(encode_primitive(v, DELIM_COMMA));
    } else if (v.kind == ValueKind::V_ARRAY) {
        EncodedArray enc = encode_array(v, 0, 0);
        buf.append(enc.header);
        if (enc.kind == ArrayLayout::INLINE) {
            buf.append(": ", 2);
            buf.append(enc.body);
        } else {
            buf.append(":\n", 2);
            buf.append(enc.body);
        }
    } else if (!v.object_items.empty()) {
        buf.append(encode_object(v, 0, 0));
    }

    return buf.finish();
}

std::string Encoder::encode(const HostValue& x) {
    NormalizeOptions nopts;
    nopts.mode = opts_.sanitize ? NormalizeMode::SANITIZE : NormalizeMode::STRICT;
    nopts.max_depth = opts_.max_depth;
    nopts.warn = opts_.warn;

    Normalizer normalizer(nopts);
    ValuePtr v = normalizer.normalize(x);
    warnings_ = normalizer.warnings();

    return encode_value(*v);
}

std::string encode(const HostValue& x, const EncodeOptions& opts) {
    Encoder encoder(opts);
    return encoder.encode(x);
}

} // namespace toonenc

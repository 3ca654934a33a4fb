#include "toon_buffer.hpp"
#include <cstring>

namespace toonenc {

WriteBuffer::WriteBuffer(size_t initial_capacity) {
    data_.reserve(initial_capacity);
}

void WriteBuffer::append(const char* data, size_t len) {
    data_.insert(data_.end(), data, data + len);
}

void WriteBuffer::append(const char* s) {
    append(s, std::strlen(s));
}

void WriteBuffer::append(const std::string& s) {
    append(s.data(), s.size());
}

void WriteBuffer::append(std::string_view sv) {
    append(sv.data(), sv.size());
}

void WriteBuffer::append_char(char c) {
    data_.push_back(c);
}

void WriteBuffer::append_quoted(std::string_view s) {
    append_char('"');
    for (char c : s) {
        switch (c) {
            case '"':  append("\\\"", 2); break;
            case '\\': append("\\\\", 2); break;
            case '\n': append("\\n", 2); break;
            case '\r': append("\\r", 2); break;
            case '\t': append("\\t", 2); break;
            default:
                // Other control characters are carried verbatim
                append_char(c);
                break;
        }
    }
    append_char('"');
}

std::string_view WriteBuffer::view() const {
    return std::string_view(data_.data(), data_.size());
}

std::string WriteBuffer::str() const {
    return std::string(data_.begin(), data_.end());
}

std::string WriteBuffer::finish() const {
    std::string out;
    out.reserve(data_.size() + 1);

    size_t line_start = 0;
    for (size_t i = 0; i <= data_.size(); i++) {
        if (i < data_.size() && data_[i] != '\n') continue;

        size_t line_end = i;
        while (line_end > line_start &&
               (data_[line_end - 1] == ' ' || data_[line_end - 1] == '\t')) {
            line_end--;
        }
        out.append(data_.data() + line_start, line_end - line_start);
        if (i < data_.size()) out.push_back('\n');
        line_start = i + 1;
    }

    out.push_back('\n');
    return out;
}

} // namespace toonenc

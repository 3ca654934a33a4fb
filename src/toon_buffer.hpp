#ifndef TOON_BUFFER_HPP
#define TOON_BUFFER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace toonenc {

// Append-only text buffer used to assemble encoded fragments
class WriteBuffer {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    WriteBuffer(size_t initial_capacity = DEFAULT_CAPACITY);

    void append(const char* data, size_t len);
    void append(const char* s);
    void append(const std::string& s);
    void append(std::string_view sv);
    void append_char(char c);

    // Append s wrapped in double quotes with TOON escapes applied
    void append_quoted(std::string_view s);

    // Get current content
    std::string_view view() const;
    std::string str() const;

    // Content with trailing spaces/tabs removed from every line and a
    // single newline appended
    std::string finish() const;

private:
    std::vector<char> data_;
};

} // namespace toonenc

#endif // TOON_BUFFER_HPP

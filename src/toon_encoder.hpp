#ifndef TOON_ENCODER_HPP
#define TOON_ENCODER_HPP

#include <string>
#include <vector>
#include "toon_errors.hpp"
#include "toon_host.hpp"
#include "toon_value.hpp"

namespace toonenc {

// Encoder options
struct EncodeOptions {
    bool sanitize = false;   // sanitize instead of strict normalization
    int indent = 2;          // spaces per indent level
    int max_depth = 1000;    // deepest nesting accepted before DepthExceededError
    bool warn = true;        // collect sanitize coercion warnings
};

// Array layouts, in selection priority order
enum class ArrayLayout {
    INLINE,     // [N]: a,b,c
    TABULAR,    // [N]{k1,k2}: one row per line
    LIST        // [N]: one "- " item per element
};

// A rendered array, before it is attached to a key or list dash
struct EncodedArray {
    ArrayLayout kind = ArrayLayout::INLINE;
    std::string header;
    std::string body;
    char delimiter = ',';
    std::vector<std::string> fields;   // tabular only
};

// Encoder class
class Encoder {
public:
    Encoder(const EncodeOptions& opts = EncodeOptions());

    // Normalize then encode; throws InvalidValueError / DepthExceededError
    std::string encode(const HostValue& x);

    // Encode an already canonical tree
    std::string encode_value(const Value& v) const;

    // Select and render the layout for an array whose items sit at indent + 1
    EncodedArray encode_array(const Value& arr, int indent, int depth = 0) const;

    // Sanitize coercions seen by the last encode()
    const std::vector<Warning>& warnings() const { return warnings_; }

private:
    std::string encode_object(const Value& obj, int indent, int depth) const;
    std::string encode_object_field(const std::string& key, const Value& v,
                                    int indent, int depth) const;
    std::string encode_list_item(const Value& v, int indent, int depth) const;

    // Helpers
    std::string indent_str(int level) const;
    std::string reindent_block(const std::string& block, int levels) const;
    void check_depth(int depth) const;

    EncodeOptions opts_;
    std::vector<Warning> warnings_;
};

// Convenience wrapper around Encoder
std::string encode(const HostValue& x, const EncodeOptions& opts = EncodeOptions());

} // namespace toonenc

#endif // TOON_ENCODER_HPP

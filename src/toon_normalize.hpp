#ifndef TOON_NORMALIZE_HPP
#define TOON_NORMALIZE_HPP

#include <string>
#include <vector>
#include <map>
#include "toon_errors.hpp"
#include "toon_host.hpp"
#include "toon_value.hpp"

namespace toonenc {

enum class NormalizeMode {
    STRICT,     // reject anything outside the JSON value space
    SANITIZE    // coerce instead of failing
};

// Normalizer options
struct NormalizeOptions {
    NormalizeMode mode = NormalizeMode::STRICT;
    int max_depth = 1000;
    bool warn = true;
};

// Converts host values into canonical value trees
class Normalizer {
public:
    Normalizer(const NormalizeOptions& opts = NormalizeOptions());

    // Throws InvalidValueError (strict only) or DepthExceededError
    ValuePtr normalize(const HostValue& v);

    // One aggregated warning per coercion type seen in the last call
    std::vector<Warning> warnings() const;

private:
    ValuePtr normalize_strict(const HostValue& v, int depth);
    ValuePtr normalize_sanitize(const HostValue& v, int depth);

    void check_depth(int depth);
    void note(const std::string& type);
    std::string current_path() const;

    NormalizeOptions opts_;
    std::vector<std::string> path_;
    std::map<std::string, size_t> coercions_;
};

// Convenience wrapper around Normalizer
ValuePtr normalize(const HostValue& v, NormalizeMode mode = NormalizeMode::STRICT);

} // namespace toonenc

#endif // TOON_NORMALIZE_HPP

#ifndef TOON_ERRORS_HPP
#define TOON_ERRORS_HPP

#include <string>
#include <stdexcept>
#include <cstddef>

namespace toonenc {

// Error types
enum class ErrorType {
    INVALID_VALUE,
    DEPTH_EXCEEDED
};

// Value outside the JSON value space (strict normalization only)
class InvalidValueError : public std::runtime_error {
public:
    InvalidValueError(const std::string& message,
                      const std::string& type_name = "",
                      const std::string& path = "")
        : std::runtime_error(message),
          type_name_(type_name),
          path_(path) {}

    ErrorType type() const { return ErrorType::INVALID_VALUE; }
    const std::string& type_name() const { return type_name_; }
    const std::string& path() const { return path_; }

    std::string formatted_message() const {
        std::string msg = what();
        if (!path_.empty()) {
            msg += "\n  Path: " + path_;
        }
        return msg;
    }

private:
    std::string type_name_;
    std::string path_;
};

// Nesting deeper than the configured maximum
class DepthExceededError : public std::runtime_error {
public:
    DepthExceededError(int max_depth, const std::string& path = "")
        : std::runtime_error("Maximum nesting depth (" + std::to_string(max_depth) + ") exceeded"),
          max_depth_(max_depth),
          path_(path) {}

    ErrorType type() const { return ErrorType::DEPTH_EXCEEDED; }
    int max_depth() const { return max_depth_; }
    const std::string& path() const { return path_; }

    std::string formatted_message() const {
        std::string msg = what();
        if (!path_.empty()) {
            msg += "\n  Path: " + path_;
        }
        return msg;
    }

private:
    int max_depth_;
    std::string path_;
};

// Warning information for aggregated warnings
struct Warning {
    std::string type;
    std::string message;

    Warning(const std::string& t, const std::string& m) : type(t), message(m) {}
};

} // namespace toonenc

#endif // TOON_ERRORS_HPP

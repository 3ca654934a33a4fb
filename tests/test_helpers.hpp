#ifndef TOONENC_TEST_HELPERS_HPP
#define TOONENC_TEST_HELPERS_HPP

#include <initializer_list>
#include <string>
#include <utility>
#include "toon_host.hpp"

namespace toonenc {
namespace test_util {

inline HostValuePtr null_() { return HostValue::make_null(); }
inline HostValuePtr boolean(bool b) { return HostValue::make_bool(b); }
inline HostValuePtr num(double n) { return HostValue::make_number(n); }
inline HostValuePtr str(const std::string& s) { return HostValue::make_string(s); }
inline HostValuePtr undefined() { return HostValue::make_undefined(); }

inline HostValuePtr arr(std::initializer_list<HostValuePtr> items) {
    return HostValue::make_array(std::vector<HostValuePtr>(items));
}

inline HostValuePtr obj(std::initializer_list<std::pair<std::string, HostValuePtr>> fields) {
    auto out = HostValue::make_object();
    for (const auto& f : fields) out->set(f.first, f.second);
    return out;
}

} // namespace test_util
} // namespace toonenc

#endif // TOONENC_TEST_HELPERS_HPP

#include <jsonmerge-cpp/value.hpp>

#include <cstddef>
#include <string>

namespace jsonmerge_cpp {

auto structurally_equal(const Json& a, const Json& b) -> bool {
    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (const auto& [key, value] : a.items()) {
            auto it = b.find(key);
            if (it == b.end() || !structurally_equal(value, *it)) return false;
        }
        return true;
    }
    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!structurally_equal(a[i], b[i])) return false;
        }
        return true;
    }
    return a == b;
}

}  // namespace jsonmerge_cpp

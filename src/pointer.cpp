#include <jsonmerge-cpp/pointer.hpp>

#include <jsonmerge-cpp/error.hpp>

#include <algorithm>

namespace jsonmerge_cpp {

auto unescape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (auto i = std::size_t{0}; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '1') {
                result.push_back('/');
                ++i;
                continue;
            }
            if (token[i + 1] == '0') {
                result.push_back('~');
                ++i;
                continue;
            }
        }
        result.push_back(token[i]);
    }
    return result;
}

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result.push_back(c);
        }
    }
    return result;
}

auto Pointer::parse(std::string_view pointer) -> Pointer {
    if (pointer.empty()) return Pointer{};
    if (pointer[0] != '/') {
        throw PatchError{ErrorKind::invalid_pointer,
                         "JSON Pointer must start with '/' or be empty: " + std::string{pointer}};
    }
    auto tokens = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = pointer.find('/', pos);
        tokens.push_back(unescape_token(pointer.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::parent() const -> Pointer {
    if (tokens_.empty()) return Pointer{};
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto Pointer::is_prefix_of(const Pointer& other) const -> bool {
    if (tokens_.size() >= other.tokens_.size()) return false;
    return std::equal(tokens_.begin(), tokens_.end(), other.tokens_.begin());
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result.push_back('/');
        result += escape_token(token);
    }
    return result;
}

}  // namespace jsonmerge_cpp

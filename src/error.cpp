#include <jsonmerge-cpp/error.hpp>

namespace jsonmerge_cpp {

namespace {

auto describe(const Error& err) -> std::string {
    auto text = std::string{to_string_view(err.kind)};
    text += ": ";
    text += err.message;
    return text;
}

auto describe(const Error& err, std::size_t op_index,
              const std::string& op, const std::string& path) -> std::string {
    auto text = "operation " + std::to_string(op_index) + " (" + op;
    if (!path.empty()) {
        text += " " + path;
    }
    text += "): ";
    text += describe(err);
    return text;
}

}  // anonymous namespace

PatchError::PatchError(Error err)
    : std::runtime_error{describe(err)},
      error_{std::move(err)} {}

PatchError::PatchError(Error err, std::size_t op_index, std::string op, std::string path)
    : std::runtime_error{describe(err, op_index, op, path)},
      error_{std::move(err)},
      op_index_{op_index},
      op_{std::move(op)},
      path_{std::move(path)} {}

}  // namespace jsonmerge_cpp

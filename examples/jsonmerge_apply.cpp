// jsonmerge-apply — apply a JSON Patch file to a JSON document file
//
// Usage: jsonmerge-apply DOC PATCH [--atomic] [--keep-source] [--indent N] [--verbose]
//
// Prints the patched document to stdout. With --verbose every applied or
// failed operation is reported on stderr. Exits 1 on a failed patch and
// 2 on bad arguments or unreadable files.
//
// Build: cmake --build build
// Run:   ./build/jsonmerge-apply doc.json patch.json --indent 2

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace jm = jsonmerge_cpp;

namespace {

struct Args {
    std::string doc_path;
    std::string patch_path;
    jm::ApplyOptions options;
    int indent{-1};
    bool verbose{false};
};

void usage() {
    std::fprintf(stderr,
                 "usage: jsonmerge-apply DOC PATCH [--atomic] [--keep-source] "
                 "[--indent N] [--verbose]\n");
}

auto parse_args(int argc, char** argv) -> std::optional<Args> {
    auto args = Args{};
    auto positional = 0;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--atomic") {
            args.options.atomic = true;
        } else if (arg == "--keep-source") {
            args.options.move_mode = jm::MoveMode::keep_source;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--indent") {
            if (i + 1 >= argc) return std::nullopt;
            args.indent = std::atoi(argv[++i]);
        } else if (positional == 0) {
            args.doc_path = arg;
            ++positional;
        } else if (positional == 1) {
            args.patch_path = arg;
            ++positional;
        } else {
            return std::nullopt;
        }
    }
    if (positional != 2) return std::nullopt;
    return args;
}

auto read_file(const std::string& path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    auto buf = std::ostringstream{};
    buf << in.rdbuf();
    return buf.str();
}

}  // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args) {
        usage();
        return 2;
    }

    auto doc_text = read_file(args->doc_path);
    auto patch_text = read_file(args->patch_path);
    if (!doc_text || !patch_text) {
        std::fprintf(stderr, "jsonmerge-apply: cannot read %s\n",
                     (!doc_text ? args->doc_path : args->patch_path).c_str());
        return 2;
    }

    if (args->verbose) {
        args->options.observer = [](const jm::OpEvent& ev) {
            std::fprintf(stderr, "[%s] op %zu %s %.*s%s%s\n",
                         std::string{jm::to_string_view(ev.severity)}.c_str(),
                         ev.index,
                         std::string{jm::to_string_view(ev.type)}.c_str(),
                         static_cast<int>(ev.path.size()), ev.path.data(),
                         ev.error ? ": " : "",
                         ev.error ? ev.error->message.c_str() : "");
        };
    }

    try {
        auto patch = jm::Patch::decode(*patch_text);
        if (doc_text->empty()) {
            return 0;
        }
        auto doc = jm::Json::parse(*doc_text);
        patch.apply(doc, args->options);
        std::printf("%s\n", doc.dump(args->indent).c_str());
    } catch (const jm::PatchError& e) {
        std::fprintf(stderr, "jsonmerge-apply: %s\n", e.what());
        return 1;
    } catch (const nlohmann::json::parse_error& e) {
        std::fprintf(stderr, "jsonmerge-apply: invalid document: %s\n", e.what());
        return 1;
    }
    return 0;
}

// Fuzz target for patch application — the input is a document and a patch
// separated by the first newline. Both move modes and atomic rollback run.

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view(reinterpret_cast<const char*>(data), size);
    const auto split = input.find('\n');
    if (split == std::string_view::npos) return 0;

    const auto doc_bytes = input.substr(0, split);
    const auto patch_bytes = input.substr(split + 1);

    try {
        auto patch = jsonmerge_cpp::Patch::decode(patch_bytes);
        auto doc = jsonmerge_cpp::Json::parse(doc_bytes, nullptr, false);
        if (doc.is_discarded()) return 0;

        auto options = jsonmerge_cpp::ApplyOptions{};
        options.atomic = true;
        const auto original = doc;
        try {
            patch.apply(doc, options);
        } catch (const jsonmerge_cpp::PatchError&) {
            // Atomic application must leave the document untouched
            if (doc != original) __builtin_trap();
        }

        options.atomic = false;
        options.move_mode = jsonmerge_cpp::MoveMode::keep_source;
        auto legacy = original;
        try {
            patch.apply(legacy, options);
        } catch (const jsonmerge_cpp::PatchError&) {
        }
    } catch (const jsonmerge_cpp::PatchError&) {
    }
    return 0;
}

#include <jsonmerge-cpp/engine.hpp>

#include <jsonmerge-cpp/container.hpp>
#include <jsonmerge-cpp/pointer.hpp>
#include <jsonmerge-cpp/resolver.hpp>

#include "batch_executor.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace jsonmerge_cpp {

// =============================================================================
// Operation handlers
// =============================================================================

namespace {

void apply_add(Json& doc, const Operation& op) {
    auto target = resolve(doc, Pointer::parse(op.path()));
    add(target.parent, target.key, op.value());
}

void apply_remove(Json& doc, const Operation& op) {
    auto target = resolve(doc, Pointer::parse(op.path()));
    remove(target.parent, target.key);
}

void apply_replace(Json& doc, const Operation& op) {
    auto path = Pointer::parse(op.path());
    const auto& value = op.value();

    if (path.empty()) {
        if (!is_container(value)) {
            throw PatchError{ErrorKind::precondition_failed,
                             "replace at the root needs an object or array, got " +
                                 std::string{value.type_name()}};
        }
        doc = value;
        return;
    }

    auto target = resolve(doc, path);
    // replace never creates
    if (!contains(target.parent, target.key)) {
        throw PatchError{ErrorKind::precondition_failed,
                         "replace target " + path.to_string() + " does not exist"};
    }
    set(target.parent, target.key, value);
}

void apply_move(Json& doc, const Operation& op, MoveMode mode) {
    auto from = Pointer::parse(op.from());
    auto path = Pointer::parse(op.path());

    if (mode == MoveMode::keep_source) {
        auto value = value_at(doc, from);
        auto dest = resolve(doc, path);
        add(dest.parent, dest.key, std::move(value));
        return;
    }

    if (from == path) {
        value_at(doc, from);
        return;
    }
    if (from.is_prefix_of(path)) {
        throw PatchError{ErrorKind::precondition_failed,
                         "cannot move " + from.to_string() + " into its own child " + path.to_string()};
    }

    auto source = resolve(doc, from);
    auto* source_obj = std::get_if<ObjectContainer>(&source.parent);
    auto member_pos = source_obj ? source_obj->position(source.key) : std::size_t{0};
    auto value = std::move(get(source.parent, source.key));
    remove(source.parent, source.key);

    // The destination is resolved after the removal, so array indices
    // are read against the shortened array. On failure the value goes
    // back where it was, including its place in member order.
    try {
        auto dest = resolve(doc, path);
        check_add(dest.parent, dest.key);
        add(dest.parent, dest.key, std::move(value));
    } catch (const PatchError&) {
        if (source_obj) {
            source_obj->insert(member_pos, source.key, std::move(value));
        } else {
            add(source.parent, source.key, std::move(value));
        }
        throw;
    }
}

void apply_test(Json& doc, const Operation& op) {
    auto path = Pointer::parse(op.path());
    const auto& expected = op.value();
    const auto& actual = value_at(doc, path);
    if (!structurally_equal(actual, expected)) {
        throw PatchError{ErrorKind::test_failed,
                         "value at " + path.to_string() + " is " + actual.dump() +
                             ", expected " + expected.dump()};
    }
}

void apply_copy(Json& doc, const Operation& op) {
    auto from = Pointer::parse(op.from());
    auto path = Pointer::parse(op.path());
    // Deep copy before the destination is touched: copying a value into
    // its own subtree must not see the insertion.
    auto value = Json(value_at(doc, from));
    auto dest = resolve(doc, path);
    add(dest.parent, dest.key, std::move(value));
}

void notify(const ApplyOptions& options, const OpEvent& event) {
    if (options.observer) options.observer(event);
}

// Copy of the document taken before an atomic apply. Unless committed,
// the copy is written back when the guard is restored or destroyed, so
// any exception leaving apply_patch() undoes the partial patch.
class Snapshot {
public:
    Snapshot(Json& doc, bool enabled) : doc_{doc} {
        if (enabled) saved_.emplace(doc);
    }
    ~Snapshot() { restore(); }

    Snapshot(const Snapshot&) = delete;
    auto operator=(const Snapshot&) -> Snapshot& = delete;

    void restore() noexcept {
        if (!saved_) return;
        doc_ = std::move(*saved_);
        saved_.reset();
    }

    void commit() noexcept { saved_.reset(); }

private:
    Json& doc_;
    std::optional<Json> saved_;
};

}  // anonymous namespace

void apply_operation(Json& doc, const Operation& op, MoveMode move_mode) {
    switch (op.type()) {
        case OpType::add:     apply_add(doc, op); return;
        case OpType::remove:  apply_remove(doc, op); return;
        case OpType::replace: apply_replace(doc, op); return;
        case OpType::move:    apply_move(doc, op, move_mode); return;
        case OpType::test:    apply_test(doc, op); return;
        case OpType::copy:    apply_copy(doc, op); return;
        case OpType::unknown: break;
    }
    throw PatchError{ErrorKind::unknown_operation, "unexpected operation kind: " + op.kind()};
}

// =============================================================================
// Patch application
// =============================================================================

void apply_patch(Json& doc, const Patch& patch, const ApplyOptions& options) {
    auto snapshot = Snapshot{doc, options.atomic};

    for (std::size_t i = 0; i < patch.size(); ++i) {
        const auto& op = patch[i];
        auto path = op.string_field("path").value_or("");
        try {
            apply_operation(doc, op, options.move_mode);
        } catch (const PatchError& e) {
            // The observer sees the document already rolled back
            snapshot.restore();
            auto failure = PatchError{e.error(), i, op.kind(), path};
            notify(options, OpEvent{Severity::error, i, op.type(), path, &failure.error()});
            throw failure;
        }
        notify(options, OpEvent{Severity::debug, i, op.type(), path});
    }
    snapshot.commit();
}

auto apply_patch_batch(std::span<Json> docs, const Patch& patch,
                       const ApplyOptions& options)
    -> std::vector<std::optional<Error>> {
    auto results = std::vector<std::optional<Error>>(docs.size());
    detail::for_each_document(docs.size(), [&](std::size_t i) {
        try {
            apply_patch(docs[i], patch, options);
        } catch (const PatchError& e) {
            results[i] = e.error();
        }
    });
    return results;
}

}  // namespace jsonmerge_cpp

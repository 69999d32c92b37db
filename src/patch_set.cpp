#include <jsonpatch-cpp/patch_set.hpp>
#include <jsonpatch-cpp/json.hpp>

#include <cmath>
#include <cstdint>
#include <utility>

namespace jsonpatch_cpp {

namespace {

// Integral floating-point values are emitted without a fraction ("1", not
// "1.0") when they fit in an int64.
void normalize_numbers(nlohmann::json& j) {
    if (j.is_number_float()) {
        const auto d = j.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
            j = static_cast<std::int64_t>(d);
        }
        return;
    }
    if (j.is_structured()) {
        for (auto& child : j) {
            normalize_numbers(child);
        }
    }
}

}  // anonymous namespace

auto new_test_condition(std::string path, nlohmann::json value) -> Operation {
    return Operation{OpKind::test, std::move(path), std::move(value)};
}

// =============================================================================
// Appending
// =============================================================================

void PatchSet::append_guarded(std::optional<Operation> condition, Operation op) {
    // The guard must come first: a processor applies ops in array order and
    // aborts the whole patch on the first failed test.
    if (condition) {
        operations_.push_back(std::move(*condition));
    }
    operations_.push_back(std::move(op));
}

auto PatchSet::with_test(std::string path, nlohmann::json value) -> PatchSet& {
    operations_.push_back(new_test_condition(std::move(path), std::move(value)));
    return *this;
}

auto PatchSet::with_remove(std::string path, std::optional<Operation> condition) -> PatchSet& {
    append_guarded(std::move(condition), Operation{OpKind::remove, std::move(path)});
    return *this;
}

auto PatchSet::with_add(std::string path, nlohmann::json value,
                        std::optional<Operation> condition) -> PatchSet& {
    append_guarded(std::move(condition),
                   Operation{OpKind::add, std::move(path), std::move(value)});
    return *this;
}

auto PatchSet::with_replace(std::string path, nlohmann::json value,
                            std::optional<Operation> condition) -> PatchSet& {
    append_guarded(std::move(condition),
                   Operation{OpKind::replace, std::move(path), std::move(value)});
    return *this;
}

auto PatchSet::with_operation(Operation op) -> PatchSet& {
    operations_.push_back(std::move(op));
    return *this;
}

auto PatchSet::extend(const PatchSet& other) -> PatchSet& {
    operations_.insert(operations_.end(),
                       other.operations_.begin(), other.operations_.end());
    return *this;
}

// =============================================================================
// Validation and serialization
// =============================================================================

auto PatchSet::validate(const ForbiddenPaths& forbidden) const
    -> std::vector<ForbiddenPathViolation> {
    auto violations = std::vector<ForbiddenPathViolation>{};
    for (std::size_t i = 0; i < operations_.size(); ++i) {
        const auto& op = operations_[i];
        if (op.kind == OpKind::test && forbidden.contains(op.path)) {
            violations.push_back(ForbiddenPathViolation{i, op.path});
        }
    }
    return violations;
}

auto PatchSet::marshal(const ForbiddenPaths& forbidden) const -> std::string {
    auto violations = validate(forbidden);
    if (!violations.empty()) {
        throw ForbiddenPathError{std::move(violations)};
    }

    // An empty patch means "do nothing" and is encoded as null, not [].
    if (operations_.empty()) {
        return nlohmann::json(nullptr).dump();
    }

    auto doc = nlohmann::json::array();
    for (const auto& op : operations_) {
        doc.push_back(nlohmann::json(op));
    }
    normalize_numbers(doc);
    // Invalid UTF-8 in a path or value is replaced with U+FFFD rather than
    // failing the encode.
    return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// =============================================================================
// Merging
// =============================================================================

auto merge(std::span<const PatchSet> sets) -> PatchSet {
    auto result = PatchSet{};
    for (const auto& set : sets) {
        result.extend(set);
    }
    return result;
}

}  // namespace jsonpatch_cpp

/// @file patch_set.hpp
/// @brief The PatchSet builder -- the primary API for jsonpatch-cpp.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/forbidden_paths.hpp>
#include <jsonpatch-cpp/operation.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace jsonpatch_cpp {

/// An ordered accumulator of JSON Patch operations.
///
/// PatchSet is a mutable builder: each `with_*` call appends to the set
/// and returns it, so calls can be chained. Operations are emitted in the
/// order they were appended, which is the order an RFC 6902 processor
/// applies them. Nothing is validated until marshal().
///
/// @code
/// auto patch = PatchSet{};
/// patch.with_test("/status/phase", "Running")
///      .with_remove("/status/foo", new_test_condition("/status/foo", "bar"));
/// auto body = patch.marshal();
/// @endcode
///
/// A PatchSet is not safe for concurrent mutation; build it on one thread.
class PatchSet {
public:
    /// Construct an empty patch (marshals to `null`).
    PatchSet() = default;

    // -- Appending ------------------------------------------------------------

    /// Append a `test` operation.
    auto with_test(std::string path, nlohmann::json value) -> PatchSet&;

    /// Append a `remove` operation, preceded by `condition` if given.
    ///
    /// The guard may test a different path from the one removed.
    /// @param path The location to remove.
    /// @param condition Typically built with new_test_condition().
    auto with_remove(std::string path,
                     std::optional<Operation> condition = std::nullopt) -> PatchSet&;

    /// Append an `add` operation, preceded by `condition` if given.
    auto with_add(std::string path, nlohmann::json value,
                  std::optional<Operation> condition = std::nullopt) -> PatchSet&;

    /// Append a `replace` operation, preceded by `condition` if given.
    auto with_replace(std::string path, nlohmann::json value,
                      std::optional<Operation> condition = std::nullopt) -> PatchSet&;

    /// Append a pre-built operation as-is.
    auto with_operation(Operation op) -> PatchSet&;

    /// Append every operation of `other`, in order. `other` is unchanged.
    auto extend(const PatchSet& other) -> PatchSet&;

    // -- Reading --------------------------------------------------------------

    /// True if no operations have been appended.
    auto is_empty() const -> bool { return operations_.empty(); }

    auto size() const -> std::size_t { return operations_.size(); }

    auto operations() const -> const std::vector<Operation>& { return operations_; }

    // -- Validation and serialization -----------------------------------------

    /// Find every `test` operation whose path is in `forbidden`.
    /// @return The violations in ascending index order; empty if none.
    auto validate(const ForbiddenPaths& forbidden = default_forbidden_paths()) const
        -> std::vector<ForbiddenPathViolation>;

    /// Serialize to an RFC 6902 JSON document.
    ///
    /// An empty patch serializes to `null`. Otherwise the result is an
    /// array of `{"op","path"[,"value"]}` objects in append order.
    /// @throws ForbiddenPathError listing every violation, if any `test`
    ///   operation targets a path in `forbidden`.
    auto marshal(const ForbiddenPaths& forbidden = default_forbidden_paths()) const
        -> std::string;

    auto operator==(const PatchSet&) const -> bool = default;

private:
    void append_guarded(std::optional<Operation> condition, Operation op);

    std::vector<Operation> operations_;
};

// -- Merging ------------------------------------------------------------------

/// Concatenate patch sets in order into a new PatchSet.
///
/// Empty inputs contribute nothing. No deduplication, reordering or
/// validation is done; call marshal() on the result.
auto merge(std::span<const PatchSet> sets) -> PatchSet;

/// Variadic form of merge(). `merge()` with no arguments yields an empty set.
template <typename... Sets>
    requires (std::same_as<std::remove_cvref_t<Sets>, PatchSet> && ...)
auto merge(const Sets&... sets) -> PatchSet {
    auto result = PatchSet{};
    (result.extend(sets), ...);
    return result;
}

}  // namespace jsonpatch_cpp

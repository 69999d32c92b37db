/// @file operation.hpp
/// @brief A single RFC 6902 JSON Patch operation.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// The kind of step a patch operation performs.
enum class OpKind : std::uint8_t {
    test,     ///< Assert that a path holds a value.
    remove,   ///< Remove the value at a path.
    add,      ///< Add a value at a path.
    replace,  ///< Replace the value at a path.
};

/// Convert an OpKind to its RFC 6902 `op` name.
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::test:    return "test";
        case OpKind::remove:  return "remove";
        case OpKind::add:     return "add";
        case OpKind::replace: return "replace";
    }
    return "unknown";
}

/// Parse an RFC 6902 `op` name. Returns nullopt for names this library
/// does not build.
constexpr auto parse_op_kind(std::string_view name) noexcept -> std::optional<OpKind> {
    if (name == "test")    return OpKind::test;
    if (name == "remove")  return OpKind::remove;
    if (name == "add")     return OpKind::add;
    if (name == "replace") return OpKind::replace;
    return std::nullopt;
}

/// One step of a JSON Patch document.
///
/// Operations are plain values: once built they are never edited, and two
/// operations compare equal when kind, path and value all match. The path
/// is an RFC 6901 JSON Pointer and is not checked here.
struct Operation {
    OpKind kind;                           ///< What the step does.
    std::string path;                      ///< Target location (JSON Pointer).
    std::optional<nlohmann::json> value{}; ///< Payload; absent for `remove`.

    auto operator==(const Operation&) const -> bool = default;
};

/// Build a `test` operation without attaching it to a PatchSet.
///
/// Used to construct the guard passed to PatchSet::with_remove() and
/// friends. No validation happens here; forbidden paths are rejected
/// only when the patch is marshalled.
/// @code
/// auto patch = PatchSet{};
/// patch.with_remove("/status/foo", new_test_condition("/status/condition", "bar"));
/// @endcode
auto new_test_condition(std::string path, nlohmann::json value) -> Operation;

}  // namespace jsonpatch_cpp

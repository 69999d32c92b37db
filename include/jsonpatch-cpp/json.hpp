/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonpatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) so operations,
/// violations and forbidden-path configuration can be exchanged as JSON.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/forbidden_paths.hpp>
#include <jsonpatch-cpp/operation.hpp>

#include <nlohmann/json.hpp>

namespace jsonpatch_cpp {

// -- OpKind (RFC 6902 op name) ------------------------------------------------

void to_json(nlohmann::json& j, OpKind kind);
void from_json(const nlohmann::json& j, OpKind& kind);

// -- Operation ({"op","path"[,"value"]}) --------------------------------------

void to_json(nlohmann::json& j, const Operation& op);

/// @throws std::runtime_error on an unknown `op`, or when a `test`, `add`
///   or `replace` entry has no `value`.
void from_json(const nlohmann::json& j, Operation& op);

// -- Violations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const ForbiddenPathViolation& v);

// -- Configuration (array of JSON Pointer strings) ----------------------------

void to_json(nlohmann::json& j, const ForbiddenPaths& paths);

/// @throws std::runtime_error if `j` is not an array of strings, or if an
///   entry is not a JSON Pointer (must be empty or start with '/').
void from_json(const nlohmann::json& j, ForbiddenPaths& paths);

}  // namespace jsonpatch_cpp

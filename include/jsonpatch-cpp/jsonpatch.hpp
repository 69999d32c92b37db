/// @file jsonpatch.hpp
/// @brief Umbrella header for the jsonpatch-cpp library.
///
/// Include this single header for access to all public types:
/// PatchSet, Operation, ForbiddenPaths, ForbiddenPathError and the
/// nlohmann/json interop functions.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/forbidden_paths.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch_set.hpp>

/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace jsonpatch_cpp {

/// A `test` operation that targets a forbidden path.
struct ForbiddenPathViolation {
    std::size_t index;  ///< Zero-based position of the operation in the patch.
    std::string path;   ///< The offending JSON Pointer.

    auto operator==(const ForbiddenPathViolation&) const -> bool = default;
};

/// Render a single violation as a human-readable message.
auto to_string(const ForbiddenPathViolation& violation) -> std::string;

/// Render a list of violations.
///
/// A single violation renders as its own message; several render as a
/// bracketed, comma-separated list in the given order.
auto format_violations(std::span<const ForbiddenPathViolation> violations) -> std::string;

/// Thrown by PatchSet::marshal() when one or more `test` operations
/// target a forbidden path. Carries every violation found, in index order.
class ForbiddenPathError : public std::runtime_error {
public:
    explicit ForbiddenPathError(std::vector<ForbiddenPathViolation> violations);

    /// The violations, in ascending index order.
    auto violations() const -> const std::vector<ForbiddenPathViolation>& {
        return violations_;
    }

private:
    std::vector<ForbiddenPathViolation> violations_;
};

}  // namespace jsonpatch_cpp

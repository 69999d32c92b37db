/// @file forbidden_paths.hpp
/// @brief The set of JSON Pointers a `test` operation may never target.

#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The resource version token. Testing it client-side would bypass the
/// server's optimistic concurrency check.
inline constexpr std::string_view resource_version_path = "/metadata/resourceVersion";

/// An immutable set of forbidden JSON Pointers.
///
/// Passed to PatchSet::marshal() and PatchSet::validate(). Most callers
/// use default_forbidden_paths(); tests and specialised resources can
/// supply their own.
class ForbiddenPaths {
public:
    /// An empty set: nothing is forbidden.
    ForbiddenPaths() = default;

    ForbiddenPaths(std::initializer_list<std::string> paths);

    explicit ForbiddenPaths(const std::vector<std::string>& paths);

    /// True if `path` is forbidden. Comparison is exact.
    auto contains(std::string_view path) const -> bool;

    auto size() const -> std::size_t { return paths_.size(); }
    auto empty() const -> bool { return paths_.empty(); }

    /// The forbidden paths in lexicographic order.
    auto paths() const -> std::vector<std::string>;

    auto operator==(const ForbiddenPaths&) const -> bool = default;

private:
    std::set<std::string, std::less<>> paths_;
};

/// The process-wide default: { resource_version_path }.
/// Initialised on first use and never modified.
auto default_forbidden_paths() -> const ForbiddenPaths&;

}  // namespace jsonpatch_cpp

#include <jsonpatch-cpp/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

namespace {

auto carries_value(OpKind kind) -> bool {
    return kind == OpKind::test || kind == OpKind::add || kind == OpKind::replace;
}

auto is_json_pointer(const std::string& path) -> bool {
    return path.empty() || path.front() == '/';
}

}  // anonymous namespace

// =============================================================================
// OpKind
// =============================================================================

void to_json(nlohmann::json& j, OpKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, OpKind& kind) {
    auto name = j.get<std::string>();
    auto parsed = parse_op_kind(name);
    if (!parsed) {
        throw std::runtime_error{"unsupported JSON Patch operation: " + name};
    }
    kind = *parsed;
}

// =============================================================================
// Operation
// =============================================================================

// Keys are stored sorted, which yields the canonical "op", "path", "value"
// order on output.
void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{{"op", op.kind}, {"path", op.path}};
    if (op.value) {
        j["value"] = *op.value;
    }
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_object()) {
        throw std::runtime_error{"JSON Patch operation must be an object"};
    }
    auto kind = j.at("op").get<OpKind>();
    auto path = j.at("path").get<std::string>();
    auto value = std::optional<nlohmann::json>{};
    if (auto it = j.find("value"); it != j.end()) {
        value = *it;
    } else if (carries_value(kind)) {
        throw std::runtime_error{std::string{to_string_view(kind)} +
                                 ": operation requires a value"};
    }
    op = Operation{kind, std::move(path), std::move(value)};
}

// =============================================================================
// Violations
// =============================================================================

void to_json(nlohmann::json& j, const ForbiddenPathViolation& v) {
    j = nlohmann::json{{"index", v.index}, {"path", v.path}};
}

// =============================================================================
// ForbiddenPaths
// =============================================================================

void to_json(nlohmann::json& j, const ForbiddenPaths& paths) {
    j = paths.paths();
}

void from_json(const nlohmann::json& j, ForbiddenPaths& paths) {
    if (!j.is_array()) {
        throw std::runtime_error{"forbidden paths must be a JSON array"};
    }
    auto entries = std::vector<std::string>{};
    entries.reserve(j.size());
    for (const auto& entry : j) {
        if (!entry.is_string()) {
            throw std::runtime_error{"forbidden path must be a string"};
        }
        auto path = entry.get<std::string>();
        if (!is_json_pointer(path)) {
            throw std::runtime_error{"forbidden path is not a JSON Pointer: " + path};
        }
        entries.push_back(std::move(path));
    }
    paths = ForbiddenPaths{entries};
}

}  // namespace jsonpatch_cpp

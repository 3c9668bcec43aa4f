#include "diff/diff_options.hpp"
#include "common/errors.hpp"

#include <limits>

namespace grafdiff {

namespace {

void readBool(const Value& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) {
        throw ValidationError(std::string("option '") + key + "' must be a boolean");
    }
    out = it->get<bool>();
}

template <typename Int>
void readUnsigned(const Value& j, const char* key, Int& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw ValidationError(std::string("option '") + key +
                              "' must be a non-negative integer");
    }
    const auto raw = static_cast<unsigned long long>(it->get<long long>());
    if (raw > static_cast<unsigned long long>(std::numeric_limits<Int>::max())) {
        throw ValidationError(std::string("option '") + key + "' is out of range");
    }
    out = static_cast<Int>(raw);
}

} // namespace

DiffOptions DiffOptions::fromJson(const Value& j) {
    if (!j.is_object()) throw ValidationError("diff options must be a JSON object");

    DiffOptions options;
    readBool(j, "ignoreMetadata", options.ignore_metadata);
    readBool(j, "ignoreTimestamps", options.ignore_timestamps);
    readBool(j, "semanticDiff", options.semantic_diff);
    readBool(j, "includeConflictResolution", options.include_conflict_resolution);
    readBool(j, "registerDiff", options.register_diff);
    readUnsigned(j, "contextWindow", options.context_window);
    readUnsigned(j, "maxDepth", options.max_depth);
    if (options.max_depth == 0) {
        throw ValidationError("option 'maxDepth' must be at least 1");
    }
    return options;
}

} // namespace grafdiff

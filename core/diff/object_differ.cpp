#include "diff/object_differ.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <array>
#include <exception>

namespace grafdiff {

namespace {

const std::array<const char*, 4> kMetadataFields = {
    "metadata", "createdAt", "updatedAt", "version"};
const std::array<const char*, 4> kTimestampFields = {
    "timestamp", "createdAt", "updatedAt", "lastModified"};

template <size_t N>
bool contains(const std::array<const char*, N>& set, const std::string& key) {
    for (const char* k : set) {
        if (key == k) return true;
    }
    return false;
}

} // namespace

bool ObjectDiffer::isMetadataField(const std::string& key) {
    return contains(kMetadataFields, key);
}

bool ObjectDiffer::isTimestampField(const std::string& key) {
    return contains(kTimestampFields, key);
}

std::vector<LeafDifference> ObjectDiffer::diff(const Value& source, const Value& target,
                                               const PropertyPath& base_path) {
    std::vector<LeafDifference> out;
    PropertyPath path = base_path;
    diffValue(source, target, path, 0, out);
    return out;
}

void ObjectDiffer::diffValue(const Value& source, const Value& target,
                             PropertyPath& path, size_t depth,
                             std::vector<LeafDifference>& out) {
    if (depth > options_.max_depth) {
        throw DepthLimitError("value nesting exceeds depth limit " +
                              std::to_string(options_.max_depth) + " at '" +
                              joinPath(path, '.') + "'");
    }

    if (!options_.custom_comparators.empty()) {
        if (auto equal = customVerdict(source, target, path)) {
            if (!*equal) out.push_back({path, source, target});
            return;
        }
    }

    const ValueKind kind = kindOf(source);
    if (kind != kindOf(target)) {
        out.push_back({path, source, target});
        return;
    }

    switch (kind) {
        case ValueKind::Array:
            if (source.size() != target.size()) {
                out.push_back({path, source, target});
                return;
            }
            for (size_t i = 0; i < source.size(); i++) {
                path.push_back(std::to_string(i));
                diffValue(source[i], target[i], path, depth + 1, out);
                path.pop_back();
            }
            return;
        case ValueKind::Object:
            diffObject(source, target, path, depth, out);
            return;
        default:
            if (source != target) out.push_back({path, source, target});
            return;
    }
}

void ObjectDiffer::diffObject(const Value& source, const Value& target,
                              PropertyPath& path, size_t depth,
                              std::vector<LeafDifference>& out) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string& key = it.key();
        if (skipKey(key)) continue;

        path.push_back(key);
        auto match = target.find(key);
        if (match == target.end()) {
            out.push_back({path, it.value(), std::nullopt});
        } else {
            diffValue(it.value(), *match, path, depth + 1, out);
        }
        path.pop_back();
    }

    // Keys only present in the target
    for (auto it = target.begin(); it != target.end(); ++it) {
        const std::string& key = it.key();
        if (skipKey(key) || source.contains(key)) continue;

        path.push_back(key);
        out.push_back({path, std::nullopt, it.value()});
        path.pop_back();
    }
}

bool ObjectDiffer::skipKey(const std::string& key) const {
    if (options_.ignore_metadata && isMetadataField(key)) return true;
    if (options_.ignore_timestamps && isTimestampField(key)) return true;
    return false;
}

std::optional<bool> ObjectDiffer::customVerdict(const Value& source, const Value& target,
                                                const PropertyPath& path) {
    const auto& comparators = options_.custom_comparators;
    const std::string dotted = joinPath(path, '.');

    auto it = comparators.find(dotted);
    if (it == comparators.end()) {
        const ValueKind kind = kindOf(source);
        if (kind != kindOf(target)) return std::nullopt;
        it = comparators.find(kindName(kind));
        if (it == comparators.end()) return std::nullopt;
    }
    if (!it->second) return std::nullopt;

    try {
        return it->second(source, target);
    } catch (const std::exception& e) {
        comparator_failures_++;
        logger()->warn("custom comparator '{}' failed at '{}': {}; using default comparison",
                       it->first, dotted, e.what());
        return std::nullopt;
    }
}

} // namespace grafdiff

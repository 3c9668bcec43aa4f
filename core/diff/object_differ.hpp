#pragma once

#include "diff/diff_options.hpp"
#include "graph/value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace grafdiff {

/// One leaf-level difference. A missing side is std::nullopt.
struct LeafDifference {
    PropertyPath path;
    OptionalValue old_value;
    OptionalValue new_value;
};

// ─── ObjectDiffer ──────────────────────────────────────────────
// Recursive structural comparison of two JSON values of unknown shape.
//
//   - kind mismatch (null vs non-null included) → one leaf at the path
//   - arrays of different length → one leaf at the array path
//   - arrays of equal length → recurse per index
//   - objects → recurse over the union of keys; a key on one side only
//     yields a leaf with the other side absent
//
// Custom comparators that throw are logged, counted, and skipped.
// Nesting deeper than options.max_depth throws DepthLimitError.

class ObjectDiffer {
public:
    explicit ObjectDiffer(const DiffOptions& options) : options_(options) {}

    std::vector<LeafDifference> diff(const Value& source, const Value& target,
                                     const PropertyPath& base_path = {});

    /// Number of custom comparator invocations that threw.
    size_t comparatorFailures() const { return comparator_failures_; }

    static bool isMetadataField(const std::string& key);
    static bool isTimestampField(const std::string& key);

private:
    void diffValue(const Value& source, const Value& target,
                   PropertyPath& path, size_t depth,
                   std::vector<LeafDifference>& out);
    void diffObject(const Value& source, const Value& target,
                    PropertyPath& path, size_t depth,
                    std::vector<LeafDifference>& out);
    bool skipKey(const std::string& key) const;

    /// Verdict of a matching custom comparator: true = equal.
    /// std::nullopt when no comparator applies or the comparator threw.
    std::optional<bool> customVerdict(const Value& source, const Value& target,
                                      const PropertyPath& path);

    const DiffOptions& options_;
    size_t comparator_failures_ = 0;
};

} // namespace grafdiff

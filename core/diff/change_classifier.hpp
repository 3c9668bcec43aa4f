#pragma once

#include "diff/change.hpp"
#include "diff/diff_options.hpp"
#include "graph/snapshot.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace grafdiff {

/// A caller-registered classification rule. When `predicate` holds for a
/// change, the rule's category and/or impact override the built-in result.
struct ClassificationRule {
    std::string name;
    std::function<bool(const Change&)> predicate;
    std::optional<ChangeCategory> category;
    std::optional<ChangeImpact> impact;
};

// ─── ChangeClassifier ──────────────────────────────────────────
// Assigns semantic category and impact to detected changes.
//
// Built-in rules (semantic_diff only):
//   - edge changes: breaking if an edge removal lowers connectivity
//     (|E| / max(1, |N|)), compatible otherwise
//   - any path through "type" or "behavior": behavioral + breaking
//   - breaking changes receive migration hints
// Registered rules run after the built-ins, in registration order.
// Rules must be registered before the classifier is shared across threads.

class ChangeClassifier {
public:
    /// Impact of a data-leaf difference.
    static ChangeImpact dataImpact(const OptionalValue& old_value,
                                   const OptionalValue& new_value);

    /// Advisory migrations for a breaking change.
    static std::vector<Migration> generateMigrations(const Change& change);

    void addRule(ClassificationRule rule);
    size_t ruleCount() const { return rules_.size(); }

    /// Enrich `changes` in place.
    void classify(std::vector<Change>& changes,
                  const GraphSnapshot& source, const GraphSnapshot& target,
                  const DiffOptions& options) const;

    /// Number of rule predicates that threw.
    size_t ruleFailures() const { return rule_failures_.load(); }

private:
    void applyRules(Change& change) const;

    std::vector<ClassificationRule> rules_;
    mutable std::atomic<size_t> rule_failures_{0};
};

} // namespace grafdiff

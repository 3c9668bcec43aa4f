#pragma once

#include "common/id_generator.hpp"
#include "diff/change.hpp"
#include "graph/snapshot.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace grafdiff {

enum class ConflictType { NodeConflict, EdgeConflict, StructuralConflict };

enum class ConflictSeverity { Low, Medium, High, Critical };

enum class ResolutionStrategy { KeepSource, KeepTarget, Merge, Manual, AutoResolve };

NLOHMANN_JSON_SERIALIZE_ENUM(ConflictType, {
    {ConflictType::NodeConflict, "node_conflict"},
    {ConflictType::EdgeConflict, "edge_conflict"},
    {ConflictType::StructuralConflict, "structural_conflict"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ConflictSeverity, {
    {ConflictSeverity::Low, "low"},
    {ConflictSeverity::Medium, "medium"},
    {ConflictSeverity::High, "high"},
    {ConflictSeverity::Critical, "critical"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ResolutionStrategy, {
    {ResolutionStrategy::KeepSource, "keep_source"},
    {ResolutionStrategy::KeepTarget, "keep_target"},
    {ResolutionStrategy::Merge, "merge"},
    {ResolutionStrategy::Manual, "manual"},
    {ResolutionStrategy::AutoResolve, "auto_resolve"},
})

/// One candidate resolution. Offered, never applied by the library.
struct ConflictResolution {
    ResolutionStrategy strategy = ResolutionStrategy::Manual;
    std::string description;
    double confidence = 0.0;  // [0, 1]
    std::optional<GraphEntity> result;
};

struct Conflict {
    std::string id;
    ConflictType type = ConflictType::StructuralConflict;
    std::string description;
    std::vector<std::string> entities;
    ConflictSeverity severity = ConflictSeverity::Medium;
    std::vector<ConflictResolution> resolution_strategies;
};

void to_json(Value& j, const ConflictResolution& resolution);
void to_json(Value& j, const Conflict& conflict);

// ─── TypeTransitionPolicy ──────────────────────────────────────
// The set of forbidden (old type → new type) transitions. Defaults:
// component→function, class→interface, sync→async.

class TypeTransitionPolicy {
public:
    static TypeTransitionPolicy defaults();

    void forbid(const std::string& from, const std::string& to);
    bool allow(const std::string& from, const std::string& to);
    bool isForbidden(const std::string& from, const std::string& to) const;

    size_t size() const { return forbidden_.size(); }
    void clear() { forbidden_.clear(); }

private:
    std::set<std::pair<std::string, std::string>> forbidden_;
};

// ─── ConflictDetector ──────────────────────────────────────────
// Scans a change set (plus the two snapshots it came from) for
// structural inconsistencies:
//   - orphaned edges: edges whose endpoint is a removed node
//   - incompatible type transitions, per TypeTransitionPolicy
//   - malformed input: duplicate ids, edges pointing at unknown nodes

class ConflictDetector {
public:
    ConflictDetector(TypeTransitionPolicy policy, IdGenerator& ids)
        : policy_(std::move(policy)), ids_(ids) {}

    std::vector<Conflict> detect(const std::vector<Change>& changes,
                                 const GraphSnapshot& source,
                                 const GraphSnapshot& target) const;

    /// Ids of edges that reference a node removed by `changes`, in
    /// first-seen order without repeats.
    std::vector<std::string> findOrphanedEdges(const std::vector<Change>& changes,
                                               const GraphSnapshot& target) const;

    std::vector<Conflict> detectTypeConflicts(const std::vector<Change>& changes) const;

    std::vector<Conflict> detectMalformedInput(const GraphSnapshot& source,
                                               const GraphSnapshot& target,
                                               const std::vector<std::string>& orphaned) const;

    TypeTransitionPolicy& policy() { return policy_; }
    const TypeTransitionPolicy& policy() const { return policy_; }

private:
    TypeTransitionPolicy policy_;
    IdGenerator& ids_;
};

} // namespace grafdiff

#include "diff/conflict_detector.hpp"

#include <unordered_set>

namespace grafdiff {

namespace {

ConflictResolution resolution(ResolutionStrategy strategy, std::string description,
                              double confidence,
                              std::optional<GraphEntity> result = std::nullopt) {
    ConflictResolution r;
    r.strategy = strategy;
    r.description = std::move(description);
    r.confidence = confidence;
    r.result = std::move(result);
    return r;
}

class OrderedIdSet {
public:
    void add(const std::string& id) {
        if (seen_.insert(id).second) ids_.push_back(id);
    }
    bool contains(const std::string& id) const { return seen_.count(id) > 0; }
    std::vector<std::string> release() { return std::move(ids_); }

private:
    std::unordered_set<std::string> seen_;
    std::vector<std::string> ids_;
};

} // namespace

// ─── TypeTransitionPolicy ──────────────────────────────────────

TypeTransitionPolicy TypeTransitionPolicy::defaults() {
    TypeTransitionPolicy policy;
    policy.forbid("component", "function");
    policy.forbid("class", "interface");
    policy.forbid("sync", "async");
    return policy;
}

void TypeTransitionPolicy::forbid(const std::string& from, const std::string& to) {
    forbidden_.emplace(from, to);
}

bool TypeTransitionPolicy::allow(const std::string& from, const std::string& to) {
    return forbidden_.erase({from, to}) > 0;
}

bool TypeTransitionPolicy::isForbidden(const std::string& from, const std::string& to) const {
    return forbidden_.count({from, to}) > 0;
}

// ─── ConflictDetector ──────────────────────────────────────────

std::vector<Conflict> ConflictDetector::detect(const std::vector<Change>& changes,
                                               const GraphSnapshot& source,
                                               const GraphSnapshot& target) const {
    std::vector<Conflict> conflicts;

    auto orphaned = findOrphanedEdges(changes, target);
    if (!orphaned.empty()) {
        Conflict c;
        c.id = ids_.next("conflict");
        c.type = ConflictType::StructuralConflict;
        c.description = "Edges referring to removed nodes";
        c.entities = orphaned;
        c.severity = ConflictSeverity::High;
        c.resolution_strategies = {
            resolution(ResolutionStrategy::AutoResolve, "Automatically remove orphaned edges", 0.9),
            resolution(ResolutionStrategy::Manual, "Manually review and resolve", 1.0),
        };
        conflicts.push_back(std::move(c));
    }

    auto type_conflicts = detectTypeConflicts(changes);
    conflicts.insert(conflicts.end(), std::make_move_iterator(type_conflicts.begin()),
                     std::make_move_iterator(type_conflicts.end()));

    auto malformed = detectMalformedInput(source, target, orphaned);
    conflicts.insert(conflicts.end(), std::make_move_iterator(malformed.begin()),
                     std::make_move_iterator(malformed.end()));

    return conflicts;
}

std::vector<std::string> ConflictDetector::findOrphanedEdges(
    const std::vector<Change>& changes, const GraphSnapshot& target) const {
    std::unordered_set<std::string> removed_nodes;
    for (const auto& change : changes) {
        if (change.type() == ChangeType::NodeRemoved) removed_nodes.insert(change.entityId());
    }
    if (removed_nodes.empty()) return {};

    auto references_removed = [&](const Edge& edge) {
        return removed_nodes.count(edge.source) > 0 || removed_nodes.count(edge.target) > 0;
    };

    OrderedIdSet orphaned;
    for (const auto& change : changes) {
        if (change.type() != ChangeType::EdgeAdded && change.type() != ChangeType::EdgeModified) {
            continue;
        }
        const Edge* edge = change.afterEdge();
        if (edge && references_removed(*edge)) orphaned.add(change.entityId());
    }

    // Edges carried over unchanged still point at the removed node
    target.forEachEdge([&](const Edge& edge) {
        if (references_removed(edge)) orphaned.add(edge.id);
    });

    return orphaned.release();
}

std::vector<Conflict> ConflictDetector::detectTypeConflicts(
    const std::vector<Change>& changes) const {
    std::vector<Conflict> conflicts;

    for (const auto& change : changes) {
        if (!change.isModification() || !change.pathIncludes("type")) continue;

        const Value* old_type = change.oldValue();
        const Value* new_type = change.newValue();
        if (!old_type || !new_type || !old_type->is_string() || !new_type->is_string()) {
            continue;
        }
        const auto from = old_type->get<std::string>();
        const auto to = new_type->get<std::string>();
        if (!policy_.isForbidden(from, to)) continue;

        Conflict c;
        c.id = ids_.next("conflict");
        c.type = change.entity() == EntityKind::Node ? ConflictType::NodeConflict
                                                     : ConflictType::EdgeConflict;
        c.description = "Incompatible type change from " + from + " to " + to;
        c.entities = {change.entityId()};
        c.severity = ConflictSeverity::High;
        c.resolution_strategies = {
            resolution(ResolutionStrategy::KeepSource, "Keep original type", 0.5, change.before()),
            resolution(ResolutionStrategy::KeepTarget, "Accept new type", 0.5, change.after()),
            resolution(ResolutionStrategy::Manual, "Manual review required", 1.0),
        };
        conflicts.push_back(std::move(c));
    }

    return conflicts;
}

std::vector<Conflict> ConflictDetector::detectMalformedInput(
    const GraphSnapshot& source, const GraphSnapshot& target,
    const std::vector<std::string>& orphaned) const {
    std::vector<Conflict> conflicts;

    auto report_duplicates = [&](const std::vector<std::string>& ids, const char* kind,
                                 const char* side) {
        if (ids.empty()) return;
        Conflict c;
        c.id = ids_.next("conflict");
        c.type = ConflictType::StructuralConflict;
        c.description = std::string("Duplicate ") + kind + " ids in " + side + " snapshot";
        c.entities = ids;
        c.severity = ConflictSeverity::Critical;
        c.resolution_strategies = {
            resolution(ResolutionStrategy::Manual, "Deduplicate entity ids in the analyzer output",
                       1.0),
        };
        conflicts.push_back(std::move(c));
    };
    report_duplicates(source.duplicateNodeIds(), "node", "source");
    report_duplicates(source.duplicateEdgeIds(), "edge", "source");
    report_duplicates(target.duplicateNodeIds(), "node", "target");
    report_duplicates(target.duplicateEdgeIds(), "edge", "target");

    const std::unordered_set<std::string> already_orphaned(orphaned.begin(), orphaned.end());
    std::vector<std::string> dangling;
    target.forEachEdge([&](const Edge& edge) {
        if (already_orphaned.count(edge.id)) return;
        if (!target.hasNode(edge.source) || !target.hasNode(edge.target)) {
            dangling.push_back(edge.id);
        }
    });
    if (!dangling.empty()) {
        Conflict c;
        c.id = ids_.next("conflict");
        c.type = ConflictType::StructuralConflict;
        c.description = "Edges referring to nodes missing from the target snapshot";
        c.entities = std::move(dangling);
        c.severity = ConflictSeverity::Medium;
        c.resolution_strategies = {
            resolution(ResolutionStrategy::AutoResolve, "Automatically remove dangling edges", 0.9),
            resolution(ResolutionStrategy::Manual, "Manually review and resolve", 1.0),
        };
        conflicts.push_back(std::move(c));
    }

    return conflicts;
}

// ─── JSON ──────────────────────────────────────────────────────

void to_json(Value& j, const ConflictResolution& r) {
    j = Value{{"strategy", r.strategy},
              {"description", r.description},
              {"confidence", r.confidence}};
    if (r.result) {
        j["result"] = std::visit([](const auto& e) { return Value(e); }, *r.result);
    }
}

void to_json(Value& j, const Conflict& c) {
    j = Value{{"id", c.id},
              {"type", c.type},
              {"description", c.description},
              {"entities", c.entities},
              {"severity", c.severity},
              {"resolutionStrategies", c.resolution_strategies}};
}

} // namespace grafdiff

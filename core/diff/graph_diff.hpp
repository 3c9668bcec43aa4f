#pragma once

#include "common/clock.hpp"
#include "diff/change.hpp"
#include "diff/conflict_detector.hpp"
#include "diff/diff_statistics.hpp"

#include <string>
#include <vector>

namespace grafdiff {

/// Result of comparing two snapshots. Built once per comparison and
/// never mutated afterwards; a new comparison yields a new GraphDiff.
struct GraphDiff {
    std::string id;
    std::string source_version;
    std::string target_version;
    Timestamp timestamp;
    std::vector<Change> changes;
    DiffStatistics statistics;
    std::vector<Conflict> conflicts;
};

/// Per-change summary consumed by visualization layers.
struct DiffHighlight {
    std::string entity_id;
    EntityKind entity_type = EntityKind::Node;
    ChangeType change_type = ChangeType::NodeAdded;
    ChangeImpact impact = ChangeImpact::Compatible;
    std::string description;
};

/// Short label such as "Modified node: x (data.label)".
std::string describeChange(const Change& change);

std::vector<DiffHighlight> buildHighlights(const GraphDiff& diff);

void to_json(Value& j, const DiffHighlight& highlight);
/// Timestamps are written as milliseconds since the Unix epoch.
void to_json(Value& j, const GraphDiff& diff);

} // namespace grafdiff

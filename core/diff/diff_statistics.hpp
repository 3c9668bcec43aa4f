#pragma once

#include "diff/change.hpp"
#include "graph/snapshot.hpp"

#include <vector>

namespace grafdiff {

struct DiffStatistics {
    int nodes_added = 0;
    int nodes_removed = 0;
    int nodes_modified = 0;
    int edges_added = 0;
    int edges_removed = 0;
    int edges_modified = 0;
    int total_changes = 0;
    double similarity = 1.0;  // [0, 1], 1 = identical
    double complexity = 0.0;  // [0, 1], share of structural or breaking changes
};

void to_json(Value& j, const DiffStatistics& stats);

/// Aggregates a change set against the sizes of the two snapshots.
///   unionSize  = max(|N_s| + |E_s|, |N_t| + |E_t|)
///   similarity = 1 - distinct changed entity ids / unionSize
///   complexity = (structural or breaking changes) / unionSize
class DiffStatisticsCalculator {
public:
    static DiffStatistics compute(const std::vector<Change>& changes,
                                  const GraphSnapshot& source,
                                  const GraphSnapshot& target);
};

} // namespace grafdiff

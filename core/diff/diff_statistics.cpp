#include "diff/diff_statistics.hpp"

#include <algorithm>
#include <unordered_set>

namespace grafdiff {

DiffStatistics DiffStatisticsCalculator::compute(const std::vector<Change>& changes,
                                                 const GraphSnapshot& source,
                                                 const GraphSnapshot& target) {
    DiffStatistics stats;
    stats.total_changes = static_cast<int>(changes.size());

    std::unordered_set<std::string> changed_entities;
    int weighty = 0;

    for (const auto& change : changes) {
        switch (change.type()) {
            case ChangeType::NodeAdded:    stats.nodes_added++; break;
            case ChangeType::NodeRemoved:  stats.nodes_removed++; break;
            case ChangeType::NodeModified: stats.nodes_modified++; break;
            case ChangeType::EdgeAdded:    stats.edges_added++; break;
            case ChangeType::EdgeRemoved:  stats.edges_removed++; break;
            case ChangeType::EdgeModified: stats.edges_modified++; break;
        }
        changed_entities.insert(change.entityId());
        if (change.semantic.category == ChangeCategory::Structural ||
            change.semantic.impact == ChangeImpact::Breaking) {
            weighty++;
        }
    }

    const size_t source_size = source.nodeCount() + source.edgeCount();
    const size_t target_size = target.nodeCount() + target.edgeCount();
    const double union_size = static_cast<double>(std::max(source_size, target_size));

    if (union_size > 0) {
        // A single entity may carry several changes; keep both ratios in [0, 1].
        stats.similarity = std::clamp(1.0 - changed_entities.size() / union_size, 0.0, 1.0);
        stats.complexity = std::clamp(weighty / union_size, 0.0, 1.0);
    } else {
        stats.similarity = 1.0;
        stats.complexity = 0.0;
    }
    return stats;
}

void to_json(Value& j, const DiffStatistics& s) {
    j = Value{{"nodesAdded", s.nodes_added},
              {"nodesRemoved", s.nodes_removed},
              {"nodesModified", s.nodes_modified},
              {"edgesAdded", s.edges_added},
              {"edgesRemoved", s.edges_removed},
              {"edgesModified", s.edges_modified},
              {"totalChanges", s.total_changes},
              {"similarity", s.similarity},
              {"complexity", s.complexity}};
}

} // namespace grafdiff

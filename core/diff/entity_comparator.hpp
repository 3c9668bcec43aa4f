#pragma once

#include "common/id_generator.hpp"
#include "diff/change.hpp"
#include "diff/diff_options.hpp"
#include "diff/object_differ.hpp"
#include "graph/snapshot.hpp"

#include <vector>

namespace grafdiff {

/// Compares two snapshots entity by entity and emits raw changes.
/// Order: node additions (target order), node removals and node
/// modifications (source order), then the same three groups for edges.
class EntityComparator {
public:
    EntityComparator(const DiffOptions& options, IdGenerator& ids)
        : options_(options), ids_(ids), differ_(options) {}

    std::vector<Change> compare(const GraphSnapshot& source, const GraphSnapshot& target);

    void compareNodes(const GraphSnapshot& source, const GraphSnapshot& target,
                      std::vector<Change>& out);
    void compareEdges(const GraphSnapshot& source, const GraphSnapshot& target,
                      std::vector<Change>& out);

    /// Type and data differences of one node present in both snapshots.
    std::vector<Change> compareNodeProperties(const Node& source, const Node& target);

    /// Type, connection and data differences of one edge present in both snapshots.
    std::vector<Change> compareEdgeProperties(const Edge& source, const Edge& target);

    size_t comparatorFailures() const { return differ_.comparatorFailures(); }

private:
    const DiffOptions& options_;
    IdGenerator& ids_;
    ObjectDiffer differ_;
};

} // namespace grafdiff

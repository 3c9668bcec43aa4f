#include "diff/entity_comparator.hpp"
#include "diff/change_classifier.hpp"

namespace grafdiff {

namespace {

SemanticChange semantic(ChangeCategory category, ChangeImpact impact,
                        std::string description,
                        std::vector<std::string> affected = {}) {
    SemanticChange s;
    s.category = category;
    s.impact = impact;
    s.description = std::move(description);
    s.affected_relations = std::move(affected);
    return s;
}

Value connectionOf(const Edge& edge) {
    return Value{{"source", edge.source}, {"target", edge.target}};
}

} // namespace

std::vector<Change> EntityComparator::compare(const GraphSnapshot& source,
                                              const GraphSnapshot& target) {
    std::vector<Change> changes;
    compareNodes(source, target, changes);
    compareEdges(source, target, changes);
    return changes;
}

// ─── Nodes ─────────────────────────────────────────────────────

void EntityComparator::compareNodes(const GraphSnapshot& source, const GraphSnapshot& target,
                                    std::vector<Change>& out) {
    target.forEachNode([&](const Node& node) {
        if (source.hasNode(node.id)) return;
        out.push_back({ids_.next("change"), NodeAdded{node},
                       semantic(ChangeCategory::Structural, ChangeImpact::Enhancement,
                                "Added node " + node.id + " of type " + node.type)});
    });

    source.forEachNode([&](const Node& node) {
        if (target.hasNode(node.id)) return;
        out.push_back({ids_.next("change"), NodeRemoved{node},
                       semantic(ChangeCategory::Structural, ChangeImpact::Breaking,
                                "Removed node " + node.id + " of type " + node.type)});
    });

    source.forEachNode([&](const Node& node) {
        const Node* other = target.getNode(node.id);
        if (!other) return;
        auto modified = compareNodeProperties(node, *other);
        out.insert(out.end(), std::make_move_iterator(modified.begin()),
                   std::make_move_iterator(modified.end()));
    });
}

std::vector<Change> EntityComparator::compareNodeProperties(const Node& source,
                                                            const Node& target) {
    std::vector<Change> changes;

    if (source.type != target.type) {
        changes.push_back({ids_.next("change"),
                           NodeModified{source, target, {"type"}, Value(source.type),
                                        Value(target.type)},
                           semantic(ChangeCategory::Behavioral, ChangeImpact::Breaking,
                                    "Changed node type from " + source.type + " to " +
                                        target.type)});
    }

    for (auto& leaf : differ_.diff(source.data, target.data, {"data"})) {
        ChangeImpact impact = ChangeClassifier::dataImpact(leaf.old_value, leaf.new_value);
        std::string description = "Modified node data: " + joinPath(leaf.path, '.');
        changes.push_back({ids_.next("change"),
                           NodeModified{source, target, std::move(leaf.path),
                                        std::move(leaf.old_value), std::move(leaf.new_value)},
                           semantic(ChangeCategory::Data, impact, std::move(description))});
    }

    return changes;
}

// ─── Edges ─────────────────────────────────────────────────────

void EntityComparator::compareEdges(const GraphSnapshot& source, const GraphSnapshot& target,
                                    std::vector<Change>& out) {
    target.forEachEdge([&](const Edge& edge) {
        if (source.hasEdge(edge.id)) return;
        out.push_back({ids_.next("change"), EdgeAdded{edge},
                       semantic(ChangeCategory::Structural, ChangeImpact::Enhancement,
                                "Added edge " + edge.id + " from " + edge.source + " to " +
                                    edge.target,
                                {edge.source, edge.target})});
    });

    source.forEachEdge([&](const Edge& edge) {
        if (target.hasEdge(edge.id)) return;
        out.push_back({ids_.next("change"), EdgeRemoved{edge},
                       semantic(ChangeCategory::Structural, ChangeImpact::Breaking,
                                "Removed edge " + edge.id + " from " + edge.source + " to " +
                                    edge.target,
                                {edge.source, edge.target})});
    });

    source.forEachEdge([&](const Edge& edge) {
        const Edge* other = target.getEdge(edge.id);
        if (!other) return;
        auto modified = compareEdgeProperties(edge, *other);
        out.insert(out.end(), std::make_move_iterator(modified.begin()),
                   std::make_move_iterator(modified.end()));
    });
}

std::vector<Change> EntityComparator::compareEdgeProperties(const Edge& source,
                                                            const Edge& target) {
    std::vector<Change> changes;

    if (source.type != target.type) {
        changes.push_back({ids_.next("change"),
                           EdgeModified{source, target, {"type"}, Value(source.type),
                                        Value(target.type)},
                           semantic(ChangeCategory::Behavioral, ChangeImpact::Breaking,
                                    "Changed edge type from " + source.type + " to " +
                                        target.type,
                                    {source.source, source.target})});
    }

    if (source.source != target.source || source.target != target.target) {
        changes.push_back({ids_.next("change"),
                           EdgeModified{source, target, {"connection"}, connectionOf(source),
                                        connectionOf(target)},
                           semantic(ChangeCategory::Structural, ChangeImpact::Breaking,
                                    "Changed edge connection from " + source.source + "->" +
                                        source.target + " to " + target.source + "->" +
                                        target.target,
                                    {source.source, source.target, target.source,
                                     target.target})});
    }

    for (auto& leaf : differ_.diff(source.data, target.data, {"data"})) {
        ChangeImpact impact = ChangeClassifier::dataImpact(leaf.old_value, leaf.new_value);
        std::string description = "Modified edge data: " + joinPath(leaf.path, '.');
        changes.push_back({ids_.next("change"),
                           EdgeModified{source, target, std::move(leaf.path),
                                        std::move(leaf.old_value), std::move(leaf.new_value)},
                           semantic(ChangeCategory::Data, impact, std::move(description),
                                    {source.source, source.target})});
    }

    return changes;
}

} // namespace grafdiff

#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace grafdiff {

// ─── GraphSnapshot ─────────────────────────────────────────────
// One point-in-time state of a structural graph. Arena layout:
// entities live in ordered vectors, lookups go through id → position
// indexes. Nodes and edges refer to each other by id only.
//
// Ids are expected to be unique. A duplicate id is kept in the list
// (so conflict detection can report it) and the last occurrence is
// the one visible through lookups and iteration.

class GraphSnapshot {
public:
    GraphSnapshot() = default;
    GraphSnapshot(std::vector<Node> nodes, std::vector<Edge> edges);

    // ── Node operations ──
    void addNode(Node node);
    bool removeNode(const std::string& id);
    bool replaceNode(const Node& node);
    Node* getNode(const std::string& id);
    const Node* getNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return node_index_.count(id) > 0; }
    size_t nodeCount() const { return node_index_.size(); }

    // ── Edge operations ──
    void addEdge(Edge edge);
    bool removeEdge(const std::string& id);
    bool replaceEdge(const Edge& edge);
    Edge* getEdge(const std::string& id);
    const Edge* getEdge(const std::string& id) const;
    bool hasEdge(const std::string& id) const { return edge_index_.count(id) > 0; }
    size_t edgeCount() const { return edge_index_.size(); }

    // ── Raw storage, including shadowed duplicates ──
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    /// Ids that occur more than once, in first-seen order.
    std::vector<std::string> duplicateNodeIds() const;
    std::vector<std::string> duplicateEdgeIds() const;

    /// Edges per node: |E| / max(1, |N|).
    double connectivity() const;

    // ── Iteration over visible entities, in list order ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    void reindexNodes();
    void reindexEdges();

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, size_t> node_index_;
    std::unordered_map<std::string, size_t> edge_index_;
};

void to_json(Value& j, const GraphSnapshot& snapshot);
void from_json(const Value& j, GraphSnapshot& snapshot);

} // namespace grafdiff

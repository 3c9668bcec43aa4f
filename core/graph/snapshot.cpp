#include "graph/snapshot.hpp"
#include "common/errors.hpp"

#include <algorithm>

namespace grafdiff {

namespace {

template <typename Entity>
std::vector<std::string> duplicateIds(const std::vector<Entity>& entities) {
    std::unordered_map<std::string, int> seen;
    std::vector<std::string> dups;
    for (const auto& e : entities) {
        if (++seen[e.id] == 2) dups.push_back(e.id);
    }
    return dups;
}

template <typename Entity>
void rebuildIndex(const std::vector<Entity>& entities,
                  std::unordered_map<std::string, size_t>& index) {
    index.clear();
    for (size_t i = 0; i < entities.size(); i++) {
        index[entities[i].id] = i;
    }
}

template <typename Entity>
bool removeById(std::vector<Entity>& entities, const std::string& id) {
    auto it = std::remove_if(entities.begin(), entities.end(),
                             [&](const Entity& e) { return e.id == id; });
    if (it == entities.end()) return false;
    entities.erase(it, entities.end());
    return true;
}

} // namespace

GraphSnapshot::GraphSnapshot(std::vector<Node> nodes, std::vector<Edge> edges)
    : nodes_(std::move(nodes)), edges_(std::move(edges)) {
    reindexNodes();
    reindexEdges();
}

// ─── Node operations ───────────────────────────────────────────

void GraphSnapshot::addNode(Node node) {
    node_index_[node.id] = nodes_.size();
    nodes_.push_back(std::move(node));
}

bool GraphSnapshot::removeNode(const std::string& id) {
    if (!removeById(nodes_, id)) return false;
    reindexNodes();
    return true;
}

bool GraphSnapshot::replaceNode(const Node& node) {
    Node* existing = getNode(node.id);
    if (!existing) return false;
    *existing = node;
    return true;
}

Node* GraphSnapshot::getNode(const std::string& id) {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

const Node* GraphSnapshot::getNode(const std::string& id) const {
    auto it = node_index_.find(id);
    return it != node_index_.end() ? &nodes_[it->second] : nullptr;
}

// ─── Edge operations ───────────────────────────────────────────

void GraphSnapshot::addEdge(Edge edge) {
    edge_index_[edge.id] = edges_.size();
    edges_.push_back(std::move(edge));
}

bool GraphSnapshot::removeEdge(const std::string& id) {
    if (!removeById(edges_, id)) return false;
    reindexEdges();
    return true;
}

bool GraphSnapshot::replaceEdge(const Edge& edge) {
    Edge* existing = getEdge(edge.id);
    if (!existing) return false;
    *existing = edge;
    return true;
}

Edge* GraphSnapshot::getEdge(const std::string& id) {
    auto it = edge_index_.find(id);
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

const Edge* GraphSnapshot::getEdge(const std::string& id) const {
    auto it = edge_index_.find(id);
    return it != edge_index_.end() ? &edges_[it->second] : nullptr;
}

// ─── Queries ───────────────────────────────────────────────────

std::vector<std::string> GraphSnapshot::duplicateNodeIds() const {
    return duplicateIds(nodes_);
}

std::vector<std::string> GraphSnapshot::duplicateEdgeIds() const {
    return duplicateIds(edges_);
}

double GraphSnapshot::connectivity() const {
    return static_cast<double>(edgeCount()) /
           static_cast<double>(std::max<size_t>(1, nodeCount()));
}

// ─── Iteration ─────────────────────────────────────────────────

void GraphSnapshot::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (size_t i = 0; i < nodes_.size(); i++) {
        if (node_index_.at(nodes_[i].id) == i) fn(nodes_[i]);
    }
}

void GraphSnapshot::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (size_t i = 0; i < edges_.size(); i++) {
        if (edge_index_.at(edges_[i].id) == i) fn(edges_[i]);
    }
}

void GraphSnapshot::reindexNodes() { rebuildIndex(nodes_, node_index_); }
void GraphSnapshot::reindexEdges() { rebuildIndex(edges_, edge_index_); }

// ─── JSON ──────────────────────────────────────────────────────

void to_json(Value& j, const GraphSnapshot& snapshot) {
    j = Value{{"nodes", snapshot.nodes()}, {"edges", snapshot.edges()}};
}

void from_json(const Value& j, GraphSnapshot& snapshot) {
    if (!j.is_object()) throw ValidationError("snapshot must be a JSON object");
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    if (auto it = j.find("nodes"); it != j.end()) {
        if (!it->is_array()) throw ValidationError("snapshot 'nodes' must be an array");
        nodes = it->get<std::vector<Node>>();
    }
    if (auto it = j.find("edges"); it != j.end()) {
        if (!it->is_array()) throw ValidationError("snapshot 'edges' must be an array");
        edges = it->get<std::vector<Edge>>();
    }
    snapshot = GraphSnapshot(std::move(nodes), std::move(edges));
}

} // namespace grafdiff

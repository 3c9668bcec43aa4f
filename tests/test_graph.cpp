#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "graph/snapshot.hpp"
#include "graph/value.hpp"

using namespace grafdiff;

// ─── Node/Edge CRUD ────────────────────────────────────────────

TEST(SnapshotTest, AddAndGetNode) {
    GraphSnapshot g;
    g.addNode(Node("n1", "component"));
    ASSERT_EQ(g.nodeCount(), 1u);
    const Node* n = g.getNode("n1");
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->type, "component");
    EXPECT_TRUE(n->data.is_object());
    EXPECT_EQ(g.getNode("missing"), nullptr);
}

TEST(SnapshotTest, NodeData) {
    Node n("n1", "function");
    n.setData("label", "render");
    EXPECT_TRUE(n.hasData("label"));
    EXPECT_FALSE(n.hasData("nonexistent"));
    EXPECT_EQ(n.data["label"], "render");
}

TEST(SnapshotTest, RemoveNode) {
    GraphSnapshot g;
    g.addNode(Node("n1", "test"));
    g.addNode(Node("n2", "test"));
    ASSERT_TRUE(g.removeNode("n1"));
    EXPECT_EQ(g.nodeCount(), 1u);
    EXPECT_EQ(g.getNode("n1"), nullptr);
    ASSERT_NE(g.getNode("n2"), nullptr);
    EXPECT_FALSE(g.removeNode("n1"));  // already removed
}

TEST(SnapshotTest, AddAndGetEdge) {
    GraphSnapshot g({Node("a", "x"), Node("b", "x")}, {});
    g.addEdge(Edge("e1", "a", "b", "calls"));
    ASSERT_EQ(g.edgeCount(), 1u);
    const Edge* e = g.getEdge("e1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->source, "a");
    EXPECT_EQ(e->target, "b");
    EXPECT_EQ(e->type, "calls");
}

TEST(SnapshotTest, ReplaceEdge) {
    GraphSnapshot g({}, {Edge("e1", "a", "b", "calls")});
    EXPECT_TRUE(g.replaceEdge(Edge("e1", "a", "c", "calls")));
    EXPECT_EQ(g.getEdge("e1")->target, "c");
    EXPECT_FALSE(g.replaceEdge(Edge("e2", "a", "c", "calls")));
    ASSERT_TRUE(g.removeEdge("e1"));
    EXPECT_EQ(g.edgeCount(), 0u);
}

// ─── Duplicate ids ─────────────────────────────────────────────

TEST(SnapshotTest, DuplicateIdsLastOccurrenceWins) {
    GraphSnapshot g({Node("n1", "first"), Node("n2", "x"), Node("n1", "second")}, {});
    EXPECT_EQ(g.nodeCount(), 2u);
    EXPECT_EQ(g.nodes().size(), 3u);
    EXPECT_EQ(g.getNode("n1")->type, "second");

    auto dups = g.duplicateNodeIds();
    ASSERT_EQ(dups.size(), 1u);
    EXPECT_EQ(dups[0], "n1");
    EXPECT_TRUE(g.duplicateEdgeIds().empty());

    std::vector<std::string> visited;
    g.forEachNode([&](const Node& n) { visited.push_back(n.type); });
    ASSERT_EQ(visited.size(), 2u);
    EXPECT_EQ(visited[0], "x");
    EXPECT_EQ(visited[1], "second");
}

TEST(SnapshotTest, Connectivity) {
    GraphSnapshot empty;
    EXPECT_DOUBLE_EQ(empty.connectivity(), 0.0);

    GraphSnapshot g({Node("a", "x"), Node("b", "x")},
                    {Edge("e1", "a", "b", "r"), Edge("e2", "b", "a", "r"),
                     Edge("e3", "a", "a", "r")});
    EXPECT_DOUBLE_EQ(g.connectivity(), 1.5);
}

// ─── JSON ──────────────────────────────────────────────────────

TEST(SnapshotTest, JsonRoundTrip) {
    GraphSnapshot g({Node("a", "component", {{"label", "A"}})},
                    {Edge("e1", "a", "a", "self", {{"weight", 2}})});
    Value j = g;
    EXPECT_EQ(j["nodes"][0]["id"], "a");
    EXPECT_EQ(j["edges"][0]["source"], "a");

    auto back = j.get<GraphSnapshot>();
    ASSERT_EQ(back.nodeCount(), 1u);
    EXPECT_EQ(*back.getNode("a"), *g.getNode("a"));
    EXPECT_EQ(*back.getEdge("e1"), *g.getEdge("e1"));
}

TEST(SnapshotTest, JsonDefaultsAndValidation) {
    auto g = Value::parse(R"({"nodes": [{"id": "a"}], "edges": []})").get<GraphSnapshot>();
    ASSERT_NE(g.getNode("a"), nullptr);
    EXPECT_EQ(g.getNode("a")->type, "");
    EXPECT_TRUE(g.getNode("a")->data.is_object());

    EXPECT_THROW(Value::parse(R"({"nodes": [{"type": "x"}]})").get<GraphSnapshot>(),
                 ValidationError);
    EXPECT_THROW(Value::parse(R"({"edges": [{"id": "e", "source": "a"}]})").get<GraphSnapshot>(),
                 ValidationError);
    EXPECT_THROW(Value::parse(R"({"nodes": {}})").get<GraphSnapshot>(), ValidationError);
}

// ─── Value helpers ─────────────────────────────────────────────

TEST(ValueTest, KindNames) {
    EXPECT_STREQ(kindName(kindOf(Value())), "null");
    EXPECT_STREQ(kindName(kindOf(Value(true))), "boolean");
    EXPECT_STREQ(kindName(kindOf(Value(1))), "number");
    EXPECT_STREQ(kindName(kindOf(Value(1.5))), "number");
    EXPECT_STREQ(kindName(kindOf(Value("s"))), "string");
    EXPECT_STREQ(kindName(kindOf(Value::array())), "array");
    EXPECT_STREQ(kindName(kindOf(Value::object())), "object");
}

TEST(ValueTest, PathHelpers) {
    PropertyPath p = {"data", "position", "x"};
    EXPECT_EQ(joinPath(p, '.'), "data.position.x");
    EXPECT_TRUE(pathContains(p, "position"));
    EXPECT_FALSE(pathContains(p, "pos"));
}

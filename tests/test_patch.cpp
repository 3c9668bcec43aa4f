#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "common/id_generator.hpp"
#include "diff/entity_comparator.hpp"
#include "patch/patch.hpp"
#include "patch/patch_applier.hpp"
#include "patch/patch_compiler.hpp"
#include "patch/patch_path.hpp"

using namespace grafdiff;

namespace {

PatchOperation makeOp(PatchOp op, std::string path, OptionalValue value = std::nullopt) {
    PatchOperation o;
    o.op = op;
    o.path = std::move(path);
    o.value = std::move(value);
    return o;
}

GraphPatch makePatch(std::vector<PatchOperation> ops) {
    GraphPatch p;
    p.id = "patch_test";
    p.operations = std::move(ops);
    p.checksum = computeChecksum(p.operations);
    return p;
}

GraphDiff diffOf(const GraphSnapshot& a, const GraphSnapshot& b, IdGenerator& ids) {
    DiffOptions options;
    EntityComparator comparator(options, ids);
    GraphDiff diff;
    diff.id = "diff_test";
    diff.source_version = "v1";
    diff.target_version = "v2";
    diff.changes = comparator.compare(a, b);
    return diff;
}

} // namespace

// ─── Paths ─────────────────────────────────────────────────────

TEST(PatchPathTest, FormatAndParse) {
    EXPECT_EQ(formatPatchPath(EntityKind::Node, "n1"), "/nodes/n1");
    EXPECT_EQ(formatPatchPath(EntityKind::Edge, "e1", {"data", "weight"}),
              "/edges/e1/data/weight");

    auto p = parsePatchPath("/edges/e1/data/weight");
    EXPECT_EQ(p.kind, EntityKind::Edge);
    EXPECT_EQ(p.id, "e1");
    EXPECT_EQ(p.property, (PropertyPath{"data", "weight"}));
    EXPECT_FALSE(p.isEntity());
    EXPECT_TRUE(parsePatchPath("/nodes/n1").isEntity());
}

TEST(PatchPathTest, EscapedSegments) {
    const std::string path = formatPatchPath(EntityKind::Node, "src/app~1.ts");
    EXPECT_EQ(path, "/nodes/src~1app~01.ts");
    EXPECT_EQ(parsePatchPath(path).id, "src/app~1.ts");
}

TEST(PatchPathTest, EmptyIdSegment) {
    EXPECT_EQ(formatPatchPath(EntityKind::Node, ""), "/nodes/");
    auto p = parsePatchPath("/nodes/");
    EXPECT_EQ(p.kind, EntityKind::Node);
    EXPECT_EQ(p.id, "");
    EXPECT_TRUE(p.isEntity());
    EXPECT_EQ(parsePatchPath("/edges//data/w").property, (PropertyPath{"data", "w"}));
}

TEST(PatchPathTest, RejectsMalformedPaths) {
    EXPECT_THROW(parsePatchPath(""), ValidationError);
    EXPECT_THROW(parsePatchPath("nodes/n1"), ValidationError);
    EXPECT_THROW(parsePatchPath("/nodes"), ValidationError);
    EXPECT_THROW(parsePatchPath("/vertices/n1"), ValidationError);
    EXPECT_THROW(parsePatchPath("/nodes/bad~2"), ValidationError);
}

// ─── Checksum ──────────────────────────────────────────────────

TEST(ChecksumTest, StableAndOrderSensitive) {
    std::vector<PatchOperation> ops = {
        makeOp(PatchOp::Add, "/nodes/a", Value{{"id", "a"}, {"type", "x"}}),
        makeOp(PatchOp::Remove, "/nodes/b"),
    };
    const std::string first = computeChecksum(ops);
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(first, computeChecksum(ops));

    std::vector<PatchOperation> swapped = {ops[1], ops[0]};
    EXPECT_NE(first, computeChecksum(swapped));

    GraphPatch patch = makePatch(ops);
    EXPECT_TRUE(verifyChecksum(patch));
    patch.operations[1].path = "/nodes/c";
    EXPECT_FALSE(verifyChecksum(patch));
}

TEST(ChecksumTest, InvalidUtf8StringsAreHashed) {
    std::vector<PatchOperation> ops = {
        makeOp(PatchOp::Replace, "/nodes/n/data/blob", Value("\xff\xfe")),
    };
    const std::string sum = computeChecksum(ops);
    EXPECT_EQ(sum.size(), 64u);
    ops[0].value = Value("\xff\xfd");
    EXPECT_NE(sum, computeChecksum(ops));
}

// ─── Compiler ──────────────────────────────────────────────────

TEST(CompilerTest, OperationsFollowChangeOrder) {
    GraphSnapshot a({Node("keep", "x", {{"k", 1}, {"gone", true}}), Node("old", "x")}, {});
    GraphSnapshot b({Node("keep", "x", {{"k", 2}}), Node("new", "y")}, {});

    IdGenerator ids;
    auto diff = diffOf(a, b, ids);
    PatchCompiler compiler(ids, "tester");
    GraphPatch patch = compiler.compile(diff);

    ASSERT_EQ(patch.operations.size(), 4u);
    EXPECT_EQ(patch.operations[0].op, PatchOp::Add);
    EXPECT_EQ(patch.operations[0].path, "/nodes/new");
    EXPECT_EQ((*patch.operations[0].value)["type"], "y");
    EXPECT_EQ(patch.operations[1].op, PatchOp::Remove);
    EXPECT_EQ(patch.operations[1].path, "/nodes/old");
    // Data keys are visited in sorted order
    EXPECT_EQ(patch.operations[2].op, PatchOp::Remove);
    EXPECT_EQ(patch.operations[2].path, "/nodes/keep/data/gone");
    EXPECT_FALSE(patch.operations[2].value.has_value());
    EXPECT_EQ(patch.operations[3].op, PatchOp::Replace);
    EXPECT_EQ(patch.operations[3].path, "/nodes/keep/data/k");
    EXPECT_EQ(*patch.operations[3].value, 2);

    EXPECT_EQ(patch.id.rfind("patch_", 0), 0u);
    EXPECT_EQ(patch.source_version, "v1");
    EXPECT_EQ(patch.target_version, "v2");
    EXPECT_EQ(patch.metadata.created_by, "tester");
    EXPECT_EQ(patch.metadata.description, "Patch from v1 to v2");
    EXPECT_TRUE(verifyChecksum(patch));
    EXPECT_TRUE(patch.skipped_changes.empty());
}

TEST(CompilerTest, PathlessModificationIsSkipped) {
    Change c;
    c.id = "change_x";
    c.detail = NodeModified{Node("n", "t"), Node("n", "t"), {}, std::nullopt, std::nullopt};

    std::vector<std::string> skipped;
    auto ops = PatchCompiler::compileChanges({c}, &skipped);
    EXPECT_TRUE(ops.empty());
    EXPECT_EQ(skipped, std::vector<std::string>{"change_x"});
}

// ─── Applier ───────────────────────────────────────────────────

TEST(ApplierTest, RoundTripReachesTarget) {
    GraphSnapshot a({Node("a", "component", {{"label", "A"}, {"pos", {{"x", 1}}}}),
                     Node("b", "function"), Node("c", "hook")},
                    {Edge("e1", "a", "b", "calls", {{"weight", 1}}),
                     Edge("e2", "b", "c", "uses")});
    GraphSnapshot b({Node("a", "class", {{"label", "A2"}, {"pos", {{"x", 1}, {"y", 2}}}}),
                     Node("b", "function", {{"async", true}}), Node("d", "hook")},
                    {Edge("e1", "a", "d", "imports"), Edge("e3", "a", "b", "calls")});

    IdGenerator ids;
    auto diff = diffOf(a, b, ids);
    GraphPatch patch = PatchCompiler(ids, "system").compile(diff);
    GraphSnapshot result = PatchApplier().apply(a, patch);

    ASSERT_EQ(result.nodeCount(), b.nodeCount());
    ASSERT_EQ(result.edgeCount(), b.edgeCount());
    b.forEachNode([&](const Node& n) {
        const Node* got = result.getNode(n.id);
        ASSERT_NE(got, nullptr) << n.id;
        EXPECT_EQ(*got, n) << n.id;
    });
    b.forEachEdge([&](const Edge& e) {
        const Edge* got = result.getEdge(e.id);
        ASSERT_NE(got, nullptr) << e.id;
        EXPECT_EQ(*got, e) << e.id;
    });

    // The input snapshot is untouched
    EXPECT_EQ(a.getNode("a")->type, "component");
    EXPECT_TRUE(a.hasNode("c"));
}

TEST(ApplierTest, EmptyIdRoundTrip) {
    GraphSnapshot a({}, {});
    GraphSnapshot b({Node("", "t", {{"k", 1}})}, {});

    IdGenerator ids;
    GraphPatch patch = PatchCompiler(ids, "system").compile(diffOf(a, b, ids));
    ASSERT_EQ(patch.operations.size(), 1u);
    EXPECT_EQ(patch.operations[0].path, "/nodes/");

    GraphSnapshot result = PatchApplier().apply(a, patch);
    const Node* got = result.getNode("");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(*got, *b.getNode(""));

    GraphSnapshot back = PatchApplier().apply(
        result, makePatch({makeOp(PatchOp::Replace, "/nodes//data/k", Value(2))}));
    EXPECT_EQ(back.getNode("")->data["k"], 2);
}

TEST(ApplierTest, ChecksumMismatchIsRejected) {
    GraphSnapshot g({Node("a", "x")}, {});
    GraphPatch patch = makePatch({makeOp(PatchOp::Remove, "/nodes/a")});
    patch.checksum = "deadbeef";

    EXPECT_THROW(PatchApplier().apply(g, patch), IntegrityError);
    EXPECT_THROW(PatchApplier().applyPartial(g, patch), IntegrityError);

    GraphSnapshot unchecked = PatchApplier(false).apply(g, patch);
    EXPECT_EQ(unchecked.nodeCount(), 0u);
}

TEST(ApplierTest, MissingEntityIsNotFound) {
    GraphSnapshot g({Node("a", "x")}, {});
    EXPECT_THROW(PatchApplier().apply(g, makePatch({makeOp(PatchOp::Remove, "/nodes/zzz")})),
                 NotFoundError);
    EXPECT_THROW(PatchApplier().apply(
                     g, makePatch({makeOp(PatchOp::Replace, "/edges/e9/type", Value("r"))})),
                 NotFoundError);
    EXPECT_THROW(PatchApplier().apply(g, makePatch({makeOp(PatchOp::Remove, "/nodes/a/data/k")})),
                 NotFoundError);
}

TEST(ApplierTest, PartialApplyStopsAtFirstFailure) {
    GraphSnapshot g({Node("a", "x")}, {});
    GraphPatch patch = makePatch({
        makeOp(PatchOp::Add, "/nodes/b", Value{{"type", "y"}}),
        makeOp(PatchOp::Remove, "/nodes/missing"),
        makeOp(PatchOp::Add, "/nodes/c", Value{{"type", "z"}}),
    });

    PatchResult result = PatchApplier().applyPartial(g, patch);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.applied, 1u);
    ASSERT_TRUE(result.failure.has_value());
    EXPECT_EQ(result.failure->operation_index, 1u);
    EXPECT_EQ(result.failure->kind, PatchFailure::Kind::NotFound);
    EXPECT_NE(result.failure->message.find("/nodes/missing"), std::string::npos);

    EXPECT_TRUE(result.graph.hasNode("b"));
    EXPECT_EQ(result.graph.getNode("b")->type, "y");
    EXPECT_FALSE(result.graph.hasNode("c"));
    EXPECT_FALSE(g.hasNode("b"));
}

TEST(ApplierTest, InvalidOperations) {
    GraphSnapshot g({Node("a", "x")}, {Edge("e", "a", "a", "r")});
    auto applyOne = [&](PatchOperation op) {
        return PatchApplier().apply(g, makePatch({std::move(op)}));
    };

    EXPECT_THROW(applyOne(makeOp(PatchOp::Add, "/nodes/a", Value{{"type", "x"}})),
                 ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Add, "/nodes/b", Value{{"id", "other"}})),
                 ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Replace, "/nodes/a/id", Value("b"))),
                 ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Remove, "/nodes/a/type")), ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Replace, "/nodes/a/source", Value("a"))),
                 ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Replace, "/edges/e/connection", Value("a"))),
                 ValidationError);
    EXPECT_THROW(applyOne(makeOp(PatchOp::Add, "/nodes/b")), ValidationError);
}

TEST(ApplierTest, RejectedOperationReportsIndex) {
    GraphSnapshot g({Node("a", "x")}, {});
    GraphPatch patch = makePatch({
        makeOp(PatchOp::Replace, "/nodes/a/type", Value("y")),
        makeOp(PatchOp::Remove, "/nodes/a/type"),
    });
    try {
        PatchApplier().apply(g, patch);
        FAIL() << "expected PatchOperationError";
    } catch (const PatchOperationError& e) {
        EXPECT_EQ(e.operationIndex(), 1u);
    }
}

TEST(ApplierTest, TestCopyAndMove) {
    GraphSnapshot g({Node("a", "x", {{"label", "A"}}), Node("b", "x")}, {});

    PatchOperation copy = makeOp(PatchOp::Copy, "/nodes/b/data/label");
    copy.from = "/nodes/a/data/label";
    PatchOperation move = makeOp(PatchOp::Move, "/nodes/b/data/title");
    move.from = "/nodes/b/data/label";

    GraphSnapshot result = PatchApplier().apply(g, makePatch({
        makeOp(PatchOp::Test, "/nodes/a/data/label", Value("A")),
        copy,
        move,
    }));
    EXPECT_EQ(result.getNode("a")->data["label"], "A");
    EXPECT_EQ(result.getNode("b")->data["title"], "A");
    EXPECT_FALSE(result.getNode("b")->hasData("label"));

    EXPECT_THROW(PatchApplier().apply(
                     g, makePatch({makeOp(PatchOp::Test, "/nodes/a/type", Value("y"))})),
                 ValidationError);
}

TEST(ApplierTest, DataMustStayAnObject) {
    GraphSnapshot g({Node("a", "x", {{"label", "A"}})}, {Edge("e", "a", "a", "r")});
    EXPECT_THROW(PatchApplier().apply(
                     g, makePatch({makeOp(PatchOp::Replace, "/nodes/a/data", Value(5))})),
                 ValidationError);
    EXPECT_THROW(PatchApplier().apply(
                     g, makePatch({makeOp(PatchOp::Replace, "/edges/e/data", Value("s"))})),
                 ValidationError);
    EXPECT_THROW(PatchApplier().apply(
                     g, makePatch({makeOp(PatchOp::Replace, "/nodes/a",
                                          Value{{"id", "a"}, {"type", "x"}, {"data", 5}})})),
                 ValidationError);

    GraphSnapshot result = PatchApplier().apply(
        g, makePatch({makeOp(PatchOp::Replace, "/nodes/a/data", Value{{"title", "T"}})}));
    EXPECT_EQ(result.getNode("a")->data, (Value{{"title", "T"}}));
}

TEST(ApplierTest, EdgeEndpointsAndNestedData) {
    GraphSnapshot g({Node("a", "x"), Node("b", "x")}, {Edge("e", "a", "a", "r")});
    GraphSnapshot result = PatchApplier().apply(g, makePatch({
        makeOp(PatchOp::Replace, "/edges/e/target", Value("b")),
        makeOp(PatchOp::Add, "/edges/e/data/meta/tags", Value::array()),
        makeOp(PatchOp::Add, "/edges/e/data/meta/tags/-", Value("hot")),
    }));
    const Edge* e = result.getEdge("e");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->target, "b");
    EXPECT_EQ(e->data["meta"]["tags"], Value::array({"hot"}));
}

// ─── JSON ──────────────────────────────────────────────────────

TEST(PatchJsonTest, RoundTripPreservesChecksum) {
    GraphPatch patch = makePatch({
        makeOp(PatchOp::Add, "/nodes/a", Value{{"id", "a"}, {"type", "x"}, {"data", {}}}),
        makeOp(PatchOp::Remove, "/edges/e"),
    });
    patch.source_version = "v1";
    patch.metadata.created_by = "system";

    Value j = patch;
    EXPECT_EQ(j["operations"][0]["op"], "add");
    EXPECT_FALSE(j["operations"][1].contains("value"));

    auto back = j.get<GraphPatch>();
    EXPECT_EQ(back.operations, patch.operations);
    EXPECT_EQ(back.source_version, "v1");
    EXPECT_EQ(back.metadata.created_by, "system");
    EXPECT_TRUE(verifyChecksum(back));
}

TEST(PatchJsonTest, RejectsMalformedOperations) {
    EXPECT_THROW(Value::parse(R"({"op": "merge", "path": "/nodes/a"})").get<PatchOperation>(),
                 ValidationError);
    EXPECT_THROW(Value::parse(R"({"op": "add"})").get<PatchOperation>(), ValidationError);
    EXPECT_THROW(Value::parse(R"({"id": "p"})").get<GraphPatch>(), ValidationError);
}

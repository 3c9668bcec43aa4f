#include <gtest/gtest.h>
#include "store/version_store.hpp"

#include <thread>
#include <vector>

using namespace grafdiff;

namespace {

GraphVersion makeVersion(const std::string& id, int64_t millis,
                         GraphSnapshot graph = GraphSnapshot{}) {
    GraphVersion v;
    v.id = id;
    v.timestamp = fromEpochMillis(millis);
    v.author = "dev";
    v.message = "snapshot " + id;
    v.graph = std::move(graph);
    v.metadata.version = "1.0." + std::to_string(millis);
    return v;
}

} // namespace

// ─── Versions ──────────────────────────────────────────────────

TEST(VersionStoreTest, StartsEmpty) {
    VersionStore store;
    EXPECT_EQ(store.versionCount(), 0u);
    EXPECT_EQ(store.diffCount(), 0u);
    EXPECT_EQ(store.getVersion("v1"), nullptr);
    EXPECT_EQ(store.getDiff("d1"), nullptr);
    EXPECT_TRUE(store.getVersionHistory().empty());
}

TEST(VersionStoreTest, StoreAndRetrieve) {
    VersionStore store;
    store.storeVersion(makeVersion("v1", 1000, GraphSnapshot({Node("a", "x")}, {})));

    auto v = store.getVersion("v1");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->author, "dev");
    EXPECT_EQ(v->graph.nodeCount(), 1u);
    EXPECT_EQ(v->metadata.version, "1.0.1000");
}

TEST(VersionStoreTest, RestoringReplacesButKeepsOldHandles) {
    VersionStore store;
    store.storeVersion(makeVersion("v1", 1000));
    auto before = store.getVersion("v1");

    GraphVersion replacement = makeVersion("v1", 2000);
    replacement.message = "rewritten";
    store.storeVersion(std::move(replacement));

    EXPECT_EQ(store.versionCount(), 1u);
    EXPECT_EQ(store.getVersion("v1")->message, "rewritten");
    EXPECT_EQ(before->message, "snapshot v1");
}

TEST(VersionStoreTest, HistoryNewestFirst) {
    VersionStore store;
    store.storeVersion(makeVersion("old", 1000));
    store.storeVersion(makeVersion("newest", 3000));
    store.storeVersion(makeVersion("tie_a", 2000));
    store.storeVersion(makeVersion("tie_b", 2000));

    auto history = store.getVersionHistory();
    ASSERT_EQ(history.size(), 4u);
    EXPECT_EQ(history[0]->id, "newest");
    EXPECT_EQ(history[1]->id, "tie_a");
    EXPECT_EQ(history[2]->id, "tie_b");
    EXPECT_EQ(history[3]->id, "old");
}

// ─── Diffs ─────────────────────────────────────────────────────

TEST(VersionStoreTest, RegisterDiff) {
    VersionStore store;
    GraphDiff diff;
    diff.id = "diff_1";
    diff.source_version = "v1";
    diff.target_version = "v2";
    store.registerDiff(diff);

    auto got = store.getDiff("diff_1");
    ASSERT_NE(got, nullptr);
    EXPECT_EQ(got->source_version, "v1");
    EXPECT_EQ(store.diffCount(), 1u);
}

TEST(VersionStoreTest, ConcurrentStores) {
    VersionStore store;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&store, t]() {
            for (int i = 0; i < 50; i++) {
                store.storeVersion(makeVersion("v" + std::to_string(t) + "_" + std::to_string(i),
                                               t * 100 + i));
                store.getVersionHistory();
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(store.versionCount(), 200u);
}

// ─── JSON ──────────────────────────────────────────────────────

TEST(VersionStoreTest, VersionJson) {
    GraphVersion v = makeVersion("v1", 1234);
    v.metadata.tags = {"release"};
    v.metadata.branch = "main";
    v.metadata.parent_versions = {"v0"};

    Value j = v;
    EXPECT_EQ(j["id"], "v1");
    EXPECT_EQ(j["timestamp"], 1234);
    EXPECT_EQ(j["metadata"]["branch"], "main");
    EXPECT_EQ(j["metadata"]["parentVersions"][0], "v0");
    EXPECT_TRUE(j["graph"]["nodes"].is_array());
}

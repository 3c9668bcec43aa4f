#pragma once

#include "common/clock.hpp"
#include "diff/graph_diff.hpp"
#include "graph/snapshot.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace grafdiff {

struct VersionMetadata {
    std::string version;
    std::vector<std::string> tags;
    std::optional<std::string> branch;
    std::vector<std::string> parent_versions;
};

/// A named snapshot registered by an explicit store call.
struct GraphVersion {
    std::string id;
    Timestamp timestamp;
    std::string author;
    std::string message;
    GraphSnapshot graph;
    VersionMetadata metadata;
};

void to_json(Value& j, const GraphVersion& version);

// ─── VersionStore ──────────────────────────────────────────────
// In-memory registry of versions and previously computed diffs.
// Empty at construction, grows through storeVersion()/registerDiff(),
// never evicts. Stored objects are immutable and handed out as shared
// pointers, so lookups stay valid even if an id is later re-stored.
// All member functions are safe to call concurrently.

class VersionStore {
public:
    VersionStore() = default;
    VersionStore(const VersionStore&) = delete;
    VersionStore& operator=(const VersionStore&) = delete;

    /// Store a version. A version with the same id is replaced.
    void storeVersion(GraphVersion version);

    /// Look up a version; nullptr if absent.
    std::shared_ptr<const GraphVersion> getVersion(const std::string& id) const;

    /// All versions, newest first. Equal timestamps keep insertion order.
    std::vector<std::shared_ptr<const GraphVersion>> getVersionHistory() const;

    void registerDiff(GraphDiff diff);

    /// Look up a diff; nullptr if absent.
    std::shared_ptr<const GraphDiff> getDiff(const std::string& id) const;

    size_t versionCount() const;
    size_t diffCount() const;

private:
    struct VersionEntry {
        uint64_t sequence = 0;
        std::shared_ptr<const GraphVersion> version;
    };

    mutable std::mutex mutex_;
    uint64_t next_sequence_ = 0;
    std::unordered_map<std::string, VersionEntry> versions_;
    std::unordered_map<std::string, std::shared_ptr<const GraphDiff>> diffs_;
};

} // namespace grafdiff

#include "store/version_store.hpp"
#include "common/logging.hpp"

#include <algorithm>

namespace grafdiff {

void VersionStore::storeVersion(GraphVersion version) {
    auto stored = std::make_shared<const GraphVersion>(std::move(version));
    std::lock_guard<std::mutex> lock(mutex_);
    logger()->debug("storing version {} ({} nodes, {} edges)", stored->id,
                    stored->graph.nodeCount(), stored->graph.edgeCount());
    versions_[stored->id] = VersionEntry{next_sequence_++, stored};
}

std::shared_ptr<const GraphVersion> VersionStore::getVersion(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = versions_.find(id);
    return it != versions_.end() ? it->second.version : nullptr;
}

std::vector<std::shared_ptr<const GraphVersion>> VersionStore::getVersionHistory() const {
    std::vector<VersionEntry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(versions_.size());
        for (const auto& [_, entry] : versions_) entries.push_back(entry);
    }

    std::sort(entries.begin(), entries.end(), [](const VersionEntry& a, const VersionEntry& b) {
        if (a.version->timestamp != b.version->timestamp) {
            return a.version->timestamp > b.version->timestamp;
        }
        return a.sequence < b.sequence;
    });

    std::vector<std::shared_ptr<const GraphVersion>> history;
    history.reserve(entries.size());
    for (auto& entry : entries) history.push_back(std::move(entry.version));
    return history;
}

void VersionStore::registerDiff(GraphDiff diff) {
    auto stored = std::make_shared<const GraphDiff>(std::move(diff));
    std::lock_guard<std::mutex> lock(mutex_);
    logger()->debug("registering diff {} ({} changes)", stored->id, stored->changes.size());
    diffs_[stored->id] = std::move(stored);
}

std::shared_ptr<const GraphDiff> VersionStore::getDiff(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = diffs_.find(id);
    return it != diffs_.end() ? it->second : nullptr;
}

size_t VersionStore::versionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return versions_.size();
}

size_t VersionStore::diffCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diffs_.size();
}

void to_json(Value& j, const GraphVersion& v) {
    Value metadata{{"version", v.metadata.version},
                   {"tags", v.metadata.tags},
                   {"parentVersions", v.metadata.parent_versions}};
    if (v.metadata.branch) metadata["branch"] = *v.metadata.branch;

    j = Value{{"id", v.id},
              {"timestamp", toEpochMillis(v.timestamp)},
              {"author", v.author},
              {"message", v.message},
              {"graph", v.graph},
              {"metadata", std::move(metadata)}};
}

} // namespace grafdiff

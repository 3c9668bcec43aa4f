#pragma once

#include "common/id_generator.hpp"
#include "diff/change_classifier.hpp"
#include "diff/conflict_detector.hpp"
#include "diff/diff_options.hpp"
#include "diff/graph_diff.hpp"
#include "engine/engine_config.hpp"
#include "patch/patch.hpp"
#include "patch/patch_applier.hpp"
#include "patch/patch_compiler.hpp"
#include "store/version_store.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace grafdiff {

// ─── GraphDiffEngine ───────────────────────────────────────────
// Front door of the library. Pipeline per comparison:
//
//   snapshots → EntityComparator → ChangeClassifier
//             → ConflictDetector (opt-in) → DiffStatisticsCalculator
//             → GraphDiff (optionally registered in the VersionStore)
//
// The VersionStore is injected and must outlive the engine. Classifier
// rules and the type-transition policy are configured up front; after
// that, compare/patch calls may run concurrently.

class GraphDiffEngine {
public:
    explicit GraphDiffEngine(VersionStore& store, EngineConfig config = {});

    GraphDiffEngine(const GraphDiffEngine&) = delete;
    GraphDiffEngine& operator=(const GraphDiffEngine&) = delete;

    /// Compare two snapshots. The diff's version labels are "source"/"target".
    GraphDiff compareGraphs(const GraphSnapshot& source, const GraphSnapshot& target,
                            const DiffOptions& options = {});

    /// Compare two stored versions. Throws NotFoundError for an unknown id.
    GraphDiff compareVersions(const std::string& source_version_id,
                              const std::string& target_version_id,
                              const DiffOptions& options = {});

    /// Conflict scan over an existing diff and the snapshots it came from.
    std::vector<Conflict> detectConflicts(const GraphDiff& diff,
                                          const GraphSnapshot& source,
                                          const GraphSnapshot& target) const;

    GraphPatch createPatch(const GraphDiff& diff) const;

    /// Throws IntegrityError, NotFoundError or ValidationError.
    GraphSnapshot applyPatch(const GraphSnapshot& graph, const GraphPatch& patch) const;

    std::vector<DiffHighlight> highlights(const GraphDiff& diff) const;

    // ── Version store passthrough ──
    void storeVersion(GraphVersion version) { store_.storeVersion(std::move(version)); }
    std::vector<std::shared_ptr<const GraphVersion>> getVersionHistory() const {
        return store_.getVersionHistory();
    }
    std::shared_ptr<const GraphDiff> getDiff(const std::string& id) const {
        return store_.getDiff(id);
    }

    ChangeClassifier& classifier() { return classifier_; }
    ConflictDetector& conflictDetector() { return detector_; }
    VersionStore& store() { return store_; }

    /// Custom comparator and classification rule invocations that threw.
    size_t softFailures() const;

private:
    GraphDiff buildDiff(const GraphSnapshot& source, const GraphSnapshot& target,
                        const DiffOptions& options, std::string source_version,
                        std::string target_version);

    VersionStore& store_;
    EngineConfig config_;
    mutable IdGenerator ids_;
    ChangeClassifier classifier_;
    ConflictDetector detector_;
    PatchApplier applier_;
    std::atomic<size_t> comparator_failures_{0};
};

} // namespace grafdiff

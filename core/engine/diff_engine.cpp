#include "engine/diff_engine.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "diff/diff_statistics.hpp"
#include "diff/entity_comparator.hpp"

namespace grafdiff {

GraphDiffEngine::GraphDiffEngine(VersionStore& store, EngineConfig config)
    : store_(store),
      config_(std::move(config)),
      detector_(config_.type_transitions, ids_) {}

GraphDiff GraphDiffEngine::compareGraphs(const GraphSnapshot& source,
                                         const GraphSnapshot& target,
                                         const DiffOptions& options) {
    return buildDiff(source, target, options, "source", "target");
}

GraphDiff GraphDiffEngine::compareVersions(const std::string& source_version_id,
                                           const std::string& target_version_id,
                                           const DiffOptions& options) {
    auto source = store_.getVersion(source_version_id);
    if (!source) throw NotFoundError("version not found: " + source_version_id);
    auto target = store_.getVersion(target_version_id);
    if (!target) throw NotFoundError("version not found: " + target_version_id);

    return buildDiff(source->graph, target->graph, options, source_version_id,
                     target_version_id);
}

GraphDiff GraphDiffEngine::buildDiff(const GraphSnapshot& source, const GraphSnapshot& target,
                                     const DiffOptions& options, std::string source_version,
                                     std::string target_version) {
    GraphDiff diff;
    diff.id = ids_.next("diff");
    diff.source_version = std::move(source_version);
    diff.target_version = std::move(target_version);
    diff.timestamp = Clock::now();

    EntityComparator comparator(options, ids_);
    diff.changes = comparator.compare(source, target);
    if (comparator.comparatorFailures() > 0) {
        comparator_failures_ += comparator.comparatorFailures();
    }

    classifier_.classify(diff.changes, source, target, options);

    if (options.include_conflict_resolution) {
        diff.conflicts = detector_.detect(diff.changes, source, target);
    }

    diff.statistics = DiffStatisticsCalculator::compute(diff.changes, source, target);

    logger()->debug("{}: {} changes, {} conflicts, similarity {:.3f}", diff.id,
                    diff.statistics.total_changes, diff.conflicts.size(),
                    diff.statistics.similarity);

    if (options.register_diff) store_.registerDiff(diff);
    return diff;
}

std::vector<Conflict> GraphDiffEngine::detectConflicts(const GraphDiff& diff,
                                                       const GraphSnapshot& source,
                                                       const GraphSnapshot& target) const {
    return detector_.detect(diff.changes, source, target);
}

GraphPatch GraphDiffEngine::createPatch(const GraphDiff& diff) const {
    PatchCompiler compiler(ids_, config_.patch_author);
    return compiler.compile(diff);
}

GraphSnapshot GraphDiffEngine::applyPatch(const GraphSnapshot& graph,
                                          const GraphPatch& patch) const {
    return applier_.apply(graph, patch);
}

std::vector<DiffHighlight> GraphDiffEngine::highlights(const GraphDiff& diff) const {
    return buildHighlights(diff);
}

size_t GraphDiffEngine::softFailures() const {
    return comparator_failures_.load() + classifier_.ruleFailures();
}

} // namespace grafdiff

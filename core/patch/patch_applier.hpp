#pragma once

#include "graph/snapshot.hpp"
#include "patch/patch.hpp"

#include <optional>
#include <string>

namespace grafdiff {

/// Where and why replay stopped.
struct PatchFailure {
    enum class Kind { NotFound, Validation };

    size_t operation_index = 0;
    Kind kind = Kind::Validation;
    std::string message;
};

/// Outcome of a partial replay. On failure `graph` holds the working copy
/// with every operation before `failure->operation_index` applied.
struct PatchResult {
    GraphSnapshot graph;
    size_t applied = 0;
    std::optional<PatchFailure> failure;

    bool ok() const { return !failure.has_value(); }
};

// ─── PatchApplier ──────────────────────────────────────────────
// Replays patch operations on a copy of a snapshot; the input is never
// touched. The checksum is verified before the first operation runs.
//
// Property paths:
//   /{nodes|edges}/{id}/type                entity type (string)
//   /edges/{id}/source, /edges/{id}/target  one endpoint (string)
//   /edges/{id}/connection                  {source, target}
//   /{nodes|edges}/{id}/data/...            nested data; intermediate
//                                           objects are created on write

class PatchApplier {
public:
    explicit PatchApplier(bool verify_checksum = true)
        : verify_checksum_(verify_checksum) {}

    /// Throws IntegrityError, NotFoundError, or PatchOperationError for a
    /// rejected operation.
    GraphSnapshot apply(const GraphSnapshot& base, const GraphPatch& patch) const;

    /// Stops at the first failing operation and reports it instead of
    /// throwing. A checksum mismatch still throws IntegrityError.
    PatchResult applyPartial(const GraphSnapshot& base, const GraphPatch& patch) const;

    /// Apply one operation in place. Throws NotFoundError or ValidationError.
    static void applyOperation(GraphSnapshot& working, const PatchOperation& op);

private:
    bool verify_checksum_;
};

} // namespace grafdiff

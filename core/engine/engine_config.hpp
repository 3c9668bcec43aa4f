#pragma once

#include "diff/conflict_detector.hpp"
#include "graph/value.hpp"

#include <string>

namespace grafdiff {

/// Per-engine settings. Per-call settings live in DiffOptions.
struct EngineConfig {
    TypeTransitionPolicy type_transitions = TypeTransitionPolicy::defaults();
    std::string patch_author = "system";

    /// Reads
    ///   {
    ///     "patchAuthor": "ci",
    ///     "replaceDefaultTransitions": false,
    ///     "forbiddenTypeTransitions": [{"from": "hook", "to": "class"}]
    ///   }
    /// Listed transitions extend the defaults unless replaceDefaultTransitions
    /// is true. Ill-typed values throw ValidationError.
    static EngineConfig fromJson(const Value& j);
};

} // namespace grafdiff

#pragma once

#include "graph/value.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>

namespace grafdiff {

/// Custom equality for a matched key: true means "equal, no difference".
using ValueComparator = std::function<bool(const Value&, const Value&)>;

/// Per-call comparison options.
struct DiffOptions {
    bool ignore_metadata = false;
    bool ignore_timestamps = false;
    bool semantic_diff = false;
    bool include_conflict_resolution = false;

    /// Keyed by dotted property path ("data.position") or by value kind
    /// name ("string", "number", "object", ...). Path keys win.
    std::unordered_map<std::string, ValueComparator> custom_comparators;

    /// Reserved for context-aware diffing; carried but not interpreted.
    int context_window = 0;

    /// Recursion bound for the deep object differ.
    size_t max_depth = 256;

    /// Store the resulting diff in the engine's version store.
    bool register_diff = true;

    /// Read options from a JSON object using the camelCase keys
    /// (ignoreMetadata, semanticDiff, maxDepth, ...). Unknown keys are
    /// ignored; ill-typed values throw ValidationError.
    static DiffOptions fromJson(const Value& j);
};

} // namespace grafdiff

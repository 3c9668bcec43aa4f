#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace grafdiff {

/// Payload type for entity data and for the values carried by changes
/// and patch operations.
using Value = nlohmann::json;

/// A value that may be missing on one side of a comparison.
/// std::nullopt means "absent" and is distinct from a JSON null.
using OptionalValue = std::optional<Value>;

/// Ordered property-access steps, e.g. {"data", "props", "0"}.
using PropertyPath = std::vector<std::string>;

/// Coarse value kinds used for type-mismatch detection.
/// Integer, unsigned and floating numbers are one kind.
enum class ValueKind {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object,
};

ValueKind kindOf(const Value& value);
const char* kindName(ValueKind kind);

std::string joinPath(const PropertyPath& path, char separator);
bool pathContains(const PropertyPath& path, const std::string& segment);

} // namespace grafdiff

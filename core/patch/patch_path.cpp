#include "patch/patch_path.hpp"
#include "common/errors.hpp"

#include <vector>

namespace grafdiff {

std::string escapeSegment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string unescapeSegment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); i++) {
        if (segment[i] != '~') {
            out += segment[i];
            continue;
        }
        if (i + 1 >= segment.size() || (segment[i + 1] != '0' && segment[i + 1] != '1')) {
            throw ValidationError("invalid escape sequence in path segment '" + segment + "'");
        }
        out += segment[i + 1] == '0' ? '~' : '/';
        i++;
    }
    return out;
}

std::string formatPatchPath(EntityKind kind, const std::string& id,
                            const PropertyPath& property) {
    std::string path = kind == EntityKind::Node ? "/nodes/" : "/edges/";
    path += escapeSegment(id);
    for (const auto& segment : property) {
        path += '/';
        path += escapeSegment(segment);
    }
    return path;
}

PatchPath parsePatchPath(const std::string& path) {
    if (path.empty() || path[0] != '/') {
        throw ValidationError("patch path must start with '/': '" + path + "'");
    }

    std::vector<std::string> segments;
    size_t start = 1;
    while (true) {
        size_t slash = path.find('/', start);
        segments.push_back(unescapeSegment(path.substr(start, slash - start)));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }

    if (segments.size() < 2) {
        throw ValidationError("patch path does not name an entity: '" + path + "'");
    }

    PatchPath parsed;
    if (segments[0] == "nodes") {
        parsed.kind = EntityKind::Node;
    } else if (segments[0] == "edges") {
        parsed.kind = EntityKind::Edge;
    } else {
        throw ValidationError("patch path must start with /nodes or /edges: '" + path + "'");
    }
    parsed.id = segments[1];
    parsed.property.assign(segments.begin() + 2, segments.end());
    return parsed;
}

} // namespace grafdiff

// PyBind11 bindings for the grafdiff C++ core.
// Exposes snapshots, diffing, patching and the version store to Python.
// Structured payloads (entity data, diffs, patches) cross the boundary as
// JSON strings.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DGRAFDIFF_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "diff/graph_diff.hpp"
#include "engine/diff_engine.hpp"
#include "engine/engine_config.hpp"
#include "graph/snapshot.hpp"
#include "patch/patch.hpp"
#include "store/version_store.hpp"

namespace py = pybind11;

namespace {

grafdiff::Value parseJson(const std::string& text) {
    if (text.empty()) return grafdiff::Value::object();
    try {
        return grafdiff::Value::parse(text);
    } catch (const grafdiff::Value::parse_error& e) {
        throw grafdiff::ValidationError(std::string("invalid JSON: ") + e.what());
    }
}

grafdiff::DiffOptions parseOptions(const std::string& options_json) {
    return grafdiff::DiffOptions::fromJson(parseJson(options_json));
}

} // namespace

PYBIND11_MODULE(grafdiff_bindings, m) {
    m.doc() = "grafdiff C++ Core Bindings";

    py::register_exception<grafdiff::NotFoundError>(m, "NotFoundError", PyExc_KeyError);
    py::register_exception<grafdiff::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<grafdiff::IntegrityError>(m, "IntegrityError", PyExc_ValueError);
    py::register_exception<grafdiff::DepthLimitError>(m, "DepthLimitError", PyExc_RecursionError);

    // ── Node ──
    py::class_<grafdiff::Node>(m, "Node")
        .def(py::init<>())
        .def(py::init([](std::string id, std::string type, const std::string& data) {
                 return grafdiff::Node(std::move(id), std::move(type), parseJson(data));
             }),
             py::arg("id"), py::arg("type"), py::arg("data") = "{}")
        .def_readwrite("id", &grafdiff::Node::id)
        .def_readwrite("type", &grafdiff::Node::type)
        .def_property("data",
            [](const grafdiff::Node& n) { return n.data.dump(); },
            [](grafdiff::Node& n, const std::string& data) { n.data = parseJson(data); });

    // ── Edge ──
    py::class_<grafdiff::Edge>(m, "Edge")
        .def(py::init<>())
        .def(py::init([](std::string id, std::string source, std::string target,
                         std::string type, const std::string& data) {
                 return grafdiff::Edge(std::move(id), std::move(source), std::move(target),
                                       std::move(type), parseJson(data));
             }),
             py::arg("id"), py::arg("source"), py::arg("target"),
             py::arg("type"), py::arg("data") = "{}")
        .def_readwrite("id", &grafdiff::Edge::id)
        .def_readwrite("source", &grafdiff::Edge::source)
        .def_readwrite("target", &grafdiff::Edge::target)
        .def_readwrite("type", &grafdiff::Edge::type)
        .def_property("data",
            [](const grafdiff::Edge& e) { return e.data.dump(); },
            [](grafdiff::Edge& e, const std::string& data) { e.data = parseJson(data); });

    // ── GraphSnapshot ──
    py::class_<grafdiff::GraphSnapshot>(m, "GraphSnapshot")
        .def(py::init<>())
        .def(py::init<std::vector<grafdiff::Node>, std::vector<grafdiff::Edge>>())
        .def("add_node", &grafdiff::GraphSnapshot::addNode)
        .def("remove_node", &grafdiff::GraphSnapshot::removeNode)
        .def("has_node", &grafdiff::GraphSnapshot::hasNode)
        .def("node_count", &grafdiff::GraphSnapshot::nodeCount)
        .def("add_edge", &grafdiff::GraphSnapshot::addEdge)
        .def("remove_edge", &grafdiff::GraphSnapshot::removeEdge)
        .def("has_edge", &grafdiff::GraphSnapshot::hasEdge)
        .def("edge_count", &grafdiff::GraphSnapshot::edgeCount)
        .def("nodes", &grafdiff::GraphSnapshot::nodes)
        .def("edges", &grafdiff::GraphSnapshot::edges)
        .def("to_json", [](const grafdiff::GraphSnapshot& g) { return grafdiff::Value(g).dump(); })
        .def_static("from_json", [](const std::string& text) {
            return parseJson(text).get<grafdiff::GraphSnapshot>();
        });

    // ── VersionStore ──
    py::class_<grafdiff::VersionStore>(m, "VersionStore")
        .def(py::init<>())
        .def("store_version", [](grafdiff::VersionStore& self, const std::string& id,
                                 const std::string& author, const std::string& message,
                                 const grafdiff::GraphSnapshot& graph, const std::string& version) {
                 grafdiff::GraphVersion v;
                 v.id = id;
                 v.timestamp = grafdiff::Clock::now();
                 v.author = author;
                 v.message = message;
                 v.graph = graph;
                 v.metadata.version = version;
                 self.storeVersion(std::move(v));
             },
             py::arg("id"), py::arg("author"), py::arg("message"),
             py::arg("graph"), py::arg("version") = "")
        .def("version_count", &grafdiff::VersionStore::versionCount)
        .def("diff_count", &grafdiff::VersionStore::diffCount)
        .def("history", [](const grafdiff::VersionStore& self) {
            std::vector<std::string> ids;
            for (const auto& v : self.getVersionHistory()) ids.push_back(v->id);
            return ids;
        });

    // ── GraphDiffEngine ──
    py::class_<grafdiff::GraphDiffEngine>(m, "GraphDiffEngine")
        .def(py::init([](grafdiff::VersionStore& store, const std::string& config) {
                 return std::make_unique<grafdiff::GraphDiffEngine>(
                     store, grafdiff::EngineConfig::fromJson(parseJson(config)));
             }),
             py::arg("store"), py::arg("config") = "{}",
             py::keep_alive<1, 2>())
        .def("compare_graphs", [](grafdiff::GraphDiffEngine& self,
                                  const grafdiff::GraphSnapshot& source,
                                  const grafdiff::GraphSnapshot& target,
                                  const std::string& options) {
                 return grafdiff::Value(self.compareGraphs(source, target, parseOptions(options))).dump();
             },
             py::arg("source"), py::arg("target"), py::arg("options") = "{}")
        .def("compare_versions", [](grafdiff::GraphDiffEngine& self,
                                    const std::string& source_id, const std::string& target_id,
                                    const std::string& options) {
                 return grafdiff::Value(self.compareVersions(source_id, target_id,
                                                             parseOptions(options))).dump();
             },
             py::arg("source_id"), py::arg("target_id"), py::arg("options") = "{}")
        .def("create_patch", [](grafdiff::GraphDiffEngine& self,
                                const grafdiff::GraphSnapshot& source,
                                const grafdiff::GraphSnapshot& target,
                                const std::string& options) {
                 auto diff = self.compareGraphs(source, target, parseOptions(options));
                 return grafdiff::Value(self.createPatch(diff)).dump();
             },
             py::arg("source"), py::arg("target"), py::arg("options") = "{}")
        .def("apply_patch", [](grafdiff::GraphDiffEngine& self,
                               const grafdiff::GraphSnapshot& graph, const std::string& patch) {
            return self.applyPatch(graph, parseJson(patch).get<grafdiff::GraphPatch>());
        })
        .def("soft_failures", &grafdiff::GraphDiffEngine::softFailures);
}

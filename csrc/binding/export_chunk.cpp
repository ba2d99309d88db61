#include "chunkwise.hpp"

#include "chunk.hpp"

#include <string>

void exportChunk(py::module& m) {
    py::class_<chunkwise::Chunk>(m, "Chunk")
        .def_readonly("text", &chunkwise::Chunk::text)
        .def_readonly("index", &chunkwise::Chunk::index)
        .def_readonly("over_budget", &chunkwise::Chunk::over_budget)
        .def_readonly("content_hash", &chunkwise::Chunk::content_hash)
        .def("__str__", [](const chunkwise::Chunk& self) { return self.text; })
        .def("__repr__", [](const chunkwise::Chunk& self) {
            return "<Chunk index=" + std::to_string(self.index) +
                   " chars=" + std::to_string(self.text.size()) +
                   (self.over_budget ? " over_budget" : "") + ">";
        });

    py::class_<chunkwise::ChunkStats>(m, "ChunkStats")
        .def_readonly("count", &chunkwise::ChunkStats::count)
        .def_readonly("min_chars", &chunkwise::ChunkStats::min_chars)
        .def_readonly("max_chars", &chunkwise::ChunkStats::max_chars)
        .def_readonly("avg_chars", &chunkwise::ChunkStats::avg_chars);

    py::class_<chunkwise::ChunkResult>(m, "ChunkResult")
        .def_readonly("chunks", &chunkwise::ChunkResult::chunks)
        .def_readonly("oracle_calls", &chunkwise::ChunkResult::oracle_calls)
        .def("has_over_budget", &chunkwise::ChunkResult::has_over_budget)
        .def("texts", &chunkwise::ChunkResult::texts)
        .def("stats", &chunkwise::ChunkResult::stats)
        .def("__len__", &chunkwise::ChunkResult::size)
        .def("__getitem__", [](const chunkwise::ChunkResult& self, size_t i) -> const chunkwise::Chunk& {
                if (i >= self.chunks.size()) throw py::index_error();
                return self.chunks[i];
            },
            py::return_value_policy::reference_internal)
        .def("__iter__", [](const chunkwise::ChunkResult& self) {
                return py::make_iterator(self.chunks.begin(), self.chunks.end());
            },
            py::keep_alive<0, 1>());
}

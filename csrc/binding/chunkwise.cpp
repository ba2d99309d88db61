#include "chunkwise.hpp"

PYBIND11_MODULE(chunkwise_cpp, m) {
    m.doc() = "chunkwise token-bounded semantic chunker.";

    exportChunk(m);
    exportSemanticChunker(m);
}

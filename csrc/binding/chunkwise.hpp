#pragma once

#include <pybind11/stl.h>
#include <pybind11/pybind11.h>
#include <pybind11/pytypes.h>

namespace py = pybind11;

void exportChunk(pybind11::module& m);
void exportSemanticChunker(pybind11::module& m);

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

// Forward declarations of binding functions
void init_status_types(py::module_& m);
void init_registry(py::module_& m);

PYBIND11_MODULE(_tether, m) {
    m.doc() = "tether connection supervisor Python bindings"; // Module docstring

    init_status_types(m);
    init_registry(m);
}

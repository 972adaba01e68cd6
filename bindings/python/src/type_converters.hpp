#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tether {
namespace py = pybind11;

// Vector conversion helpers
template<typename T>
py::list vector_to_list(const std::vector<T>& vec) {
    py::list result;
    for (const auto& item : vec) {
        result.append(py::cast(item));
    }
    return result;
}

// JSON values cross the boundary through the json module
py::object json_to_python(const nlohmann::json& value);
nlohmann::json python_to_json(const py::handle& obj);

} // namespace tether

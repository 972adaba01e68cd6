#include "type_converters.hpp"

namespace tether {

py::object json_to_python(const nlohmann::json& value) {
    if (value.is_null()) {
        return py::none();
    }
    return py::module_::import("json").attr("loads")(value.dump());
}

nlohmann::json python_to_json(const py::handle& obj) {
    if (obj.is_none()) {
        return nullptr;
    }
    auto text = py::module_::import("json").attr("dumps")(obj).cast<std::string>();
    return nlohmann::json::parse(text);
}

} // namespace tether

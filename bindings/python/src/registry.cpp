#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>
#include "tether/core/status_store.hpp"
#include "tether/core/supervisor_registry.hpp"
#include "tether/core/tcp_line_driver.hpp"
#include "tether/utils/logging.hpp"
#include "tether/utils/time_format.hpp"
#include "type_converters.hpp"

namespace py = pybind11;
using namespace tether::core;
using namespace tether;

namespace {

py::object optionalTime(const std::optional<std::chrono::system_clock::time_point>& time) {
    if (!time) {
        return py::none();
    }
    return py::str(utils::formatIso8601(*time));
}

py::dict statusToDict(const SupervisorStatus& status) {
    py::dict result;
    result["status"] = toString(status.state);
    result["last_error"] = status.lastError ? py::object(py::str(*status.lastError)) : py::object(py::none());
    result["last_error_kind"] = status.lastErrorKind
        ? py::object(py::str(toString(*status.lastErrorKind)))
        : py::object(py::none());
    result["last_connected_at"] = optionalTime(status.lastConnectedAt);
    result["reconnect_attempt_count"] = status.reconnectAttemptCount;
    result["current_delay_ms"] = status.currentDelay.count();
    result["messages_received"] = status.messagesReceived;
    return result;
}

py::dict discoveryToDict(const DiscoveryResult<nlohmann::json>& result) {
    py::dict out;
    out["data"] = result.payload ? json_to_python(*result.payload) : py::object(py::none());
    out["cached"] = result.cached;
    out["cached_at"] = optionalTime(result.cachedAt);
    out["warning"] = result.warning ? py::object(py::str(*result.warning)) : py::object(py::none());
    out["source"] = toString(result.source);
    return out;
}

/**
 * @brief Registry, broadcaster and optional status store owned together for Python
 *
 * Connections use the tcp-line driver.
 */
class PyRegistry {
public:
    PyRegistry(std::chrono::milliseconds shutdownTimeout, const std::string& statusStorePath)
        : broadcaster_(std::make_shared<StatusBroadcaster>()),
          shutdownTimeout_(shutdownTimeout) {
        if (!statusStorePath.empty()) {
            store_ = std::make_shared<StatusStore>(statusStorePath);
            auto loaded = store_->load();
            if (!loaded) {
                throw std::runtime_error(loaded.error());
            }
            store_->attach(broadcaster_);
        }
        registry_ = std::make_unique<SupervisorRegistry>(broadcaster_, store_, shutdownTimeout);
    }

    ~PyRegistry() {
        py::gil_scoped_release release;
        close();
    }

    bool add(const py::dict& config) {
        auto parsed = supervisorConfigFromJson(python_to_json(config));
        py::gil_scoped_release release;
        return registry_->add(parsed, &PyRegistry::makeDriver);
    }

    bool remove(const std::string& connectionId) {
        py::gil_scoped_release release;
        return registry_->remove(connectionId);
    }

    py::dict statuses() const {
        std::map<std::string, SupervisorStatus> snapshot;
        {
            py::gil_scoped_release release;
            snapshot = registry_->statuses();
        }
        py::dict result;
        for (const auto& [id, status] : snapshot) {
            result[py::str(id)] = statusToDict(status);
        }
        return result;
    }

    py::object status(const std::string& connectionId) const {
        auto supervisor = registry_->get(connectionId);
        if (!supervisor) {
            return py::none();
        }
        return statusToDict(supervisor->status());
    }

    py::dict discover(const std::string& connectionId, const std::string& resourceKey, bool forceRefresh) {
        DiscoveryResult<nlohmann::json> result;
        {
            py::gil_scoped_release release;
            result = registry_->discover(connectionId, resourceKey, forceRefresh);
        }
        return discoveryToDict(result);
    }

    py::dict testConnection(const py::dict& endpoint) {
        auto parsed = endpointFromJson(python_to_json(endpoint));
        ConnectionTestResult result;
        {
            py::gil_scoped_release release;
            result = probeConnection(makeDriver(SupervisorConfig{}), parsed);
        }
        py::dict out;
        out["success"] = result.success;
        out["message"] = result.message;
        out["error_kind"] = result.errorKind ? py::object(py::str(toString(*result.errorKind)))
                                             : py::object(py::none());
        out["elapsed_ms"] = result.elapsed.count();
        return out;
    }

    /**
     * @brief Call back with the wire JSON of every status event, from supervisor threads
     */
    StatusBroadcaster::SubscriptionId subscribe(py::function callback) {
        // The last reference may drop on a thread that does not hold the GIL.
        std::shared_ptr<py::function> shared(new py::function(std::move(callback)), [](py::function* f) {
            py::gil_scoped_acquire acquire;
            delete f;
        });
        return broadcaster_->subscribe([shared](const BroadcastMessage& message) {
            py::gil_scoped_acquire acquire;
            (*shared)(json_to_python(toJson(message)));
        });
    }

    bool unsubscribe(StatusBroadcaster::SubscriptionId id) {
        py::gil_scoped_release release;
        return broadcaster_->unsubscribe(id);
    }

    py::dict shutdownAll(std::optional<std::chrono::milliseconds> timeout) {
        ShutdownReport report;
        {
            py::gil_scoped_release release;
            report = registry_->shutdownAll(timeout.value_or(shutdownTimeout_));
            closed_ = true;
        }
        py::dict out;
        out["stopped"] = vector_to_list(report.stopped);
        out["abandoned"] = vector_to_list(report.abandoned);
        out["elapsed_ms"] = report.elapsed.count();
        return out;
    }

    std::vector<std::string> ids() const { return registry_->ids(); }
    std::size_t size() const { return registry_->size(); }

private:
    static std::shared_ptr<ConnectionDriver> makeDriver(const SupervisorConfig&) {
        return std::make_shared<TcpLineDriver>();
    }

    void close() {
        if (!closed_) {
            registry_->shutdownAll(shutdownTimeout_);
            closed_ = true;
        }
        if (store_) {
            store_->detach();
        }
    }

    std::shared_ptr<StatusBroadcaster> broadcaster_;
    std::shared_ptr<StatusStore> store_;
    std::unique_ptr<SupervisorRegistry> registry_;
    std::chrono::milliseconds shutdownTimeout_;
    bool closed_{false};
};

} // namespace

void init_status_types(py::module_& m) {
    py::enum_<ConnectionState>(m, "ConnectionState")
        .value("DISCONNECTED", ConnectionState::Disconnected)
        .value("CONNECTING", ConnectionState::Connecting)
        .value("CONNECTED", ConnectionState::Connected)
        .value("RECONNECTING", ConnectionState::Reconnecting)
        .value("ERROR", ConnectionState::Error)
        .export_values();

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("AUTH_ERROR", ErrorKind::AuthError)
        .value("TLS_ERROR", ErrorKind::TlsError)
        .value("UNREACHABLE", ErrorKind::Unreachable)
        .value("TIMEOUT", ErrorKind::Timeout)
        .value("UNKNOWN", ErrorKind::Unknown);

    m.def("set_log_level", [](const std::string& name) {
        auto level = utils::logLevelFromString(name);
        if (!level) {
            throw py::value_error("unknown log level '" + name + "'");
        }
        utils::Logger::instance().setLevel(*level);
    }, py::arg("level"));

    m.def("load_config", [](const std::string& path) {
        auto loaded = loadRegistryConfig(path);
        if (!loaded) {
            throw py::value_error(loaded.error());
        }
        py::list connections;
        for (const auto& connection : loaded.value().connections) {
            py::dict entry;
            entry["id"] = connection.id;
            entry["enabled"] = connection.enabled;
            entry["driver"] = connection.driver;
            entry["endpoint"] = json_to_python(endpointToJson(connection.endpoint, true));
            connections.append(entry);
        }
        return connections;
    }, py::arg("path"), "Read the connections of a registry configuration file");
}

void init_registry(py::module_& m) {
    py::class_<PyRegistry>(m, "SupervisorRegistry")
        .def(py::init<std::chrono::milliseconds, const std::string&>(),
             py::arg("shutdown_timeout") = std::chrono::milliseconds(10000),
             py::arg("status_store") = std::string())
        .def("add", &PyRegistry::add, py::arg("config"),
             "Start supervising a connection described by a config dict")
        .def("remove", &PyRegistry::remove, py::arg("connection_id"))
        .def("status", &PyRegistry::status, py::arg("connection_id"))
        .def("statuses", &PyRegistry::statuses)
        .def("discover", &PyRegistry::discover,
             py::arg("connection_id"), py::arg("resource_key"), py::arg("force_refresh") = false)
        .def("test_connection", &PyRegistry::testConnection, py::arg("endpoint"),
             "Connect once to an endpoint dict without supervising it")
        .def("subscribe", &PyRegistry::subscribe, py::arg("callback"))
        .def("unsubscribe", &PyRegistry::unsubscribe, py::arg("subscription_id"))
        .def("shutdown_all", &PyRegistry::shutdownAll, py::arg("timeout") = py::none())
        .def("ids", &PyRegistry::ids)
        .def("__len__", &PyRegistry::size)
        .def("__enter__", [](PyRegistry& self) { return &self; }, py::return_value_policy::reference)
        .def("__exit__", [](PyRegistry& self, py::object, py::object, py::object) {
            self.shutdownAll(std::nullopt);
        })
        .def("__repr__", [](const PyRegistry& self) {
            return "SupervisorRegistry(connections=" + std::to_string(self.size()) + ")";
        });
}

#include "tether/core/supervisor_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <stdexcept>
#include "tether/utils/logging.hpp"

namespace tether {
namespace core {

namespace {

template <typename Duration>
Duration durationValue(const nlohmann::json& j, const char* key, Duration fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto count = j.at(key).get<typename Duration::rep>();
    if (count < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return Duration(count);
}

std::uint32_t countValue(const nlohmann::json& j, const char* key, std::uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto count = j.at(key).get<std::int64_t>();
    if (count < 0 || count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument(std::string(key) + " must be between 0 and " +
                                    std::to_string(std::numeric_limits<std::uint32_t>::max()));
    }
    return static_cast<std::uint32_t>(count);
}

} // namespace

EndpointConfig endpointFromJson(const nlohmann::json& j) {
    EndpointConfig endpoint;
    endpoint.host = j.value("host", endpoint.host);
    endpoint.port = j.value("port", endpoint.port);
    endpoint.useTls = j.value("tls", endpoint.useTls);
    endpoint.verifyTls = j.value("verify_tls", endpoint.verifyTls);
    endpoint.username = j.value("username", endpoint.username);
    endpoint.secret = j.value("secret", endpoint.secret);
    endpoint.connectTimeout = durationValue(j, "connect_timeout_ms", endpoint.connectTimeout);
    if (j.contains("extra")) {
        endpoint.extra = j.at("extra");
    }
    return endpoint;
}

nlohmann::json endpointToJson(const EndpointConfig& endpoint, bool includeSecret) {
    nlohmann::json j = {
        {"host", endpoint.host},
        {"port", endpoint.port},
        {"tls", endpoint.useTls},
        {"verify_tls", endpoint.verifyTls},
        {"username", endpoint.username},
        {"connect_timeout_ms", endpoint.connectTimeout.count()},
        {"extra", endpoint.extra}
    };
    if (includeSecret) {
        j["secret"] = endpoint.secret;
    }
    return j;
}

SupervisorConfig supervisorConfigFromJson(const nlohmann::json& j) {
    SupervisorConfig config;
    config.id = j.value("id", std::string());
    if (config.id.empty()) {
        throw std::invalid_argument("connection entry without an id");
    }
    config.enabled = j.value("enabled", config.enabled);
    config.driver = j.value("driver", config.driver);
    if (j.contains("endpoint")) {
        config.endpoint = endpointFromJson(j.at("endpoint"));
    }
    if (j.contains("backoff")) {
        const auto& b = j.at("backoff");
        config.backoff.initialDelay = durationValue(b, "initial_delay_ms", config.backoff.initialDelay);
        config.backoff.multiplier = b.value("multiplier", config.backoff.multiplier);
        config.backoff.maxDelay = durationValue(b, "max_delay_ms", config.backoff.maxDelay);
        // Rejects a first delay that is too long
        BackoffPolicy check(config.backoff);
        (void)check;
    }
    config.errorAfterFailures = countValue(j, "error_after_failures", config.errorAfterFailures);
    config.debounceWindow = durationValue(j, "debounce_window_ms", config.debounceWindow);
    config.discoveryTtl = durationValue(j, "discovery_ttl_s", config.discoveryTtl);
    config.statusEventType = j.value("status_event_type", config.statusEventType);
    config.resourceEventType = j.value("resource_event_type", config.resourceEventType);
    config.stopGrace = durationValue(j, "stop_grace_ms", config.stopGrace);
    return config;
}

Result<RegistryConfig> parseRegistryConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::string("registry configuration must be a JSON object");
    }
    try {
        RegistryConfig config;
        config.logLevel = j.value("log_level", config.logLevel);
        if (!utils::logLevelFromString(config.logLevel)) {
            return "unknown log_level '" + config.logLevel + "'";
        }
        config.shutdownTimeout = durationValue(j, "shutdown_timeout_ms", config.shutdownTimeout);
        config.statusStorePath = j.value("status_store", config.statusStorePath);

        std::set<std::string> seen;
        if (j.contains("connections")) {
            for (const auto& entry : j.at("connections")) {
                auto connection = supervisorConfigFromJson(entry);
                if (!seen.insert(connection.id).second) {
                    return "duplicate connection id '" + connection.id + "'";
                }
                config.connections.push_back(std::move(connection));
            }
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        return std::string("invalid registry configuration: ") + e.what();
    } catch (const std::invalid_argument& e) {
        return std::string("invalid registry configuration: ") + e.what();
    }
}

Result<RegistryConfig> loadRegistryConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return "cannot open configuration file " + path;
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return "cannot parse " + path + ": " + e.what();
    }
    auto result = parseRegistryConfig(j);
    if (result.has_value()) {
        TLOG_INFO("Loaded " << result.value().connections.size() << " connection(s) from " << path);
    }
    return result;
}

} // namespace core
} // namespace tether

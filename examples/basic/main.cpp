#include "tether/core/status_store.hpp"
#include "tether/core/supervisor_config.hpp"
#include "tether/core/supervisor_registry.hpp"
#include "tether/core/tcp_line_driver.hpp"
#include "tether/utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace tether::core;

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

} // namespace

// Supervises every connection listed in a JSON config file and prints
// status events to stdout, one JSON object per line, until SIGINT/SIGTERM.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json>\n";
        return 2;
    }

    auto loaded = loadRegistryConfig(argv[1]);
    if (!loaded) {
        std::cerr << loaded.error() << "\n";
        return 1;
    }
    const RegistryConfig& config = loaded.value();
    if (auto level = tether::utils::logLevelFromString(config.logLevel)) {
        tether::utils::Logger::instance().setLevel(*level);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    auto broadcaster = std::make_shared<StatusBroadcaster>();
    broadcaster->subscribe([](const BroadcastMessage& message) {
        std::cout << toWire(message) << std::endl;
    });

    std::shared_ptr<StatusStore> store;
    if (!config.statusStorePath.empty()) {
        store = std::make_shared<StatusStore>(config.statusStorePath);
        auto restored = store->load();
        if (!restored) {
            TLOG_WARN("Starting without persisted status: " << restored.error());
        }
        store->attach(broadcaster);
    }

    SupervisorRegistry registry(broadcaster, store, config.shutdownTimeout);
    DriverFactory factory = [](const SupervisorConfig& connection) -> std::shared_ptr<ConnectionDriver> {
        if (connection.driver == "tcp" || connection.driver == "tcp-line") {
            return std::make_shared<TcpLineDriver>();
        }
        return nullptr;
    };

    for (const auto& connection : config.connections) {
        if (!connection.enabled) {
            continue;
        }
        try {
            registry.add(connection, factory);
        } catch (const std::invalid_argument& e) {
            TLOG_ERROR("Skipping connection " << connection.id << ": " << e.what());
        }
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto report = registry.shutdownAll(config.shutdownTimeout);
    if (store) {
        store->detach();
    }
    return report.complete() ? 0 : 3;
}

/*
 * Input Link Receiver
 *
 * Main application that:
 * - Accepts sender connections over TCP
 * - Mirrors received controller input onto virtual devices
 * - Resets the devices a sender fed when it goes away
 */

#include "app_config.hpp"
#include "errors.hpp"
#include "host_events.hpp"
#include "logging.hpp"
#include "network_server.hpp"
#include "virtual_controller_manager.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>

using namespace input_link;

namespace {

const char* DEFAULT_CONFIG_PATH = "config/input_link.yaml";
const auto STATUS_INTERVAL = std::chrono::seconds(10);

volatile std::sig_atomic_t g_stop = 0;

void handle_signal(int) {
    g_stop = 1;
}

// Which controller numbers each client has fed
class ClientControllers {
public:
    void record(const std::string& client_id, int controller_number) {
        std::lock_guard<std::mutex> lock(mutex_);
        fed_[client_id].insert(controller_number);
    }

    std::set<int> release(const std::string& client_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<int> numbers;
        auto it = fed_.find(client_id);
        if (it != fed_.end()) {
            numbers.swap(it->second);
            fed_.erase(it);
        }
        return numbers;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::set<int>> fed_;
};

void report(const HostEvent& event) {
    switch (event.kind) {
        case HostEvent::Kind::ControllerCreated:
            std::cout << "Virtual controller " << event.controller_number << " created" << std::endl;
            break;
        case HostEvent::Kind::ControllerDestroyed:
            std::cout << "Virtual controller " << event.controller_number << " removed" << std::endl;
            break;
        case HostEvent::Kind::ClientConnected:
            std::cout << "Sender connected: " << event.text << std::endl;
            break;
        case HostEvent::Kind::ClientDisconnected:
            std::cout << "Sender disconnected: " << event.text << std::endl;
            break;
        default:
            break;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = argc >= 2 ? argv[1] : DEFAULT_CONFIG_PATH;

    AppConfig config;
    try {
        config = AppConfig::loadFromFile(config_path);
    } catch (const ConfigError& e) {
        log_error("receiver") << "configuration error in " << config_path << ": " << e.what();
        return 1;
    }
    setLogLevel(config.effectiveLogLevel());

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    HostEventChannel events(256);
    ClientControllers fed;

    VirtualControllerManager manager(
        config.virtualManagerConfig(), nullptr,
        [&events](int number) {
            events.pushDropOldest(HostEvent::controller(HostEvent::Kind::ControllerCreated, number));
        },
        [&events](int number) {
            events.pushDropOldest(HostEvent::controller(HostEvent::Kind::ControllerDestroyed, number));
        });

    NetworkServer server(config.serverConfig());
    server.setInputCallback([&manager](const ControllerInputData& input) {
        if (!manager.updateControllerState(input)) {
            log_debug("receiver") << "input for controller " << input.controller_number << " not applied";
        }
    });
    server.setMessageCallback([&fed](const NetworkMessage& message, const std::string& client_id) {
        if (message.messageType() == MessageType::ControllerInput) {
            fed.record(client_id, message.payload().at("controller_number").get<int>());
        }
    });
    server.setControllerDisconnectCallback([&manager](int number) {
        if (manager.isControllerActive(number) && !manager.resetController(number)) {
            log_warning("receiver") << "could not reset controller " << number;
        }
    });
    server.setClientConnectedCallback([&events](const std::string& client_id) {
        events.pushDropOldest(HostEvent::client(HostEvent::Kind::ClientConnected, client_id));
    });
    server.setClientDisconnectedCallback([&events, &fed, &manager](const std::string& client_id) {
        for (int number : fed.release(client_id)) {
            if (manager.isControllerActive(number) && !manager.resetController(number)) {
                log_warning("receiver") << "could not reset controller " << number;
            }
        }
        events.pushDropOldest(HostEvent::client(HostEvent::Kind::ClientDisconnected, client_id));
    });
    server.setStatusProvider([&manager]() { return manager.activeControllerCount(); });

    manager.start();
    if (!server.start()) {
        log_error("receiver") << "failed to start server";
        manager.stop();
        return 1;
    }

    std::cout << "Input Link Receiver" << std::endl;
    std::cout << "  Listening on: " << server.address() << std::endl;
    std::cout << "  Virtual backend: " << config.receiver.virtual_backend << std::endl;

    auto last_status = std::chrono::steady_clock::now();
    while (!g_stop) {
        std::optional<HostEvent> event = events.pop(std::chrono::milliseconds(200));
        if (event) report(*event);

        if (std::chrono::steady_clock::now() - last_status >= STATUS_INTERVAL) {
            last_status = std::chrono::steady_clock::now();
            std::cout << "Clients: " << server.clientCount()
                      << "  Virtual controllers: " << manager.activeControllerCount() << std::endl;
        }
    }

    std::cout << "Shutting down" << std::endl;
    server.stop();
    manager.stop();
    return 0;
}

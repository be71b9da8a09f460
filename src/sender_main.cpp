/*
 * Input Link Sender
 *
 * Main application that:
 * - Scans for controllers and applies configured controller numbers
 * - Captures their input at the configured polling rate
 * - Forwards samples to a receiver over TCP
 */

#include "app_config.hpp"
#include "controller_registry.hpp"
#include "errors.hpp"
#include "evdev_backend.hpp"
#include "host_events.hpp"
#include "input_capture.hpp"
#include "logging.hpp"
#include "network_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace input_link;

namespace {

const char* DEFAULT_CONFIG_PATH = "config/input_link.yaml";
const char* SYSTEM_MAPPING_DIR = "/usr/share/input_link/controllers";

volatile std::sig_atomic_t g_stop = 0;

void handle_signal(int) {
    g_stop = 1;
}

std::string resolve_mapping_dir(const std::string& configured) {
    if (std::filesystem::exists(configured)) return configured;
    return SYSTEM_MAPPING_DIR;
}

// Applies configured numbers/methods to freshly detected controllers
void apply_controller_settings(ControllerRegistry& registry, const SenderSettings& settings,
                               const std::vector<DetectedController>& detected) {
    for (const auto& controller : detected) {
        if (controller.state != ConnectionState::Connected) continue;

        auto it = settings.controllers.find(controller.identifier());
        if (it == settings.controllers.end()) continue;

        const ControllerSettings& wanted = it->second;
        if (!wanted.enabled) {
            if (controller.assigned_number && !registry.unassignController(controller.identifier())) {
                log_warning("sender") << "could not disable " << controller.identifier();
            }
            continue;
        }
        if (controller.assigned_number != wanted.assigned_number &&
            !registry.assignControllerNumber(controller.identifier(), wanted.assigned_number)) {
            log_warning("sender") << "could not assign number " << wanted.assigned_number
                                  << " to " << controller.identifier();
        }
        if (controller.preferred_input_method != wanted.input_method &&
            !registry.setInputMethod(controller.identifier(), wanted.input_method)) {
            log_warning("sender") << "could not set input method of " << controller.identifier();
        }
    }
}

class ConnectionTracker {
public:
    explicit ConnectionTracker(NetworkClient& client) : client_(client) {}

    // Announces controllers that appeared or went away since the last call
    void update(const std::vector<DetectedController>& controllers) {
        std::map<std::string, int> current;
        for (const auto& controller : controllers) {
            if (controller.state == ConnectionState::Connected && controller.assigned_number) {
                current[controller.identifier()] = *controller.assigned_number;
            }
        }

        for (const auto& entry : announced_) {
            auto it = current.find(entry.first);
            if (it == current.end() || it->second != entry.second) {
                send(NetworkMessage::createControllerDisconnect(entry.second, entry.first));
            }
        }
        for (const auto& entry : current) {
            auto it = announced_.find(entry.first);
            if (it == announced_.end() || it->second != entry.second) {
                send(NetworkMessage::createControllerConnect(entry.second, entry.first));
            }
        }
        announced_ = std::move(current);
    }

private:
    void send(const NetworkMessage& message) {
        if (!client_.sendMessage(message)) {
            log_warning("sender") << "dropped " << to_string(message.messageType()) << " announcement";
        }
    }

    NetworkClient& client_;
    std::map<std::string, int> announced_;
};

// Identity, state and number of every record; changes trigger a report
std::string summarize(const std::vector<DetectedController>& controllers) {
    std::string summary;
    for (const auto& controller : controllers) {
        summary += controller.identifier() + ":" + to_string(controller.state) + ":" +
                   std::to_string(controller.assigned_number.value_or(0)) + ";";
    }
    return summary;
}

void report(const HostEvent& event) {
    switch (event.kind) {
        case HostEvent::Kind::ControllersDetected:
            for (const auto& controller : event.controllers) {
                std::cout << "Controller " << controller.device_index << ": " << controller.name
                          << " [" << to_string(controller.state) << "]";
                if (controller.assigned_number) {
                    std::cout << " -> #" << *controller.assigned_number
                              << " (" << to_string(controller.preferred_input_method) << ")";
                }
                std::cout << std::endl;
            }
            break;
        case HostEvent::Kind::ConnectionStatus:
            std::cout << "Connection: " << event.text << std::endl;
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
        log_error("sender") << "configuration error in " << config_path << ": " << e.what();
        return 1;
    }
    setLogLevel(config.effectiveLogLevel());

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    HostEventChannel events(256);

    ControllerRegistry registry(
        std::make_unique<EvdevBackend>(resolve_mapping_dir(config.sender.mapping_dir), config.sender.input_dir));
    try {
        registry.initialize();
    } catch (const InitializationError& e) {
        log_error("sender") << "cannot start controller backend: " << e.what();
        return 1;
    }

    NetworkClient client(config.clientConfig(), [&events](const std::string& status) {
        events.pushDropOldest(HostEvent::connectionStatus(status));
    });

    std::atomic<unsigned long> dropped(0);
    InputCaptureConfig capture_config = config.captureConfig();
    capture_config.queue_samples = false;
    InputCaptureEngine capture(registry, capture_config, [&client, &dropped](const ControllerInputData& sample) {
        if (!client.sendControllerInput(sample)) ++dropped;
    });

    std::cout << "Input Link Sender" << std::endl;
    std::cout << "  Sending to: " << client.uri() << std::endl;
    std::cout << "  Polling rate: " << config.sender.polling_rate << " Hz" << std::endl;

    client.start();
    ConnectionTracker tracker(client);
    std::string last_summary;

    auto scan = [&]() {
        std::vector<DetectedController> detected = registry.scanControllers();
        apply_controller_settings(registry, config.sender, detected);
        for (auto& controller : detected) {
            std::optional<DetectedController> updated = registry.getControllerByIdentifier(controller.identifier());
            if (updated) controller = *updated;
        }
        tracker.update(detected);
        std::string summary = summarize(detected);
        if (summary != last_summary) {
            last_summary = summary;
            events.pushDropOldest(HostEvent::controllersDetected(detected));
        }
    };

    scan();
    capture.startCapture();

    auto scan_interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config.sender.scan_interval));
    auto last_scan = std::chrono::steady_clock::now();
    unsigned long reported_drops = 0;

    while (!g_stop) {
        if (std::chrono::steady_clock::now() - last_scan >= scan_interval) {
            last_scan = std::chrono::steady_clock::now();
            scan();
        }

        std::optional<HostEvent> event = events.pop(std::chrono::milliseconds(200));
        if (event) report(*event);

        unsigned long drops = dropped.load();
        if (drops != reported_drops) {
            log_warning("sender") << (drops - reported_drops) << " samples dropped (outbound queue full)";
            reported_drops = drops;
        }
    }

    std::cout << "Shutting down" << std::endl;
    capture.stopCapture();
    client.stop();
    registry.cleanup();
    return 0;
}

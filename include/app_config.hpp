/*
 * Application Configuration
 *
 * YAML settings shared by the sender and receiver programs, e.g.
 *
 *   log_level: INFO
 *   sender:
 *     receiver_host: 192.168.1.20
 *     polling_rate: 120
 *     controllers:
 *       030000005e0400008e02000014010000_0:
 *         assigned_number: 1
 *   receiver:
 *     max_controllers: 4
 *     virtual_backend: gamepad
 */

#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "controller_types.hpp"
#include "input_capture.hpp"
#include "logging.hpp"
#include "network_client.hpp"
#include "network_server.hpp"
#include "virtual_controller_manager.hpp"

#include <map>
#include <string>

namespace input_link {

struct ControllerSettings {
    int assigned_number = MIN_CONTROLLER_NUMBER;
    InputMethod input_method = InputMethod::XInput;
    bool enabled = true;
    std::string display_name;
};

struct SenderSettings {
    std::string receiver_host = "127.0.0.1";
    int receiver_port = DEFAULT_PORT;
    int polling_rate = 60;
    double dead_zone = 0.1;
    double retry_interval = 1.0;
    int max_retry_attempts = 10;  // 0 = retry forever
    double ping_interval = 5.0;
    double ping_timeout = 20.0;
    int max_queue_size = 1000;
    bool enable_button_repeat = false;
    double scan_interval = 2.0;   // seconds between device rescans
    std::string mapping_dir = "config/controllers";
    std::string input_dir = "/dev/input";
    std::map<std::string, ControllerSettings> controllers;  // by controller identifier
};

struct ReceiverSettings {
    std::string listen_host = "0.0.0.0";
    int listen_port = DEFAULT_PORT;
    int max_controllers = 4;  // 0 = no limit
    bool auto_create_virtual = true;
    double connection_timeout = 30.0;
    std::string virtual_backend = "auto";
};

struct AppConfig {
    SenderSettings sender;
    ReceiverSettings receiver;
    LogLevel log_level = LogLevel::Info;
    bool debug_logging = false;

    // Throws ConfigError naming the first offending field
    void validate() const;

    // Throws ConfigError on malformed YAML or invalid values
    static AppConfig loadFromString(const std::string& yaml_text);

    // A missing file yields the defaults, which are written to path
    static AppConfig loadFromFile(const std::string& path);

    void saveToFile(const std::string& path) const;
    std::string toYaml() const;

    LogLevel effectiveLogLevel() const { return debug_logging ? LogLevel::Debug : log_level; }

    ClientConfig clientConfig() const;
    ServerConfig serverConfig() const;
    InputCaptureConfig captureConfig() const;
    VirtualManagerConfig virtualManagerConfig() const;
};

// IP address or a hostname made of letters, digits, '.', '-' and '_'
bool is_valid_host(const std::string& host);

}  // namespace input_link

#endif // APP_CONFIG_HPP

/*
 * Application Configuration Implementation
 */

#include "app_config.hpp"
#include "errors.hpp"

#include <yaml-cpp/yaml.h>

#include <arpa/inet.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace input_link {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

template <typename T>
void check_range(const char* field, T value, T min, T max) {
    if (value < min || value > max) {
        std::ostringstream msg;
        msg << field << " must be in [" << min << ", " << max << "], got " << value;
        throw ConfigError(msg.str());
    }
}

void read_sender(const YAML::Node& node, SenderSettings& sender) {
    read_value(node, "receiver_host", sender.receiver_host);
    sender.receiver_host = trim(sender.receiver_host);
    read_value(node, "receiver_port", sender.receiver_port);
    read_value(node, "polling_rate", sender.polling_rate);
    read_value(node, "dead_zone", sender.dead_zone);
    read_value(node, "retry_interval", sender.retry_interval);
    read_value(node, "max_retry_attempts", sender.max_retry_attempts);
    read_value(node, "ping_interval", sender.ping_interval);
    read_value(node, "ping_timeout", sender.ping_timeout);
    read_value(node, "max_queue_size", sender.max_queue_size);
    read_value(node, "enable_button_repeat", sender.enable_button_repeat);
    read_value(node, "scan_interval", sender.scan_interval);
    read_value(node, "mapping_dir", sender.mapping_dir);
    read_value(node, "input_dir", sender.input_dir);

    if (!node["controllers"]) return;
    for (const auto& entry : node["controllers"]) {
        std::string identifier = entry.first.as<std::string>();
        const YAML::Node& ctrl = entry.second;
        if (!ctrl["assigned_number"]) {
            throw ConfigError("controllers." + identifier + ": assigned_number is required");
        }

        ControllerSettings settings;
        settings.assigned_number = ctrl["assigned_number"].as<int>();
        if (ctrl["input_method"]) {
            std::string method = ctrl["input_method"].as<std::string>();
            if (!parse_input_method(method, settings.input_method)) {
                throw ConfigError("controllers." + identifier + ": unknown input_method '" + method + "'");
            }
        }
        read_value(ctrl, "enabled", settings.enabled);
        read_value(ctrl, "display_name", settings.display_name);
        sender.controllers[identifier] = settings;
    }
}

void read_receiver(const YAML::Node& node, ReceiverSettings& receiver) {
    read_value(node, "listen_host", receiver.listen_host);
    receiver.listen_host = trim(receiver.listen_host);
    read_value(node, "listen_port", receiver.listen_port);
    read_value(node, "max_controllers", receiver.max_controllers);
    read_value(node, "auto_create_virtual", receiver.auto_create_virtual);
    read_value(node, "connection_timeout", receiver.connection_timeout);
    read_value(node, "virtual_backend", receiver.virtual_backend);
}

}  // namespace

bool is_valid_host(const std::string& host) {
    if (host.empty()) return false;

    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1) {
        return true;
    }
    for (char c : host) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

void AppConfig::validate() const {
    if (sender.receiver_host.empty()) {
        throw ConfigError("sender.receiver_host cannot be empty");
    }
    if (!is_valid_host(sender.receiver_host)) {
        throw ConfigError("sender.receiver_host has an invalid hostname format: " + sender.receiver_host);
    }
    check_range("sender.receiver_port", sender.receiver_port, 1024, 65535);
    check_range("sender.polling_rate", sender.polling_rate, 10, 240);
    check_range("sender.dead_zone", sender.dead_zone, 0.0, 0.9);
    check_range("sender.retry_interval", sender.retry_interval, 0.1, 30.0);
    check_range("sender.max_retry_attempts", sender.max_retry_attempts, 0, 100);
    check_range("sender.ping_interval", sender.ping_interval, 0.1, 300.0);
    check_range("sender.ping_timeout", sender.ping_timeout, 1.0, 600.0);
    check_range("sender.max_queue_size", sender.max_queue_size, 1, 1000000);
    check_range("sender.scan_interval", sender.scan_interval, 0.1, 60.0);

    for (const auto& entry : sender.controllers) {
        const std::string prefix = "sender.controllers." + entry.first;
        check_range((prefix + ".assigned_number").c_str(), entry.second.assigned_number,
                    MIN_CONTROLLER_NUMBER, MAX_CONTROLLER_NUMBER);
        if (entry.second.display_name.size() > 100) {
            throw ConfigError(prefix + ".display_name is longer than 100 characters");
        }
    }

    if (receiver.listen_host.empty()) {
        throw ConfigError("receiver.listen_host cannot be empty");
    }
    if (!is_valid_host(receiver.listen_host)) {
        throw ConfigError("receiver.listen_host has an invalid hostname format: " + receiver.listen_host);
    }
    check_range("receiver.listen_port", receiver.listen_port, 1024, 65535);
    check_range("receiver.max_controllers", receiver.max_controllers, 0, MAX_CONTROLLER_NUMBER);
    check_range("receiver.connection_timeout", receiver.connection_timeout, 5.0, 300.0);
    if (receiver.virtual_backend != "auto" && receiver.virtual_backend != "gamepad" &&
        receiver.virtual_backend != "keyboard") {
        throw ConfigError("receiver.virtual_backend must be auto, gamepad or keyboard, got " +
                          receiver.virtual_backend);
    }

    if ((sender.receiver_host == "127.0.0.1" || sender.receiver_host == "localhost") &&
        sender.receiver_port != receiver.listen_port) {
        throw ConfigError("port mismatch: sender expects " + std::to_string(sender.receiver_port) +
                          ", receiver listens on " + std::to_string(receiver.listen_port));
    }
}

AppConfig AppConfig::loadFromString(const std::string& yaml_text) {
    AppConfig config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            config.validate();
            return config;
        }
        if (!root.IsMap()) {
            throw ConfigError("configuration root must be a mapping");
        }

        if (root["log_level"]) {
            std::string level = root["log_level"].as<std::string>();
            if (!parse_log_level(level, config.log_level)) {
                throw ConfigError("log_level must be DEBUG, INFO, WARNING, ERROR or CRITICAL, got " + level);
            }
        }
        read_value(root, "debug_logging", config.debug_logging);
        if (root["sender"]) read_sender(root["sender"], config.sender);
        if (root["receiver"]) read_receiver(root["receiver"], config.receiver);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    config.validate();
    return config;
}

AppConfig AppConfig::loadFromFile(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        AppConfig config;
        log_info("config") << "no configuration at " << path << ", writing defaults";
        config.saveToFile(path);
        return config;
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot read " + path);
    }
    std::stringstream text;
    text << in.rdbuf();
    return loadFromString(text.str());
}

std::string AppConfig::toYaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "log_level" << YAML::Value << to_string(log_level);
    out << YAML::Key << "debug_logging" << YAML::Value << debug_logging;

    out << YAML::Key << "sender" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "receiver_host" << YAML::Value << sender.receiver_host;
    out << YAML::Key << "receiver_port" << YAML::Value << sender.receiver_port;
    out << YAML::Key << "polling_rate" << YAML::Value << sender.polling_rate;
    out << YAML::Key << "dead_zone" << YAML::Value << sender.dead_zone;
    out << YAML::Key << "retry_interval" << YAML::Value << sender.retry_interval;
    out << YAML::Key << "max_retry_attempts" << YAML::Value << sender.max_retry_attempts;
    out << YAML::Key << "ping_interval" << YAML::Value << sender.ping_interval;
    out << YAML::Key << "ping_timeout" << YAML::Value << sender.ping_timeout;
    out << YAML::Key << "max_queue_size" << YAML::Value << sender.max_queue_size;
    out << YAML::Key << "enable_button_repeat" << YAML::Value << sender.enable_button_repeat;
    out << YAML::Key << "scan_interval" << YAML::Value << sender.scan_interval;
    out << YAML::Key << "mapping_dir" << YAML::Value << sender.mapping_dir;
    out << YAML::Key << "input_dir" << YAML::Value << sender.input_dir;
    out << YAML::Key << "controllers" << YAML::Value << YAML::BeginMap;
    for (const auto& entry : sender.controllers) {
        out << YAML::Key << entry.first << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "assigned_number" << YAML::Value << entry.second.assigned_number;
        out << YAML::Key << "input_method" << YAML::Value << to_string(entry.second.input_method);
        out << YAML::Key << "enabled" << YAML::Value << entry.second.enabled;
        if (!entry.second.display_name.empty()) {
            out << YAML::Key << "display_name" << YAML::Value << entry.second.display_name;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "receiver" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "listen_host" << YAML::Value << receiver.listen_host;
    out << YAML::Key << "listen_port" << YAML::Value << receiver.listen_port;
    out << YAML::Key << "max_controllers" << YAML::Value << receiver.max_controllers;
    out << YAML::Key << "auto_create_virtual" << YAML::Value << receiver.auto_create_virtual;
    out << YAML::Key << "connection_timeout" << YAML::Value << receiver.connection_timeout;
    out << YAML::Key << "virtual_backend" << YAML::Value << receiver.virtual_backend;
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void AppConfig::saveToFile(const std::string& path) const {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ConfigError("cannot write " + path);
    }
    out << toYaml();
    if (!out) {
        throw ConfigError("error writing " + path);
    }
}

ClientConfig AppConfig::clientConfig() const {
    ClientConfig config;
    config.host = sender.receiver_host;
    config.port = static_cast<unsigned short>(sender.receiver_port);
    config.reconnect_interval = sender.retry_interval;
    config.max_reconnect_attempts = sender.max_retry_attempts;
    config.ping_interval = sender.ping_interval;
    config.ping_timeout = sender.ping_timeout;
    config.max_queue_size = static_cast<size_t>(sender.max_queue_size);
    return config;
}

ServerConfig AppConfig::serverConfig() const {
    ServerConfig config;
    config.host = receiver.listen_host;
    config.port = static_cast<unsigned short>(receiver.listen_port);
    config.connection_timeout = receiver.connection_timeout;
    return config;
}

InputCaptureConfig AppConfig::captureConfig() const {
    InputCaptureConfig config;
    config.polling_rate = sender.polling_rate;
    config.dead_zone = sender.dead_zone;
    config.enable_button_repeat = sender.enable_button_repeat;
    config.max_queue_size = static_cast<size_t>(sender.max_queue_size);
    return config;
}

VirtualManagerConfig AppConfig::virtualManagerConfig() const {
    VirtualManagerConfig config;
    if (receiver.max_controllers > 0) {
        config.max_controllers = static_cast<size_t>(receiver.max_controllers);
    } else {
        config.max_controllers = std::nullopt;
    }
    config.auto_create = receiver.auto_create_virtual;
    config.backend = receiver.virtual_backend;
    return config;
}

}  // namespace input_link

/*
 * Controller Configuration Implementation
 */

#include "controller_config.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <linux/input-event-codes.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace input_link {

const std::vector<std::string> STANDARD_BUTTON_NAMES = {
    "a", "b", "x", "y", "lb", "rb", "back", "start", "ls", "rs"
};

const std::vector<std::string> STANDARD_AXIS_NAMES = {
    "left_x", "left_y", "right_x", "right_y", "left_trigger", "right_trigger"
};

namespace {

const std::vector<std::string> DPAD_NAMES = {
    "dpad_up", "dpad_down", "dpad_left", "dpad_right"
};

int index_of(const std::vector<std::string>& names, const std::string& name) {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) return -1;
    return static_cast<int>(it - names.begin());
}

bool is_dpad_name(const std::string& name) {
    return index_of(DPAD_NAMES, name) >= 0;
}

}  // namespace

ControllerConfig::ControllerConfig() = default;

ControllerConfig::~ControllerConfig() = default;

std::shared_ptr<ControllerConfig> ControllerConfig::standardGamepad() {
    auto config = std::make_shared<ControllerConfig>();
    config->name_ = "Standard Gamepad";
    config->buttons_ = {
        {BTN_SOUTH, "a"}, {BTN_EAST, "b"}, {BTN_NORTH, "x"}, {BTN_WEST, "y"},
        {BTN_TL, "lb"}, {BTN_TR, "rb"}, {BTN_SELECT, "back"}, {BTN_START, "start"},
        {BTN_THUMBL, "ls"}, {BTN_THUMBR, "rs"},
        {BTN_DPAD_UP, "dpad_up"}, {BTN_DPAD_DOWN, "dpad_down"},
        {BTN_DPAD_LEFT, "dpad_left"}, {BTN_DPAD_RIGHT, "dpad_right"},
    };
    config->dpad_buttons_ = {
        {ABS_HAT0X, -1, "dpad_left"}, {ABS_HAT0X, 1, "dpad_right"},
        {ABS_HAT0Y, -1, "dpad_up"}, {ABS_HAT0Y, 1, "dpad_down"},
    };
    AxisMapping lx{ABS_X, "left_x"};
    AxisMapping ly{ABS_Y, "left_y"};
    AxisMapping rx{ABS_RX, "right_x"};
    AxisMapping ry{ABS_RY, "right_y"};
    AxisMapping lt{ABS_Z, "left_trigger"};
    AxisMapping rt{ABS_RZ, "right_trigger"};
    config->axes_ = {lx, ly, rx, ry, lt, rt};
    config->buildLookupMaps();
    return config;
}

bool ControllerConfig::loadFromFile(const std::string& config_path) {
    try {
        loadFromNode(YAML::LoadFile(config_path));
        return true;
    } catch (const YAML::Exception& e) {
        log_error("controller_config") << "Error loading config file " << config_path << ": " << e.what();
        return false;
    } catch (const ConfigError& e) {
        log_error("controller_config") << "Error loading config file " << config_path << ": " << e.what();
        return false;
    }
}

bool ControllerConfig::loadFromString(const std::string& yaml_text) {
    try {
        loadFromNode(YAML::Load(yaml_text));
        return true;
    } catch (const YAML::Exception& e) {
        log_error("controller_config") << "Error parsing config: " << e.what();
        return false;
    } catch (const ConfigError& e) {
        log_error("controller_config") << "Error parsing config: " << e.what();
        return false;
    }
}

void ControllerConfig::loadFromNode(const YAML::Node& config) {
    std::string name;
    std::vector<std::string> vendor_patterns;
    std::vector<std::string> exclude_patterns;
    std::vector<ButtonMapping> buttons;
    std::vector<DpadButtonMapping> dpad_buttons;
    std::vector<AxisMapping> axes;

    // Load controller info
    if (config["controller"]) {
        auto ctrl = config["controller"];
        if (ctrl["name"]) {
            name = ctrl["name"].as<std::string>();
        }
        if (ctrl["vendor_patterns"]) {
            vendor_patterns = ctrl["vendor_patterns"].as<std::vector<std::string>>();
        }
        if (ctrl["exclude_patterns"]) {
            exclude_patterns = ctrl["exclude_patterns"].as<std::vector<std::string>>();
        }
    }

    if (config["buttons"]) {
        for (const auto& btn : config["buttons"]) {
            ButtonMapping mapping;
            mapping.code = btn["code"].as<unsigned>();
            mapping.name = btn["name"].as<std::string>();
            if (index_of(STANDARD_BUTTON_NAMES, mapping.name) < 0 && !is_dpad_name(mapping.name)) {
                throw ConfigError("unknown button name '" + mapping.name + "'");
            }
            buttons.push_back(mapping);
        }
    }

    // Dpad reported as a hat axis (axis code + value -> button name)
    if (config["dpad_buttons"]) {
        for (const auto& dpad : config["dpad_buttons"]) {
            DpadButtonMapping mapping;
            mapping.axis_code = dpad["axis_code"].as<unsigned>();
            mapping.value = dpad["value"].as<int32_t>();
            mapping.name = dpad["name"].as<std::string>();
            if (!is_dpad_name(mapping.name)) {
                throw ConfigError("unknown dpad button name '" + mapping.name + "'");
            }
            dpad_buttons.push_back(mapping);
        }
    }

    if (config["axes"]) {
        for (const auto& axis : config["axes"]) {
            AxisMapping mapping;
            mapping.code = axis["code"].as<unsigned>();
            mapping.name = axis["name"].as<std::string>();
            if (index_of(STANDARD_AXIS_NAMES, mapping.name) < 0) {
                throw ConfigError("unknown axis name '" + mapping.name + "'");
            }
            if (axis["min"] && axis["max"]) {
                mapping.has_range = true;
                mapping.min = axis["min"].as<int32_t>();
                mapping.max = axis["max"].as<int32_t>();
                if (mapping.max <= mapping.min) {
                    throw ConfigError("axis '" + mapping.name + "' has an empty range");
                }
            }
            axes.push_back(mapping);
        }
    }

    name_ = std::move(name);
    vendor_patterns_ = std::move(vendor_patterns);
    exclude_patterns_ = std::move(exclude_patterns);
    buttons_ = std::move(buttons);
    dpad_buttons_ = std::move(dpad_buttons);
    axes_ = std::move(axes);
    buildLookupMaps();
}

bool ControllerConfig::matchesDevice(const std::string& device_name) const {
    std::string lower_name = device_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(), ::tolower);

    // Check exclude patterns first
    if (matchesPattern(lower_name, exclude_patterns_)) {
        return false;
    }

    return matchesPattern(lower_name, vendor_patterns_);
}

bool ControllerConfig::matchesPattern(const std::string& text, const std::vector<std::string>& patterns) const {
    for (const auto& pattern : patterns) {
        std::string lower_pattern = pattern;
        std::transform(lower_pattern.begin(), lower_pattern.end(), lower_pattern.begin(), ::tolower);
        if (text.find(lower_pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

const std::string* ControllerConfig::getButtonName(unsigned code) const {
    auto it = button_map_.find(code);
    if (it != button_map_.end()) {
        return &it->second;
    }
    return nullptr;
}

const std::string* ControllerConfig::getDpadButtonName(unsigned axis_code, int32_t value) const {
    auto axis_it = dpad_button_map_.find(axis_code);
    if (axis_it != dpad_button_map_.end()) {
        auto value_it = axis_it->second.find(value);
        if (value_it != axis_it->second.end()) {
            return &value_it->second;
        }
    }
    return nullptr;
}

bool ControllerConfig::isDpadAxis(unsigned code) const {
    return dpad_axis_codes_.count(code) > 0;
}

const AxisMapping* ControllerConfig::getAxisMapping(unsigned code) const {
    auto it = axis_map_.find(code);
    if (it != axis_map_.end()) {
        return &it->second;
    }
    return nullptr;
}

int ControllerConfig::buttonSlot(unsigned code) const {
    const std::string* name = getButtonName(code);
    return name ? index_of(STANDARD_BUTTON_NAMES, *name) : -1;
}

int ControllerConfig::axisSlot(unsigned code) const {
    const AxisMapping* mapping = getAxisMapping(code);
    return mapping ? index_of(STANDARD_AXIS_NAMES, mapping->name) : -1;
}

double ControllerConfig::normalizeAxis(unsigned code, int32_t raw_value,
                                       int32_t device_min, int32_t device_max) const {
    const AxisMapping* mapping = getAxisMapping(code);
    int32_t min = device_min;
    int32_t max = device_max;
    if (mapping && mapping->has_range) {
        min = mapping->min;
        max = mapping->max;
    }
    if (max <= min) {
        return 0.0;
    }

    int32_t value = std::max(min, std::min(max, raw_value));

    if (min < 0) {
        // Symmetric axis: scale by the larger half so center stays exactly 0
        int32_t max_abs = std::max(std::abs(min), std::abs(max));
        double normalized = static_cast<double>(value) / static_cast<double>(max_abs);
        return std::max(-1.0, std::min(1.0, normalized));
    }

    // Asymmetric axis (e.g. 0..255 triggers): map the full range onto [-1, 1]
    double range = static_cast<double>(max) - static_cast<double>(min);
    return 2.0 * (static_cast<double>(value) - static_cast<double>(min)) / range - 1.0;
}

void ControllerConfig::buildLookupMaps() {
    button_map_.clear();
    axis_map_.clear();
    dpad_button_map_.clear();
    dpad_axis_codes_.clear();

    for (const auto& btn : buttons_) {
        button_map_[btn.code] = btn.name;
    }

    for (const auto& dpad : dpad_buttons_) {
        dpad_button_map_[dpad.axis_code][dpad.value] = dpad.name;
        dpad_axis_codes_.insert(dpad.axis_code);
    }

    for (const auto& axis : axes_) {
        axis_map_[axis.code] = axis;
    }
}

std::shared_ptr<ControllerConfig> ConfigManager::loadConfig(const std::string& config_path) {
    auto config = std::make_shared<ControllerConfig>();
    if (config->loadFromFile(config_path)) {
        return config;
    }
    return nullptr;
}

std::shared_ptr<ControllerConfig> ConfigManager::detectConfig(const std::string& device_name,
                                                              const std::string& config_dir) {
    for (const auto& entry : configs_) {
        if (entry.second->matchesDevice(device_name)) {
            return entry.second;
        }
    }

    std::error_code ec;
    if (!fs::is_directory(config_dir, ec)) {
        log_debug("controller_config") << "Config directory not found: " << config_dir;
        return nullptr;
    }

    for (const auto& entry : fs::directory_iterator(config_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
            std::string config_name = entry.path().stem().string();
            if (configs_.count(config_name)) continue;
            auto config = loadConfig(entry.path().string());
            if (config && config->matchesDevice(device_name)) {
                registerConfig(config_name, config);
                return config;
            }
        }
    }

    return nullptr;
}

void ConfigManager::registerConfig(const std::string& name, std::shared_ptr<ControllerConfig> config) {
    configs_[name] = std::move(config);
}

std::shared_ptr<ControllerConfig> ConfigManager::getConfig(const std::string& name) const {
    auto it = configs_.find(name);
    if (it != configs_.end()) {
        return it->second;
    }
    return nullptr;
}

}  // namespace input_link

/*
 * Controller Configuration
 *
 * Loads controller mappings from YAML files. Maps evdev button and axis
 * codes of a physical device onto the standard gamepad layout used by the
 * capture loop, and normalizes raw axis values to [-1, 1].
 */

#ifndef CONTROLLER_CONFIG_HPP
#define CONTROLLER_CONFIG_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace YAML {
class Node;
}

namespace input_link {

struct ButtonMapping {
    unsigned code;
    std::string name;  // Logical button: a, b, x, y, lb, rb, back, start, ls, rs, dpad_*
};

struct DpadButtonMapping {
    unsigned axis_code;  // The axis code (e.g., ABS_HAT0X, ABS_HAT0Y)
    int32_t value;       // The axis value that triggers this button (-1 or 1)
    std::string name;    // dpad_up, dpad_down, dpad_left or dpad_right
};

struct AxisMapping {
    unsigned code;
    std::string name;  // left_x, left_y, right_x, right_y, left_trigger, right_trigger
    bool has_range = false;  // Use min/max below instead of the device's absinfo
    int32_t min = 0;
    int32_t max = 0;
};

// Standard slot names, indexed by slot
extern const std::vector<std::string> STANDARD_BUTTON_NAMES;
extern const std::vector<std::string> STANDARD_AXIS_NAMES;

class ControllerConfig {
public:
    ControllerConfig();
    ~ControllerConfig();

    // Built-in mapping for kernel xpad-style gamepads
    static std::shared_ptr<ControllerConfig> standardGamepad();

    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& yaml_text);

    // Check if a device name matches this controller
    bool matchesDevice(const std::string& device_name) const;

    const std::string* getButtonName(unsigned code) const;
    const std::string* getDpadButtonName(unsigned axis_code, int32_t value) const;
    const AxisMapping* getAxisMapping(unsigned code) const;
    bool isDpadAxis(unsigned code) const;

    // Standard slot index for a code, or -1 when unmapped (dpad buttons map to -1)
    int buttonSlot(unsigned code) const;
    int axisSlot(unsigned code) const;

    // Normalize a raw axis value to [-1, 1]. device_min/device_max come from
    // the device and are used when the mapping has no explicit range.
    double normalizeAxis(unsigned code, int32_t raw_value, int32_t device_min, int32_t device_max) const;

    const std::vector<ButtonMapping>& getButtonMappings() const { return buttons_; }
    const std::vector<DpadButtonMapping>& getDpadButtonMappings() const { return dpad_buttons_; }
    const std::vector<AxisMapping>& getAxisMappings() const { return axes_; }
    const std::string& getName() const { return name_; }

private:
    std::string name_;
    std::vector<std::string> vendor_patterns_;
    std::vector<std::string> exclude_patterns_;
    std::vector<ButtonMapping> buttons_;
    std::vector<DpadButtonMapping> dpad_buttons_;
    std::vector<AxisMapping> axes_;

    // Fast lookup maps
    std::unordered_map<unsigned, std::string> button_map_;
    std::unordered_map<unsigned, AxisMapping> axis_map_;
    std::unordered_map<unsigned, std::unordered_map<int32_t, std::string>> dpad_button_map_;  // axis_code -> (value -> name)
    std::unordered_set<unsigned> dpad_axis_codes_;

    void loadFromNode(const YAML::Node& config);
    void buildLookupMaps();
    bool matchesPattern(const std::string& text, const std::vector<std::string>& patterns) const;
};

// Caches loaded mapping files by name
class ConfigManager {
public:
    std::shared_ptr<ControllerConfig> loadConfig(const std::string& config_path);

    // Finds the first *.yaml file in config_dir whose patterns match device_name
    std::shared_ptr<ControllerConfig> detectConfig(const std::string& device_name,
                                                   const std::string& config_dir);

    void registerConfig(const std::string& name, std::shared_ptr<ControllerConfig> config);
    std::shared_ptr<ControllerConfig> getConfig(const std::string& name) const;

private:
    std::unordered_map<std::string, std::shared_ptr<ControllerConfig>> configs_;
};

}  // namespace input_link

#endif // CONTROLLER_CONFIG_HPP

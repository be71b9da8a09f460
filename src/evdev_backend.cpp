/*
 * Evdev Device Backend Implementation
 */

#include "evdev_backend.hpp"
#include "controller_types.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <linux/input.h>
#include <linux/input-event-codes.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

namespace input_link {

namespace {

// Fallback: check if device is a gamepad (has keys and axes)
bool is_generic_gamepad(struct libevdev* dev) {
    return libevdev_has_event_type(dev, EV_KEY) && libevdev_has_event_type(dev, EV_ABS) &&
           (libevdev_has_event_code(dev, EV_KEY, BTN_GAMEPAD) ||
            libevdev_has_event_code(dev, EV_KEY, BTN_JOYSTICK));
}

void append_le16(std::string& out, int value) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "%02x%02x", value & 0xff, (value >> 8) & 0xff);
    out += buf;
    out += "0000";
}

void set_dpad(std::pair<int, int>& hat, const std::string& name, bool pressed) {
    if (!pressed) return;
    if (name == "dpad_left") hat.first = -1;
    else if (name == "dpad_right") hat.first = 1;
    else if (name == "dpad_up") hat.second = 1;
    else if (name == "dpad_down") hat.second = -1;
}

}  // namespace

std::string make_device_guid(int bustype, int vendor, int product, int version) {
    std::string guid;
    append_le16(guid, bustype);
    append_le16(guid, vendor);
    append_le16(guid, product);
    append_le16(guid, version);
    return guid;
}

EvdevBackend::EvdevBackend(std::string config_dir, std::string input_dir, bool grab_devices)
    : config_dir_(std::move(config_dir)), input_dir_(std::move(input_dir)),
      grab_devices_(grab_devices) {
}

EvdevBackend::~EvdevBackend() {
    shutdown();
}

void EvdevBackend::initialize() {
    if (initialized_) return;

    DIR* dir = opendir(input_dir_.c_str());
    if (!dir) {
        throw InitializationError("opendir " + input_dir_ + ": " + std::strerror(errno));
    }
    closedir(dir);

    initialized_ = true;
    log_info("evdev") << "Device backend initialized on " << input_dir_;
}

void EvdevBackend::shutdown() {
    for (auto& device : devices_) {
        closeDevice(device);
    }
    devices_.clear();
    if (initialized_) {
        initialized_ = false;
        log_info("evdev") << "Device backend shut down";
    }
}

bool EvdevBackend::openDevice(const std::string& path, EvdevDevice& out) {
    int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) return false;

    struct libevdev* dev = nullptr;
    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        close(fd);
        return false;
    }

    const char* raw_name = libevdev_get_name(dev);
    std::string name = raw_name ? raw_name : path;

    if (name.compare(0, std::strlen(VIRTUAL_DEVICE_NAME_PREFIX), VIRTUAL_DEVICE_NAME_PREFIX) == 0) {
        libevdev_free(dev);
        close(fd);
        return false;
    }

    // Try to detect controller config, else accept generic gamepads
    auto config = configs_.detectConfig(name, config_dir_);
    if (!config) {
        if (!is_generic_gamepad(dev)) {
            libevdev_free(dev);
            close(fd);
            return false;
        }
        config = ControllerConfig::standardGamepad();
    }

    if (grab_devices_ && libevdev_grab(dev, LIBEVDEV_GRAB) != 0) {
        log_warning("evdev") << "could not grab " << path << " (another process may have it). Events may not appear.";
    }

    out.fd = fd;
    out.path = path;
    out.name = name;
    out.dev = dev;
    out.config = config;
    out.lost = false;
    out.instance_id = next_instance_id_++;
    out.guid = make_device_guid(libevdev_get_id_bustype(dev), libevdev_get_id_vendor(dev),
                                libevdev_get_id_product(dev), libevdev_get_id_version(dev));

    log_info("evdev") << "Opened " << out.name << " (" << path << ") [Config: " << config->getName() << "]";
    return true;
}

void EvdevBackend::closeDevice(EvdevDevice& device) {
    if (device.dev) {
        if (grab_devices_) {
            libevdev_grab(device.dev, LIBEVDEV_UNGRAB);
        }
        libevdev_free(device.dev);
        device.dev = nullptr;
    }
    if (device.fd >= 0) {
        close(device.fd);
        device.fd = -1;
    }
}

void EvdevBackend::drainEvents(EvdevDevice& device) {
    if (!device.dev || device.lost) return;

    struct input_event ev;
    int rc = libevdev_next_event(device.dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
    while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC) {
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            // Dropped events: resync the internal state
            while (rc == LIBEVDEV_READ_STATUS_SYNC) {
                rc = libevdev_next_event(device.dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
            }
        }
        rc = libevdev_next_event(device.dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
    }

    if (rc == -ENODEV) {
        device.lost = true;
        log_info("evdev") << "Device removed: " << device.name << " (" << device.path << ")";
    } else if (rc != -EAGAIN) {
        log_warning("evdev") << "read " << device.path << ": " << std::strerror(-rc);
    }
}

void EvdevBackend::pumpEvents() {
    for (auto& device : devices_) {
        drainEvents(device);
    }
}

std::vector<DeviceInfo> EvdevBackend::enumerateDevices() {
    if (!initialized_) {
        throw InitializationError("device backend not initialized");
    }

    pumpEvents();

    // Drop devices that went away
    for (auto& device : devices_) {
        if (device.lost) closeDevice(device);
    }
    devices_.erase(std::remove_if(devices_.begin(), devices_.end(),
                                  [](const EvdevDevice& d) { return d.dev == nullptr; }),
                   devices_.end());

    DIR* dir = opendir(input_dir_.c_str());
    if (!dir) {
        log_error("evdev") << "opendir " << input_dir_ << ": " << std::strerror(errno);
    } else {
        std::vector<std::string> event_paths;
        struct dirent* ent;
        while ((ent = readdir(dir)) != nullptr) {
            if (std::string(ent->d_name).compare(0, 5, "event") != 0) continue;
            event_paths.push_back(input_dir_ + "/" + ent->d_name);
        }
        closedir(dir);

        for (const auto& path : event_paths) {
            bool already_open = std::any_of(devices_.begin(), devices_.end(),
                                            [&path](const EvdevDevice& d) { return d.path == path; });
            if (already_open) continue;

            EvdevDevice device;
            if (openDevice(path, device)) {
                devices_.push_back(std::move(device));
            }
        }
    }

    std::sort(devices_.begin(), devices_.end(),
              [](const EvdevDevice& a, const EvdevDevice& b) { return a.path < b.path; });

    std::vector<DeviceInfo> out;
    out.reserve(devices_.size());
    for (size_t i = 0; i < devices_.size(); ++i) {
        out.push_back(describe(devices_[i], static_cast<int>(i)));
    }
    return out;
}

DeviceInfo EvdevBackend::describe(const EvdevDevice& device, int index) const {
    DeviceInfo info;
    info.index = index;
    info.instance_id = device.instance_id;
    info.guid = device.guid;
    info.name = device.name;

    for (const auto& axis : device.config->getAxisMappings()) {
        if (libevdev_has_event_code(device.dev, EV_ABS, axis.code)) {
            info.num_axes = std::max(info.num_axes, device.config->axisSlot(axis.code) + 1);
        }
    }
    bool has_dpad = false;
    for (const auto& btn : device.config->getButtonMappings()) {
        if (!libevdev_has_event_code(device.dev, EV_KEY, btn.code)) continue;
        int slot = device.config->buttonSlot(btn.code);
        if (slot >= 0) {
            info.num_buttons = std::max(info.num_buttons, slot + 1);
        } else {
            has_dpad = true;
        }
    }
    for (const auto& dpad : device.config->getDpadButtonMappings()) {
        if (libevdev_has_event_code(device.dev, EV_ABS, dpad.axis_code)) {
            has_dpad = true;
        }
    }
    info.num_hats = has_dpad ? 1 : 0;
    return info;
}

bool EvdevBackend::readState(int index, RawDeviceState& state) {
    if (index < 0 || index >= static_cast<int>(devices_.size())) {
        log_warning("evdev") << "read of unknown device index " << index;
        return false;
    }
    EvdevDevice& device = devices_[index];
    if (!device.dev || device.lost) {
        return false;
    }

    const ControllerConfig& config = *device.config;

    state.axes.assign(STANDARD_AXIS_COUNT, 0.0);
    state.buttons.assign(STANDARD_BUTTON_COUNT, false);
    state.hats.assign(1, {0, 0});

    // Unplugged triggers rest at -1 so they normalize to 0 downstream
    state.axes[4] = -1.0;
    state.axes[5] = -1.0;

    for (const auto& axis : config.getAxisMappings()) {
        const struct input_absinfo* absinfo = libevdev_get_abs_info(device.dev, axis.code);
        if (!absinfo) continue;
        int slot = config.axisSlot(axis.code);
        if (slot < 0) continue;
        int value = libevdev_get_event_value(device.dev, EV_ABS, axis.code);
        state.axes[slot] = config.normalizeAxis(axis.code, value, absinfo->minimum, absinfo->maximum);
    }

    auto& hat = state.hats[0];
    for (const auto& btn : config.getButtonMappings()) {
        if (!libevdev_has_event_code(device.dev, EV_KEY, btn.code)) continue;
        bool pressed = libevdev_get_event_value(device.dev, EV_KEY, btn.code) != 0;
        int slot = config.buttonSlot(btn.code);
        if (slot >= 0) {
            state.buttons[slot] = pressed;
        } else {
            set_dpad(hat, btn.name, pressed);
        }
    }

    for (const auto& dpad : config.getDpadButtonMappings()) {
        if (!libevdev_has_event_code(device.dev, EV_ABS, dpad.axis_code)) continue;
        int value = libevdev_get_event_value(device.dev, EV_ABS, dpad.axis_code);
        set_dpad(hat, dpad.name, value == dpad.value);
    }

    return true;
}

}  // namespace input_link

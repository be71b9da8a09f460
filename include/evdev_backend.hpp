/*
 * Evdev Device Backend
 *
 * Finds gamepads under /dev/input via libevdev (USB and Bluetooth, kernel
 * xpad/hid drivers) and exposes them in the standard gamepad layout.
 */

#ifndef EVDEV_BACKEND_HPP
#define EVDEV_BACKEND_HPP

#include "controller_config.hpp"
#include "device_backend.hpp"

#include <libevdev/libevdev.h>

#include <memory>
#include <string>
#include <vector>

namespace input_link {

struct EvdevDevice {
    int fd = -1;
    std::string path;
    std::string name;
    std::string guid;
    int instance_id = -1;
    bool lost = false;
    libevdev* dev = nullptr;
    std::shared_ptr<ControllerConfig> config;
};

class EvdevBackend : public DeviceBackend {
public:
    explicit EvdevBackend(std::string config_dir = "config/controllers",
                          std::string input_dir = "/dev/input",
                          bool grab_devices = false);
    ~EvdevBackend() override;

    EvdevBackend(const EvdevBackend&) = delete;
    EvdevBackend& operator=(const EvdevBackend&) = delete;

    void initialize() override;
    void shutdown() override;
    void pumpEvents() override;
    std::vector<DeviceInfo> enumerateDevices() override;
    bool readState(int index, RawDeviceState& state) override;

private:
    std::string config_dir_;
    std::string input_dir_;
    bool grab_devices_;
    bool initialized_ = false;
    int next_instance_id_ = 0;
    std::vector<EvdevDevice> devices_;  // sorted by path; position is the enumeration index
    ConfigManager configs_;

    bool openDevice(const std::string& path, EvdevDevice& out);
    void closeDevice(EvdevDevice& device);
    void drainEvents(EvdevDevice& device);
    DeviceInfo describe(const EvdevDevice& device, int index) const;
};

// SDL-style 32 hex digit GUID from bus type, vendor, product and version
std::string make_device_guid(int bustype, int vendor, int product, int version);

}  // namespace input_link

#endif // EVDEV_BACKEND_HPP

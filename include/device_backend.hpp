/*
 * Physical Device Backend
 *
 * Enumeration and raw reads for physical controllers. Devices are addressed
 * by enumeration index; indices are reused when devices come and go, so
 * callers identify devices by guid + instance id across scans.
 *
 * Raw values use the standard gamepad layout:
 *   axes    0 left-x, 1 left-y, 2 right-x, 3 right-y, 4 left trigger, 5 right trigger
 *           all in [-1, 1], Y down positive (hardware convention)
 *   buttons 0 A, 1 B, 2 X, 3 Y, 4 LB, 5 RB, 6 Back, 7 Start, 8 LS, 9 RS
 *   hat 0   (x, y) with x right positive and y up positive
 */

#ifndef DEVICE_BACKEND_HPP
#define DEVICE_BACKEND_HPP

#include <string>
#include <utility>
#include <vector>

namespace input_link {

constexpr int STANDARD_AXIS_COUNT = 6;
constexpr int STANDARD_BUTTON_COUNT = 10;

struct DeviceInfo {
    int index = -1;
    int instance_id = -1;
    std::string guid;
    std::string name;
    int num_axes = 0;
    int num_buttons = 0;
    int num_hats = 0;
};

struct RawDeviceState {
    std::vector<double> axes;
    std::vector<bool> buttons;
    std::vector<std::pair<int, int>> hats;
};

class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    // Throws InitializationError if the backend cannot start. Idempotent.
    virtual void initialize() = 0;
    virtual void shutdown() = 0;

    // Drain pending device events (hot-plug, state changes)
    virtual void pumpEvents() = 0;

    // Currently visible devices, ordered by enumeration index
    virtual std::vector<DeviceInfo> enumerateDevices() = 0;

    // Read current raw state of the device at index. False on read failure.
    virtual bool readState(int index, RawDeviceState& state) = 0;
};

}  // namespace input_link

#endif // DEVICE_BACKEND_HPP

/*
 * uinput Gamepad Implementation
 */

#include "uinput_gamepad.hpp"

#include <linux/input-event-codes.h>

#include <array>
#include <cmath>

namespace input_link {

namespace {

constexpr uint16_t MICROSOFT_VENDOR_ID = 0x045e;
constexpr uint16_t XBOX360_PRODUCT_ID = 0x028e;

constexpr int STICK_MAX = 32767;
constexpr int TRIGGER_MAX = 255;

// BUTTON_FIELDS order; -1 for the d-pad, which goes out as HAT0
const std::array<int, 14> BUTTON_CODES = {{
    BTN_A, BTN_B, BTN_X, BTN_Y,
    BTN_TL, BTN_TR,
    BTN_SELECT, BTN_START,
    BTN_THUMBL, BTN_THUMBR,
    -1, -1, -1, -1,
}};

// AXIS_FIELDS order
const std::array<int, 6> AXIS_CODES = {{
    ABS_X, ABS_Y, ABS_RX, ABS_RY, ABS_Z, ABS_RZ,
}};

}  // namespace

int gamepad_axis_value(size_t index, double value) {
    switch (index) {
        case 0:
        case 2:
            return static_cast<int>(std::lround(value * STICK_MAX));
        case 1:
        case 3:
            return static_cast<int>(std::lround(-value * STICK_MAX));
        default:
            return static_cast<int>(std::lround(value * TRIGGER_MAX));
    }
}

UinputGamepad::UinputGamepad(int controller_number)
    : VirtualController(controller_number),
      device_(std::string(VIRTUAL_DEVICE_NAME_PREFIX) + "Virtual Controller " + std::to_string(controller_number),
              MICROSOFT_VENDOR_ID, XBOX360_PRODUCT_ID) {
}

UinputGamepad::~UinputGamepad() {
    disconnect();
}

bool UinputGamepad::openDevice() {
    std::vector<int> keys;
    for (int code : BUTTON_CODES) {
        if (code >= 0) keys.push_back(code);
    }

    std::vector<UinputAxis> axes = {
        {ABS_X, -32768, STICK_MAX},
        {ABS_Y, -32768, STICK_MAX},
        {ABS_RX, -32768, STICK_MAX},
        {ABS_RY, -32768, STICK_MAX},
        {ABS_Z, 0, TRIGGER_MAX},
        {ABS_RZ, 0, TRIGGER_MAX},
        {ABS_HAT0X, -1, 1},
        {ABS_HAT0Y, -1, 1},
    };
    return device_.create(keys, axes);
}

void UinputGamepad::closeDevice() {
    device_.destroy();
}

bool UinputGamepad::setButton(size_t index, bool pressed) {
    if (index >= BUTTON_CODES.size()) return false;
    int code = BUTTON_CODES[index];
    if (code < 0) return updateHat();
    return device_.emit(EV_KEY, code, pressed ? 1 : 0);
}

bool UinputGamepad::updateHat() {
    const ButtonState& buttons = appliedButtons();
    int x = (buttons.dpad_right ? 1 : 0) - (buttons.dpad_left ? 1 : 0);
    int y = (buttons.dpad_down ? 1 : 0) - (buttons.dpad_up ? 1 : 0);
    return device_.emit(EV_ABS, ABS_HAT0X, x) && device_.emit(EV_ABS, ABS_HAT0Y, y);
}

bool UinputGamepad::setAxis(size_t index, double value) {
    if (index >= AXIS_CODES.size()) return false;
    return device_.emit(EV_ABS, AXIS_CODES[index], gamepad_axis_value(index, value));
}

bool UinputGamepad::flush() {
    return device_.sync();
}

}  // namespace input_link

/*
 * uinput Keyboard Implementation
 */

#include "uinput_keyboard.hpp"
#include "logging.hpp"

#include <linux/input-event-codes.h>

#include <array>

namespace input_link {

namespace {

// BUTTON_FIELDS order
const std::array<int, 14> BUTTON_KEYS = {{
    KEY_Z, KEY_X, KEY_C, KEY_V,
    KEY_Q, KEY_E,
    KEY_TAB, KEY_ENTER,
    KEY_F, KEY_G,
    KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT,
}};

// AXIS_FIELDS order
const std::array<AxisKeys, 6> AXIS_KEYS = {{
    {KEY_A, KEY_D},
    {KEY_S, KEY_W},
    {KEY_J, KEY_L},
    {KEY_K, KEY_I},
    {-1, KEY_R},
    {-1, KEY_T},
}};

}  // namespace

AxisKeys keyboard_axis_keys(size_t index) {
    if (index >= AXIS_KEYS.size()) return AxisKeys{-1, -1};
    return AXIS_KEYS[index];
}

int keyboard_button_key(size_t index) {
    return index < BUTTON_KEYS.size() ? BUTTON_KEYS[index] : -1;
}

UinputKeyboard::UinputKeyboard(int controller_number)
    : VirtualController(controller_number),
      device_(std::string(VIRTUAL_DEVICE_NAME_PREFIX) + "Keyboard " + std::to_string(controller_number), 0, 0) {
}

UinputKeyboard::~UinputKeyboard() {
    disconnect();
}

bool UinputKeyboard::openDevice() {
    std::vector<int> keys(BUTTON_KEYS.begin(), BUTTON_KEYS.end());
    for (const auto& axis : AXIS_KEYS) {
        if (axis.negative >= 0) keys.push_back(axis.negative);
        if (axis.positive >= 0) keys.push_back(axis.positive);
    }
    pressed_.clear();
    return device_.create(keys, {});
}

void UinputKeyboard::closeDevice() {
    for (int code : std::set<int>(pressed_)) {
        setKey(code, false);
    }
    if (!pressed_.empty() || !device_.sync()) {
        log_warning("virtual") << "keyboard " << controllerNumber() << " closed with keys still down";
    }
    device_.destroy();
    pressed_.clear();
}

bool UinputKeyboard::setKey(int code, bool down) {
    if (code < 0) return true;
    bool is_down = pressed_.count(code) > 0;
    if (is_down == down) return true;

    if (!device_.emit(EV_KEY, code, down ? 1 : 0)) return false;
    if (down) {
        pressed_.insert(code);
    } else {
        pressed_.erase(code);
    }
    return true;
}

bool UinputKeyboard::setButton(size_t index, bool pressed) {
    if (index >= BUTTON_KEYS.size()) return false;
    return setKey(BUTTON_KEYS[index], pressed);
}

bool UinputKeyboard::setAxis(size_t index, double value) {
    if (index >= AXIS_KEYS.size()) return false;
    const AxisKeys& keys = AXIS_KEYS[index];
    double threshold = keys.negative < 0 ? KEYBOARD_TRIGGER_THRESHOLD : KEYBOARD_STICK_THRESHOLD;

    bool ok = setKey(keys.negative, value < -threshold);
    return setKey(keys.positive, value > threshold) && ok;
}

bool UinputKeyboard::flush() {
    return device_.sync();
}

}  // namespace input_link

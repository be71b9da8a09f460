/*
 * uinput Keyboard
 *
 * Fallback binding that plays the controller on a virtual keyboard:
 *
 *   A Z   B X   X C   Y V   LB Q   RB E   Back Tab   Start Enter
 *   LS F   RS G   d-pad arrows   left stick WASD   right stick IJKL
 *   LT R   RT T
 *
 * Sticks press beyond 0.3 deflection, triggers above 0.1.
 */

#ifndef UINPUT_KEYBOARD_HPP
#define UINPUT_KEYBOARD_HPP

#include "uinput_device.hpp"
#include "virtual_controller.hpp"

#include <set>

namespace input_link {

constexpr double KEYBOARD_STICK_THRESHOLD = 0.3;
constexpr double KEYBOARD_TRIGGER_THRESHOLD = 0.1;

struct AxisKeys {
    int negative;  // -1 for none
    int positive;
};

// Key codes for an axis (index into AXIS_FIELDS). Stick Y is up-positive.
AxisKeys keyboard_axis_keys(size_t index);

// Key code for a button (index into BUTTON_FIELDS)
int keyboard_button_key(size_t index);

class UinputKeyboard : public VirtualController {
public:
    explicit UinputKeyboard(int controller_number);
    ~UinputKeyboard() override;

    const char* backendName() const override { return "keyboard"; }

protected:
    bool openDevice() override;
    void closeDevice() override;
    bool setButton(size_t index, bool pressed) override;
    bool setAxis(size_t index, double value) override;
    bool flush() override;

private:
    bool setKey(int code, bool down);

    UinputDevice device_;
    std::set<int> pressed_;
};

}  // namespace input_link

#endif // UINPUT_KEYBOARD_HPP

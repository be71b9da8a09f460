/*
 * uinput Gamepad
 *
 * Virtual Xbox 360 layout pad. Sticks use [-32768, 32767] with evdev's
 * "down is positive" Y, triggers [0, 255], the d-pad is HAT0.
 */

#ifndef UINPUT_GAMEPAD_HPP
#define UINPUT_GAMEPAD_HPP

#include "uinput_device.hpp"
#include "virtual_controller.hpp"

namespace input_link {

class UinputGamepad : public VirtualController {
public:
    explicit UinputGamepad(int controller_number);
    ~UinputGamepad() override;

    const char* backendName() const override { return "gamepad"; }

protected:
    bool openDevice() override;
    void closeDevice() override;
    bool setButton(size_t index, bool pressed) override;
    bool setAxis(size_t index, double value) override;
    bool flush() override;

private:
    bool updateHat();

    UinputDevice device_;
};

// evdev value for a normalized axis (index into AXIS_FIELDS)
int gamepad_axis_value(size_t index, double value);

}  // namespace input_link

#endif // UINPUT_GAMEPAD_HPP

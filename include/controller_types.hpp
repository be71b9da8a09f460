/*
 * Controller Data Model
 *
 * Normalized button/axis state, a single input sample and the snapshot of a
 * detected physical device.
 */

#ifndef CONTROLLER_TYPES_HPP
#define CONTROLLER_TYPES_HPP

#include <array>
#include <optional>
#include <string>

namespace input_link {

constexpr int MIN_CONTROLLER_NUMBER = 1;
constexpr int MAX_CONTROLLER_NUMBER = 8;

inline bool is_valid_controller_number(int number) {
    return number >= MIN_CONTROLLER_NUMBER && number <= MAX_CONTROLLER_NUMBER;
}

// Names of the virtual devices this program creates start with this;
// the capture side skips them
constexpr const char* VIRTUAL_DEVICE_NAME_PREFIX = "Input Link ";

enum class InputMethod {
    XInput,
    DInput
};

const char* to_string(InputMethod method);
bool parse_input_method(const std::string& text, InputMethod& out);

struct ButtonState {
    bool a = false;
    bool b = false;
    bool x = false;
    bool y = false;
    bool lb = false;
    bool rb = false;
    bool back = false;
    bool start = false;
    bool ls = false;  // left stick click
    bool rs = false;  // right stick click
    bool dpad_up = false;
    bool dpad_down = false;
    bool dpad_left = false;
    bool dpad_right = false;

    bool operator==(const ButtonState& other) const;
    bool operator!=(const ButtonState& other) const { return !(*this == other); }
    bool anyPressed() const;
};

struct ButtonField {
    const char* name;
    bool ButtonState::*member;
};

// All buttons in wire order
extern const std::array<ButtonField, 14> BUTTON_FIELDS;

// Sticks are kept in [-1, 1], triggers in [0, 1]
struct AxisState {
    double left_stick_x = 0.0;
    double left_stick_y = 0.0;
    double right_stick_x = 0.0;
    double right_stick_y = 0.0;
    double left_trigger = 0.0;
    double right_trigger = 0.0;

    AxisState() = default;
    AxisState(double lx, double ly, double rx, double ry, double lt, double rt);

    void clamp();
    bool operator==(const AxisState& other) const;
    bool operator!=(const AxisState& other) const { return !(*this == other); }
};

struct AxisField {
    const char* name;
    double AxisState::*member;
    double min;
    double max;
};

extern const std::array<AxisField, 6> AXIS_FIELDS;

struct ControllerInputData {
    int controller_number = MIN_CONTROLLER_NUMBER;
    std::string controller_id;
    InputMethod input_method = InputMethod::XInput;
    ButtonState buttons;
    AxisState axes;
    double timestamp = 0.0;  // Unix epoch seconds

    // Throws ValidationError if the number is outside [1, 8] or the id is blank
    void validate() const;
};

enum class ConnectionState {
    Connected,
    Disconnected,
    Error
};

const char* to_string(ConnectionState state);

struct DetectedController {
    int device_index = -1;  // enumeration index of the last scan that saw it
    int device_id = -1;     // per-session instance id
    std::string name;
    std::string guid;
    int num_axes = 0;
    int num_buttons = 0;
    int num_hats = 0;
    ConnectionState state = ConnectionState::Connected;
    std::optional<int> assigned_number;
    InputMethod preferred_input_method = InputMethod::XInput;

    std::string identifier() const { return guid + "_" + std::to_string(device_id); }

    bool isXboxController() const;
    bool isPlayStationController() const;
    InputMethod getRecommendedInputMethod() const;
};

double now_epoch_seconds();

// Strips leading/trailing whitespace
std::string trim(const std::string& text);

}  // namespace input_link

#endif // CONTROLLER_TYPES_HPP

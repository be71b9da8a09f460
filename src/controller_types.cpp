/*
 * Controller Data Model Implementation
 */

#include "controller_types.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace input_link {

namespace {

bool name_contains_any(const std::string& name, std::initializer_list<const char*> keywords) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    for (const char* keyword : keywords) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double clamp_value(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

}  // namespace

const std::array<ButtonField, 14> BUTTON_FIELDS = {{
    {"a", &ButtonState::a},
    {"b", &ButtonState::b},
    {"x", &ButtonState::x},
    {"y", &ButtonState::y},
    {"lb", &ButtonState::lb},
    {"rb", &ButtonState::rb},
    {"back", &ButtonState::back},
    {"start", &ButtonState::start},
    {"ls", &ButtonState::ls},
    {"rs", &ButtonState::rs},
    {"dpad_up", &ButtonState::dpad_up},
    {"dpad_down", &ButtonState::dpad_down},
    {"dpad_left", &ButtonState::dpad_left},
    {"dpad_right", &ButtonState::dpad_right},
}};

const std::array<AxisField, 6> AXIS_FIELDS = {{
    {"left_stick_x", &AxisState::left_stick_x, -1.0, 1.0},
    {"left_stick_y", &AxisState::left_stick_y, -1.0, 1.0},
    {"right_stick_x", &AxisState::right_stick_x, -1.0, 1.0},
    {"right_stick_y", &AxisState::right_stick_y, -1.0, 1.0},
    {"left_trigger", &AxisState::left_trigger, 0.0, 1.0},
    {"right_trigger", &AxisState::right_trigger, 0.0, 1.0},
}};

const char* to_string(InputMethod method) {
    return method == InputMethod::XInput ? "xinput" : "dinput";
}

bool parse_input_method(const std::string& text, InputMethod& out) {
    if (text == "xinput") {
        out = InputMethod::XInput;
        return true;
    }
    if (text == "dinput") {
        out = InputMethod::DInput;
        return true;
    }
    return false;
}

bool ButtonState::operator==(const ButtonState& other) const {
    for (const auto& field : BUTTON_FIELDS) {
        if (this->*field.member != other.*field.member) return false;
    }
    return true;
}

bool ButtonState::anyPressed() const {
    for (const auto& field : BUTTON_FIELDS) {
        if (this->*field.member) return true;
    }
    return false;
}

AxisState::AxisState(double lx, double ly, double rx, double ry, double lt, double rt)
    : left_stick_x(lx), left_stick_y(ly), right_stick_x(rx), right_stick_y(ry),
      left_trigger(lt), right_trigger(rt) {
    clamp();
}

void AxisState::clamp() {
    for (const auto& field : AXIS_FIELDS) {
        this->*field.member = clamp_value(this->*field.member, field.min, field.max);
    }
}

bool AxisState::operator==(const AxisState& other) const {
    for (const auto& field : AXIS_FIELDS) {
        if (this->*field.member != other.*field.member) return false;
    }
    return true;
}

void ControllerInputData::validate() const {
    if (!is_valid_controller_number(controller_number)) {
        throw ValidationError("controller_number " + std::to_string(controller_number) +
                              " outside [" + std::to_string(MIN_CONTROLLER_NUMBER) + ", " +
                              std::to_string(MAX_CONTROLLER_NUMBER) + "]");
    }
    if (trim(controller_id).empty()) {
        throw ValidationError("controller_id cannot be empty or whitespace");
    }
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Error: return "error";
    }
    return "unknown";
}

bool DetectedController::isXboxController() const {
    return name_contains_any(name, {"xbox", "x360", "xinput", "360 controller", "x-box"});
}

bool DetectedController::isPlayStationController() const {
    return name_contains_any(name, {"playstation", "ps3", "ps4", "ps5", "dualshock", "dualsense"});
}

InputMethod DetectedController::getRecommendedInputMethod() const {
    return isXboxController() ? InputMethod::XInput : InputMethod::DInput;
}

double now_epoch_seconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

}  // namespace input_link

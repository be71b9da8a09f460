/*
 * Virtual Controller Implementation
 */

#include "virtual_controller.hpp"
#include "logging.hpp"

#ifdef __linux__
#include "uinput_gamepad.hpp"
#include "uinput_keyboard.hpp"
#endif

namespace input_link {

namespace {

const char* LOG_TAG = "virtual";

}  // namespace

VirtualController::VirtualController(int controller_number)
    : controller_number_(controller_number), connected_(false) {
}

bool VirtualController::connect() {
    if (connected_) return true;

    if (!openDevice()) {
        log_error(LOG_TAG) << "failed to open " << backendName() << " device for controller " << controller_number_;
        return false;
    }
    applied_buttons_ = ButtonState();
    applied_axes_ = AxisState();
    connected_ = true;
    log_info(LOG_TAG) << backendName() << " controller " << controller_number_ << " connected";
    return true;
}

void VirtualController::disconnect() {
    if (!connected_) return;

    resetState();
    closeDevice();
    connected_ = false;
    log_info(LOG_TAG) << backendName() << " controller " << controller_number_ << " disconnected";
}

bool VirtualController::updateState(const ControllerInputData& input_data) {
    if (!connected_) return false;
    return apply(input_data.buttons, input_data.axes);
}

void VirtualController::resetState() {
    if (!connected_) return;
    if (!apply(ButtonState(), AxisState())) {
        log_warning(LOG_TAG) << "controller " << controller_number_ << " did not fully reset";
    } else {
        log_debug(LOG_TAG) << "controller " << controller_number_ << " reset to neutral state";
    }
}

bool VirtualController::apply(const ButtonState& buttons, const AxisState& axes) {
    ButtonState previous_buttons = applied_buttons_;
    AxisState previous_axes = applied_axes_;

    bool ok = true;
    bool changed = false;

    // A field keeps its old snapshot value when the write fails, so the
    // next update sees it as changed and retries.
    for (size_t i = 0; i < BUTTON_FIELDS.size(); ++i) {
        bool ButtonState::*member = BUTTON_FIELDS[i].member;
        bool pressed = buttons.*member;
        if (pressed == applied_buttons_.*member) continue;
        changed = true;
        applied_buttons_.*member = pressed;
        if (!setButton(i, pressed)) {
            applied_buttons_.*member = !pressed;
            ok = false;
        }
    }

    for (size_t i = 0; i < AXIS_FIELDS.size(); ++i) {
        double AxisState::*member = AXIS_FIELDS[i].member;
        double value = axes.*member;
        if (value == applied_axes_.*member) continue;
        changed = true;
        double old_value = applied_axes_.*member;
        applied_axes_.*member = value;
        if (!setAxis(i, value)) {
            applied_axes_.*member = old_value;
            ok = false;
        }
    }

    if (changed && !flush()) {
        applied_buttons_ = previous_buttons;
        applied_axes_ = previous_axes;
        ok = false;
    }
    return ok;
}

VirtualControllerFactory::VirtualControllerFactory() {
#ifdef __linux__
    registerBackend("gamepad", [](int number) -> std::unique_ptr<VirtualController> {
        return std::make_unique<UinputGamepad>(number);
    });
    registerBackend("keyboard", [](int number) -> std::unique_ptr<VirtualController> {
        return std::make_unique<UinputKeyboard>(number);
    });
#endif
}

void VirtualControllerFactory::registerBackend(const std::string& name, VirtualControllerCreator creator) {
    creators_[name] = std::move(creator);
}

bool VirtualControllerFactory::hasBackend(const std::string& name) const {
    return creators_.count(name) > 0;
}

std::vector<std::string> VirtualControllerFactory::backendNames() const {
    std::vector<std::string> names;
    for (const auto& entry : creators_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string VirtualControllerFactory::defaultBackend() {
#ifdef __linux__
    return "gamepad";
#else
    return std::string();
#endif
}

std::unique_ptr<VirtualController> VirtualControllerFactory::create(const std::string& backend,
                                                                    int controller_number) const {
    std::string name = (backend.empty() || backend == "auto") ? defaultBackend() : backend;
    if (name.empty()) {
        log_error(LOG_TAG) << "no virtual controller backend for this platform";
        return nullptr;
    }

    auto it = creators_.find(name);
    if (it == creators_.end()) {
        log_error(LOG_TAG) << "unknown virtual controller backend '" << name << "'";
        return nullptr;
    }
    return it->second(controller_number);
}

}  // namespace input_link

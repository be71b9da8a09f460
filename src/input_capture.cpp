/*
 * Input Capture Engine Implementation
 */

#include "input_capture.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>

namespace input_link {

InputCaptureEngine::InputCaptureEngine(ControllerRegistry& registry, InputCaptureConfig config,
                                       InputCallback callback)
    : registry_(registry), config_(config), callback_(std::move(callback)),
      queue_(config.max_queue_size) {
    if (config_.polling_rate <= 0) {
        config_.polling_rate = 60;
    }
}

InputCaptureEngine::~InputCaptureEngine() {
    stopCapture();
}

void InputCaptureEngine::startCapture() {
    if (running_.load()) {
        log_warning("capture") << "Input capture is already running";
        return;
    }

    running_.store(true);
    capture_thread_ = std::thread(&InputCaptureEngine::captureLoop, this);
    log_info("capture") << "Input capture started at " << config_.polling_rate << " Hz";
}

void InputCaptureEngine::stopCapture() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }
    log_info("capture") << "Input capture stopped";
}

std::optional<ControllerInputData> InputCaptureEngine::getInputData(std::chrono::milliseconds timeout) {
    return queue_.pop(timeout);
}

std::optional<ControllerInputData> InputCaptureEngine::getCurrentState(const std::string& controller_id) const {
    std::lock_guard<std::mutex> lock(states_mutex_);
    auto it = previous_states_.find(controller_id);
    if (it == previous_states_.end()) return std::nullopt;
    return it->second;
}

void InputCaptureEngine::sleepFor(std::chrono::steady_clock::duration duration) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

void InputCaptureEngine::captureLoop() {
    const auto poll_interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / config_.polling_rate));

    while (running_.load()) {
        auto start_time = std::chrono::steady_clock::now();

        try {
            pollOnce();
        } catch (const std::exception& e) {
            log_error("capture") << "Error in capture loop: " << e.what();
            sleepFor(std::chrono::milliseconds(100));
            continue;
        }

        // Maintain polling rate; skip sleeping when the tick overran
        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (elapsed < poll_interval) {
            sleepFor(poll_interval - elapsed);
        }
    }
}

int InputCaptureEngine::pollOnce() {
    // Catch hot-plug and refresh device state
    registry_.pumpEvents();

    int emitted = 0;
    for (const auto& controller : registry_.getConnectedControllers()) {
        if (!controller.assigned_number) {
            continue;  // Skip unassigned controllers
        }

        RawDeviceState raw;
        ControllerInputData sample;
        try {
            if (!registry_.readState(controller, raw)) {
                if (read_failures_.insert(controller.identifier()).second) {
                    log_warning("capture") << "Failed to read " << controller.name << ", skipping until it recovers";
                } else {
                    log_debug("capture") << "Failed to read " << controller.name << ", skipping this tick";
                }
                continue;
            }
            read_failures_.erase(controller.identifier());
            sample = buildSample(controller, raw);
        } catch (const std::exception& e) {
            log_error("capture") << "Error capturing input from " << controller.name << ": " << e.what();
            continue;
        }

        bool changed = true;
        {
            std::lock_guard<std::mutex> lock(states_mutex_);
            auto it = previous_states_.find(sample.controller_id);
            if (it != previous_states_.end() && !config_.enable_button_repeat) {
                changed = stateChanged(it->second, sample);
            }
            if (changed) {
                previous_states_[sample.controller_id] = sample;
            }
        }

        if (changed) {
            emit(sample);
            ++emitted;
        }
    }
    return emitted;
}

void InputCaptureEngine::emit(const ControllerInputData& sample) {
    if (config_.queue_samples && queue_.pushDropOldest(sample)) {
        log_debug("capture") << "Input queue full, dropped oldest sample";
    }

    if (callback_) {
        try {
            callback_(sample);
        } catch (const std::exception& e) {
            log_error("capture") << "Error in input callback: " << e.what();
        }
    }
}

ControllerInputData InputCaptureEngine::buildSample(const DetectedController& controller,
                                                    const RawDeviceState& raw) const {
    ControllerInputData sample;
    sample.controller_number = controller.assigned_number.value_or(MIN_CONTROLLER_NUMBER);
    sample.controller_id = controller.identifier();
    sample.input_method = controller.preferred_input_method;
    sample.timestamp = now_epoch_seconds();

    auto button = [&raw](size_t i) { return i < raw.buttons.size() && raw.buttons[i]; };
    auto axis = [&raw](size_t i) { return i < raw.axes.size() ? raw.axes[i] : 0.0; };

    ButtonState& buttons = sample.buttons;
    if (controller.num_buttons >= STANDARD_BUTTON_COUNT) {
        buttons.a = button(0);
        buttons.b = button(1);
        buttons.x = button(2);
        buttons.y = button(3);
        buttons.lb = button(4);
        buttons.rb = button(5);
        buttons.back = button(6);
        buttons.start = button(7);
        buttons.ls = button(8);
        buttons.rs = button(9);
    }

    // D-pad from hat
    if (controller.num_hats > 0 && !raw.hats.empty()) {
        const auto& hat = raw.hats[0];
        buttons.dpad_left = hat.first < 0;
        buttons.dpad_right = hat.first > 0;
        buttons.dpad_up = hat.second > 0;
        buttons.dpad_down = hat.second < 0;
    }

    double lx = 0.0, ly = 0.0, rx = 0.0, ry = 0.0, lt = 0.0, rt = 0.0;
    if (controller.num_axes >= 2) {
        lx = applyDeadZone(axis(0));
        ly = -applyDeadZone(axis(1));  // Invert Y axis
    }
    if (controller.num_axes >= 4) {
        rx = applyDeadZone(axis(2));
        ry = -applyDeadZone(axis(3));
    }
    if (controller.num_axes >= 6) {
        lt = normalizeTrigger(axis(4));
        rt = normalizeTrigger(axis(5));
    }
    sample.axes = AxisState(lx, ly, rx, ry, lt, rt);

    return sample;
}

double InputCaptureEngine::applyDeadZone(double value, double dead_zone) {
    if (std::fabs(value) < dead_zone) {
        return 0.0;
    }

    // Scale beyond dead zone to maintain full range
    double sign = value >= 0.0 ? 1.0 : -1.0;
    double scaled = (std::fabs(value) - dead_zone) / (1.0 - dead_zone);
    return sign * std::min(1.0, scaled);
}

double InputCaptureEngine::normalizeTrigger(double raw) {
    return std::max(0.0, (raw + 1.0) / 2.0);
}

bool InputCaptureEngine::stateChanged(const ControllerInputData& previous, const ControllerInputData& current) {
    if (previous.buttons != current.buttons) {
        return true;
    }
    for (const auto& field : AXIS_FIELDS) {
        if (std::fabs(previous.axes.*field.member - current.axes.*field.member) > AXIS_CHANGE_THRESHOLD) {
            return true;
        }
    }
    return false;
}

}  // namespace input_link

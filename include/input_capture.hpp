/*
 * Input Capture Engine
 *
 * Polls every connected, numbered controller on a background thread at a
 * fixed rate, normalizes sticks/triggers and emits a sample only when the
 * state meaningfully changed. Samples go to a bounded queue that drops the
 * oldest entry on overflow, and to an optional synchronous callback.
 */

#ifndef INPUT_CAPTURE_HPP
#define INPUT_CAPTURE_HPP

#include "bounded_queue.hpp"
#include "controller_registry.hpp"
#include "controller_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace input_link {

// Axis differences at or below this are treated as noise
constexpr double AXIS_CHANGE_THRESHOLD = 0.01;

struct InputCaptureConfig {
    int polling_rate = 60;  // Hz
    double dead_zone = 0.1;
    bool enable_button_repeat = false;
    size_t max_queue_size = 1000;
    // Off for consumers that only use the callback; getInputData() then
    // never yields anything
    bool queue_samples = true;
};

class InputCaptureEngine {
public:
    using InputCallback = std::function<void(const ControllerInputData&)>;

    InputCaptureEngine(ControllerRegistry& registry,
                       InputCaptureConfig config = InputCaptureConfig(),
                       InputCallback callback = nullptr);
    ~InputCaptureEngine();

    InputCaptureEngine(const InputCaptureEngine&) = delete;
    InputCaptureEngine& operator=(const InputCaptureEngine&) = delete;

    void startCapture();
    void stopCapture();
    bool isRunning() const { return running_.load(); }

    // Next queued sample, or nothing after timeout
    std::optional<ControllerInputData> getInputData(std::chrono::milliseconds timeout = std::chrono::milliseconds(100));

    // Last emitted sample for a controller identifier
    std::optional<ControllerInputData> getCurrentState(const std::string& controller_id) const;

    size_t queueSize() const { return queue_.size(); }
    const InputCaptureConfig& config() const { return config_; }

    // One polling tick: pump, read, normalize, diff, emit. Returns samples emitted.
    int pollOnce();

    double applyDeadZone(double value) const { return applyDeadZone(value, config_.dead_zone); }
    static double applyDeadZone(double value, double dead_zone);
    static double normalizeTrigger(double raw);
    static bool stateChanged(const ControllerInputData& previous, const ControllerInputData& current);

    ControllerInputData buildSample(const DetectedController& controller, const RawDeviceState& raw) const;

private:
    ControllerRegistry& registry_;
    InputCaptureConfig config_;
    InputCallback callback_;

    std::atomic<bool> running_{false};
    std::thread capture_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    BoundedQueue<ControllerInputData> queue_;

    mutable std::mutex states_mutex_;
    std::map<std::string, ControllerInputData> previous_states_;

    // Identifiers whose last read failed; warned once per outage
    std::set<std::string> read_failures_;

    void captureLoop();
    void emit(const ControllerInputData& sample);
    void sleepFor(std::chrono::steady_clock::duration duration);
};

}  // namespace input_link

#endif // INPUT_CAPTURE_HPP

/*
 * Input Capture Tests
 */

#include "fakes.hpp"
#include "input_capture.hpp"
#include "logging.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace input_link;
using input_link::testing::FakeBackend;
using input_link::testing::FakeDevices;

namespace {

const char* GUID = "030000005e0400008e02000014010000";

class CaptureTest : public ::testing::Test {
protected:
    CaptureTest()
        : devices_(std::make_shared<FakeDevices>()),
          registry_(std::make_unique<FakeBackend>(devices_)) {
        devices_->add(0, GUID, "Xbox 360 Controller");
        registry_.scanControllers();
    }

    std::shared_ptr<FakeDevices> devices_;
    ControllerRegistry registry_;
};

}  // namespace

TEST(DeadZone, ZeroInsideAndRescaledOutside) {
    EXPECT_DOUBLE_EQ(InputCaptureEngine::applyDeadZone(0.05, 0.1), 0.0);
    EXPECT_DOUBLE_EQ(InputCaptureEngine::applyDeadZone(-0.099, 0.1), 0.0);
    EXPECT_NEAR(InputCaptureEngine::applyDeadZone(0.55, 0.1), 0.5, 1e-9);
    EXPECT_NEAR(InputCaptureEngine::applyDeadZone(-0.55, 0.1), -0.5, 1e-9);
    EXPECT_DOUBLE_EQ(InputCaptureEngine::applyDeadZone(1.0, 0.1), 1.0);
    EXPECT_DOUBLE_EQ(InputCaptureEngine::applyDeadZone(-1.0, 0.1), -1.0);
}

TEST(DeadZone, TriggerNormalization) {
    EXPECT_DOUBLE_EQ(InputCaptureEngine::normalizeTrigger(-1.0), 0.0);
    EXPECT_DOUBLE_EQ(InputCaptureEngine::normalizeTrigger(0.0), 0.5);
    EXPECT_DOUBLE_EQ(InputCaptureEngine::normalizeTrigger(1.0), 1.0);
}

TEST(StateChanged, SmallAxisJitterIsIgnored) {
    ControllerInputData previous = input_link::testing::make_input(1);
    ControllerInputData current = previous;
    current.axes.left_stick_x = 0.005;
    EXPECT_FALSE(InputCaptureEngine::stateChanged(previous, current));
    current.axes.left_stick_x = 0.02;
    EXPECT_TRUE(InputCaptureEngine::stateChanged(previous, current));
    current = previous;
    current.buttons.start = true;
    EXPECT_TRUE(InputCaptureEngine::stateChanged(previous, current));
}

TEST_F(CaptureTest, EmitsOnlyOnChange) {
    std::vector<ControllerInputData> seen;
    InputCaptureEngine engine(registry_, InputCaptureConfig(),
                              [&seen](const ControllerInputData& data) { seen.push_back(data); });

    EXPECT_EQ(engine.pollOnce(), 1);  // first sample always goes out
    EXPECT_EQ(engine.pollOnce(), 0);

    devices_->update(0, [](RawDeviceState& state) { state.buttons[0] = true; });
    EXPECT_EQ(engine.pollOnce(), 1);
    EXPECT_EQ(engine.pollOnce(), 0);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[0].buttons.a);
    EXPECT_TRUE(seen[1].buttons.a);
    EXPECT_EQ(seen[1].controller_number, 1);
    EXPECT_EQ(engine.queueSize(), 2u);

    auto current = engine.getCurrentState(seen[1].controller_id);
    ASSERT_TRUE(current);
    EXPECT_TRUE(current->buttons.a);
}

TEST_F(CaptureTest, ButtonRepeatEmitsEveryTick) {
    InputCaptureConfig config;
    config.enable_button_repeat = true;
    InputCaptureEngine engine(registry_, config);
    EXPECT_EQ(engine.pollOnce(), 1);
    EXPECT_EQ(engine.pollOnce(), 1);
}

TEST_F(CaptureTest, NormalizesSticksTriggersAndHat) {
    InputCaptureEngine engine(registry_);
    devices_->update(0, [](RawDeviceState& state) {
        state.axes[0] = 0.05;   // inside dead zone
        state.axes[1] = 1.0;    // pushed down in hardware terms
        state.axes[3] = -1.0;   // right stick up
        state.axes[4] = 1.0;    // left trigger fully pressed
        state.hats[0] = {-1, 1};
    });
    engine.pollOnce();
    auto sample = engine.getInputData(std::chrono::milliseconds(10));
    ASSERT_TRUE(sample);
    EXPECT_DOUBLE_EQ(sample->axes.left_stick_x, 0.0);
    EXPECT_DOUBLE_EQ(sample->axes.left_stick_y, -1.0);
    EXPECT_DOUBLE_EQ(sample->axes.right_stick_y, 1.0);
    EXPECT_DOUBLE_EQ(sample->axes.left_trigger, 1.0);
    EXPECT_DOUBLE_EQ(sample->axes.right_trigger, 0.0);
    EXPECT_TRUE(sample->buttons.dpad_left);
    EXPECT_TRUE(sample->buttons.dpad_up);
    EXPECT_FALSE(sample->buttons.dpad_right);
    EXPECT_FALSE(sample->buttons.dpad_down);
    EXPECT_EQ(sample->input_method, InputMethod::XInput);
}

TEST_F(CaptureTest, UnassignedControllersAreSkipped) {
    auto controllers = registry_.getConnectedControllers();
    registry_.unassignController(controllers[0].identifier());
    InputCaptureEngine engine(registry_);
    EXPECT_EQ(engine.pollOnce(), 0);
}

TEST_F(CaptureTest, ReadFailureSkipsTick) {
    InputCaptureEngine engine(registry_);
    devices_->fail_reads = true;
    EXPECT_EQ(engine.pollOnce(), 0);
    devices_->fail_reads = false;
    EXPECT_EQ(engine.pollOnce(), 1);
}

TEST_F(CaptureTest, LostDeviceWarnsOncePerOutage) {
    std::vector<LogLevel> levels;
    LogLevel saved_level = getLogLevel();
    setLogLevel(LogLevel::Debug);
    setLogCallback([&levels](LogLevel level, const std::string& line) {
        if (line.find("Failed to read") != std::string::npos) levels.push_back(level);
    });

    InputCaptureEngine engine(registry_);
    devices_->fail_reads = true;
    for (int i = 0; i < 5; ++i) {
        engine.pollOnce();
    }
    devices_->fail_reads = false;
    engine.pollOnce();
    devices_->fail_reads = true;
    engine.pollOnce();

    setLogCallback(LogCallback());
    setLogLevel(saved_level);

    std::vector<LogLevel> expected = {LogLevel::Warning, LogLevel::Debug, LogLevel::Debug,
                                      LogLevel::Debug, LogLevel::Debug, LogLevel::Warning};
    EXPECT_EQ(levels, expected);
}

TEST_F(CaptureTest, CallbackOnlyModeLeavesQueueEmpty) {
    InputCaptureConfig config;
    config.queue_samples = false;
    std::vector<ControllerInputData> seen;
    InputCaptureEngine engine(registry_, config, [&seen](const ControllerInputData& sample) {
        seen.push_back(sample);
    });

    devices_->update(0, [](RawDeviceState& state) { state.buttons[0] = true; });
    ASSERT_EQ(engine.pollOnce(), 1);
    devices_->update(0, [](RawDeviceState& state) { state.buttons[0] = false; });
    ASSERT_EQ(engine.pollOnce(), 1);

    EXPECT_EQ(seen.size(), 2u);
    EXPECT_EQ(engine.queueSize(), 0u);
    EXPECT_FALSE(engine.getInputData(std::chrono::milliseconds(10)));
}

TEST_F(CaptureTest, QueueDropsOldestOnOverflow) {
    InputCaptureConfig config;
    config.max_queue_size = 2;
    InputCaptureEngine engine(registry_, config);

    for (int i = 0; i < 4; ++i) {
        bool pressed = (i % 2) == 1;
        devices_->update(0, [pressed](RawDeviceState& state) { state.buttons[7] = pressed; });
        ASSERT_EQ(engine.pollOnce(), 1);
    }
    EXPECT_EQ(engine.queueSize(), 2u);
    auto oldest = engine.getInputData(std::chrono::milliseconds(10));
    ASSERT_TRUE(oldest);
    EXPECT_FALSE(oldest->buttons.start);  // third sample
    auto newest = engine.getInputData(std::chrono::milliseconds(10));
    ASSERT_TRUE(newest);
    EXPECT_TRUE(newest->buttons.start);
}

TEST_F(CaptureTest, ThrowingCallbackDoesNotStopCapture) {
    int calls = 0;
    InputCaptureEngine engine(registry_, InputCaptureConfig(), [&calls](const ControllerInputData&) {
        ++calls;
        throw std::runtime_error("consumer failed");
    });
    EXPECT_EQ(engine.pollOnce(), 1);
    devices_->update(0, [](RawDeviceState& state) { state.buttons[1] = true; });
    EXPECT_EQ(engine.pollOnce(), 1);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(engine.queueSize(), 2u);
}

TEST_F(CaptureTest, BackgroundLoopDeliversSamples) {
    std::atomic<int> calls(0);
    InputCaptureConfig config;
    config.polling_rate = 200;
    InputCaptureEngine engine(registry_, config, [&calls](const ControllerInputData&) { ++calls; });
    engine.startCapture();
    EXPECT_TRUE(engine.isRunning());

    auto sample = engine.getInputData(std::chrono::seconds(2));
    ASSERT_TRUE(sample);
    devices_->update(0, [](RawDeviceState& state) { state.buttons[2] = true; });
    auto pressed = engine.getInputData(std::chrono::seconds(2));
    ASSERT_TRUE(pressed);
    EXPECT_TRUE(pressed->buttons.x);

    engine.stopCapture();
    engine.stopCapture();
    EXPECT_FALSE(engine.isRunning());
    EXPECT_EQ(calls.load(), 2);
}

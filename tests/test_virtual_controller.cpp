/*
 * Virtual Controller Tests
 */

#include "fakes.hpp"
#include "uinput_gamepad.hpp"
#include "uinput_keyboard.hpp"
#include "virtual_controller_manager.hpp"

#include <linux/input-event-codes.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace input_link;
using input_link::testing::VirtualProbe;
using input_link::testing::make_fake_factory;
using input_link::testing::make_input;

namespace {

class ManagerTest : public ::testing::Test {
protected:
    ManagerTest() : probe_(std::make_shared<VirtualProbe>()) {
        config_.backend = "fake";
    }

    std::unique_ptr<VirtualControllerManager> makeManager() {
        auto manager = std::make_unique<VirtualControllerManager>(
            config_, make_fake_factory(probe_),
            [this](int number) { created_.push_back(number); },
            [this](int number) { destroyed_.push_back(number); });
        manager->start();
        return manager;
    }

    VirtualManagerConfig config_;
    std::shared_ptr<VirtualProbe> probe_;
    std::vector<int> created_;
    std::vector<int> destroyed_;
};

size_t index_of(const std::vector<std::string>& log, const std::string& entry) {
    return static_cast<size_t>(std::find(log.begin(), log.end(), entry) - log.begin());
}

}  // namespace

TEST_F(ManagerTest, CreateIsIdempotent) {
    auto manager = makeManager();
    EXPECT_TRUE(manager->createController(2));
    EXPECT_TRUE(manager->createController(2));
    EXPECT_EQ(manager->activeControllerCount(), 1);
    EXPECT_EQ(probe_->created, 1);
    EXPECT_EQ(created_, std::vector<int>{2});

    auto info = manager->getControllerInfo();
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0].controller_number, 2);
    EXPECT_TRUE(info[0].connected);
    EXPECT_EQ(info[0].backend, "fake");
}

TEST_F(ManagerTest, CapacityIsEnforced) {
    config_.max_controllers = 2;
    auto manager = makeManager();
    EXPECT_TRUE(manager->createController(1));
    EXPECT_TRUE(manager->createController(2));
    EXPECT_FALSE(manager->createController(3));
    EXPECT_FALSE(manager->updateControllerState(make_input(4)));
    EXPECT_EQ(manager->controllerNumbers(), (std::vector<int>{1, 2}));

    EXPECT_TRUE(manager->removeController(1));
    EXPECT_TRUE(manager->createController(3));
}

TEST_F(ManagerTest, NoLimitWhenUnset) {
    config_.max_controllers.reset();
    auto manager = makeManager();
    for (int number = 1; number <= 8; ++number) {
        EXPECT_TRUE(manager->createController(number));
    }
    EXPECT_EQ(manager->activeControllerCount(), 8);
}

TEST_F(ManagerTest, RejectsNumbersOutsideRange) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->createController(0));
    EXPECT_FALSE(manager->createController(9));
    EXPECT_FALSE(manager->createController(-1));
    EXPECT_EQ(probe_->created, 0);
}

TEST_F(ManagerTest, ExtendedNumbersWhenAllowed) {
    config_.allow_extended_numbers = true;
    auto manager = makeManager();
    EXPECT_TRUE(manager->createController(12));
    EXPECT_FALSE(manager->createController(0));
    EXPECT_TRUE(manager->isControllerActive(12));

    ControllerInputData data = make_input(15);
    data.buttons.start = true;
    EXPECT_TRUE(manager->updateControllerState(data));
    EXPECT_EQ(probe_->record(15).pressed.count("start"), 1u);
}

TEST_F(ManagerTest, NotRunningRefusesWork) {
    VirtualControllerManager manager(config_, make_fake_factory(probe_));
    EXPECT_FALSE(manager.isRunning());
    EXPECT_FALSE(manager.createController(1));
    EXPECT_FALSE(manager.updateControllerState(make_input(1)));
}

TEST_F(ManagerTest, UnknownBackendFails) {
    auto manager = makeManager();
    EXPECT_FALSE(manager->createController(1, "steering-wheel"));
    EXPECT_TRUE(created_.empty());
}

TEST_F(ManagerTest, FailedConnectLeavesNoController) {
    probe_->fail_connect = true;
    auto manager = makeManager();
    EXPECT_FALSE(manager->createController(1));
    EXPECT_FALSE(manager->isControllerActive(1));
    EXPECT_TRUE(created_.empty());
}

TEST_F(ManagerTest, AutoCreateOnFirstInput) {
    auto manager = makeManager();
    ControllerInputData data = make_input(3);
    data.buttons.b = true;
    EXPECT_TRUE(manager->updateControllerState(data));
    EXPECT_TRUE(manager->isControllerActive(3));
    EXPECT_EQ(created_, std::vector<int>{3});
    EXPECT_EQ(probe_->record(3).pressed.count("b"), 1u);
}

TEST_F(ManagerTest, NoAutoCreateWhenDisabled) {
    config_.auto_create = false;
    auto manager = makeManager();
    EXPECT_FALSE(manager->updateControllerState(make_input(3)));
    EXPECT_FALSE(manager->isControllerActive(3));
}

TEST_F(ManagerTest, OnlyChangedInputsReachTheDevice) {
    auto manager = makeManager();
    ASSERT_TRUE(manager->createController(1));

    ControllerInputData data = make_input(1);
    data.buttons.a = true;
    data.axes.left_stick_x = 0.5;
    ASSERT_TRUE(manager->updateControllerState(data));
    ASSERT_TRUE(manager->updateControllerState(data));

    data.axes.left_stick_x = -0.25;
    ASSERT_TRUE(manager->updateControllerState(data));

    auto record = probe_->record(1);
    std::vector<std::string> expected = {"open", "press a", "axis left_stick_x", "axis left_stick_x"};
    EXPECT_EQ(record.log, expected);
    EXPECT_EQ(record.flushes, 2);
    EXPECT_DOUBLE_EQ(record.axes["left_stick_x"], -0.25);
}

// Removing a controller releases held inputs before the device goes away
TEST_F(ManagerTest, RemovalResetsBeforeClose) {
    auto manager = makeManager();
    ControllerInputData data = make_input(2);
    data.buttons.a = true;
    data.buttons.start = true;
    data.axes.right_trigger = 1.0;
    ASSERT_TRUE(manager->updateControllerState(data));

    EXPECT_TRUE(manager->removeController(2));
    EXPECT_FALSE(manager->removeController(2));
    EXPECT_EQ(destroyed_, std::vector<int>{2});

    auto record = probe_->record(2);
    EXPECT_FALSE(record.open);
    EXPECT_TRUE(record.pressed.empty());
    EXPECT_DOUBLE_EQ(record.axes["right_trigger"], 0.0);
    size_t close_at = index_of(record.log, "close");
    ASSERT_LT(close_at, record.log.size());
    EXPECT_LT(index_of(record.log, "release a"), close_at);
    EXPECT_LT(index_of(record.log, "release start"), close_at);
}

TEST_F(ManagerTest, ResetKeepsControllerConnected) {
    auto manager = makeManager();
    ControllerInputData data = make_input(1);
    data.buttons.x = true;
    data.axes.left_stick_y = 1.0;
    ASSERT_TRUE(manager->updateControllerState(data));

    EXPECT_TRUE(manager->resetController(1));
    EXPECT_FALSE(manager->resetController(5));
    EXPECT_TRUE(manager->isControllerActive(1));
    auto record = probe_->record(1);
    EXPECT_TRUE(record.pressed.empty());
    EXPECT_DOUBLE_EQ(record.axes["left_stick_y"], 0.0);
}

TEST_F(ManagerTest, ResetAllReleasesEveryController) {
    auto manager = makeManager();
    for (int number : {1, 2}) {
        ControllerInputData data = make_input(number);
        data.buttons.lb = true;
        ASSERT_TRUE(manager->updateControllerState(data));
    }
    manager->resetAllControllers();
    EXPECT_TRUE(probe_->record(1).pressed.empty());
    EXPECT_TRUE(probe_->record(2).pressed.empty());
    EXPECT_EQ(manager->activeControllerCount(), 2);
}

TEST_F(ManagerTest, RejectedWriteIsRetriedOnNextUpdate) {
    auto manager = makeManager();
    ControllerInputData data = make_input(1);
    data.buttons.a = true;
    ASSERT_TRUE(manager->updateControllerState(data));

    {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        probe_->failing_writes = 1;
    }
    data.buttons.a = false;
    EXPECT_FALSE(manager->updateControllerState(data));
    EXPECT_EQ(probe_->record(1).pressed.count("a"), 1u);

    EXPECT_TRUE(manager->updateControllerState(data));
    EXPECT_TRUE(probe_->record(1).pressed.empty());
}

TEST_F(ManagerTest, ResetReleasesButtonAfterRejectedWrite) {
    auto manager = makeManager();
    ControllerInputData data = make_input(1);
    data.buttons.a = true;
    data.axes.right_trigger = 0.5;
    ASSERT_TRUE(manager->updateControllerState(data));

    {
        std::lock_guard<std::mutex> lock(probe_->mutex);
        probe_->failing_writes = 1;
    }
    data.buttons.a = false;
    EXPECT_FALSE(manager->updateControllerState(data));

    EXPECT_TRUE(manager->resetController(1));
    auto record = probe_->record(1);
    EXPECT_TRUE(record.pressed.empty());
    EXPECT_DOUBLE_EQ(record.axes["right_trigger"], 0.0);
}

TEST_F(ManagerTest, StopRemovesEverything) {
    auto manager = makeManager();
    manager->createController(1);
    manager->createController(4);
    manager->stop();
    manager->stop();
    EXPECT_FALSE(manager->isRunning());
    EXPECT_EQ(manager->activeControllerCount(), 0);
    EXPECT_EQ(destroyed_, (std::vector<int>{1, 4}));
    EXPECT_FALSE(probe_->record(1).open);
    EXPECT_FALSE(probe_->record(4).open);
}

TEST_F(ManagerTest, ThrowingCallbackIsContained) {
    VirtualControllerManager manager(config_, make_fake_factory(probe_),
                                     [](int) { throw std::runtime_error("observer failed"); });
    manager.start();
    EXPECT_TRUE(manager.createController(1));
    EXPECT_TRUE(manager.isControllerActive(1));
}

TEST(VirtualControllerFactory, BackendResolution) {
    VirtualControllerFactory factory;
    EXPECT_EQ(VirtualControllerFactory::defaultBackend(), "gamepad");
    EXPECT_TRUE(factory.hasBackend("gamepad"));
    EXPECT_TRUE(factory.hasBackend("keyboard"));
    EXPECT_FALSE(factory.create("joystick", 1));
}

TEST(VirtualControllerFactory, UnconnectedControllerIgnoresUpdates) {
    auto probe = std::make_shared<VirtualProbe>();
    input_link::testing::FakeVirtualController controller(1, probe);
    EXPECT_FALSE(controller.isConnected());
    EXPECT_FALSE(controller.updateState(make_input(1)));
    EXPECT_TRUE(controller.connect());
    EXPECT_TRUE(controller.connect());
    EXPECT_EQ(probe->record(1).log, std::vector<std::string>{"open"});
}

TEST(UinputGamepad, AxisScaling) {
    EXPECT_EQ(gamepad_axis_value(0, 1.0), 32767);
    EXPECT_EQ(gamepad_axis_value(0, -1.0), -32767);
    EXPECT_EQ(gamepad_axis_value(0, 0.0), 0);
    EXPECT_EQ(gamepad_axis_value(1, 1.0), -32767);  // up is negative on evdev
    EXPECT_EQ(gamepad_axis_value(3, -0.5), 16384);
    EXPECT_EQ(gamepad_axis_value(4, 1.0), 255);
    EXPECT_EQ(gamepad_axis_value(5, 0.5), 128);
}

TEST(UinputKeyboard, KeyLayout) {
    EXPECT_EQ(keyboard_button_key(0), KEY_Z);
    EXPECT_EQ(keyboard_button_key(7), KEY_ENTER);
    EXPECT_EQ(keyboard_button_key(10), KEY_UP);
    EXPECT_EQ(keyboard_button_key(14), -1);

    AxisKeys left_x = keyboard_axis_keys(0);
    EXPECT_EQ(left_x.negative, KEY_A);
    EXPECT_EQ(left_x.positive, KEY_D);
    AxisKeys left_y = keyboard_axis_keys(1);
    EXPECT_EQ(left_y.negative, KEY_S);
    EXPECT_EQ(left_y.positive, KEY_W);
    AxisKeys right_trigger = keyboard_axis_keys(5);
    EXPECT_EQ(right_trigger.negative, -1);
    EXPECT_EQ(right_trigger.positive, KEY_T);
}

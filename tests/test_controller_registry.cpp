/*
 * Physical Controller Registry Tests
 */

#include "controller_registry.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace input_link;
using input_link::testing::FakeBackend;
using input_link::testing::FakeDevices;

namespace {

const char* XBOX_GUID = "030000005e0400008e02000014010000";
const char* DS4_GUID = "030000004c050000cc09000011810000";

class RegistryTest : public ::testing::Test {
protected:
    RegistryTest()
        : devices_(std::make_shared<FakeDevices>()),
          registry_(std::make_unique<FakeBackend>(devices_)) {}

    std::shared_ptr<FakeDevices> devices_;
    ControllerRegistry registry_;
};

}  // namespace

TEST_F(RegistryTest, InitializeIsIdempotent) {
    registry_.initialize();
    registry_.initialize();
    EXPECT_TRUE(registry_.isInitialized());
    EXPECT_EQ(devices_->initialize_calls, 1);
    registry_.cleanup();
    registry_.cleanup();
    EXPECT_EQ(devices_->shutdown_calls, 1);
}

TEST(Registry, InitializationFailurePropagates) {
    auto devices = std::make_shared<FakeDevices>();
    devices->fail_initialize = true;
    ControllerRegistry registry(std::make_unique<FakeBackend>(devices));
    EXPECT_THROW(registry.initialize(), InitializationError);
    EXPECT_FALSE(registry.isInitialized());
    EXPECT_THROW(registry.scanControllers(), InitializationError);
}

TEST_F(RegistryTest, NumbersAssignedInScanOrder) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    devices_->add(1, DS4_GUID, "Wireless Controller DualShock 4");

    auto scanned = registry_.scanControllers();
    ASSERT_EQ(scanned.size(), 2u);
    EXPECT_EQ(scanned[0].assigned_number, 1);
    EXPECT_EQ(scanned[1].assigned_number, 2);
    EXPECT_EQ(scanned[0].preferred_input_method, InputMethod::XInput);
    EXPECT_EQ(scanned[1].preferred_input_method, InputMethod::DInput);
}

TEST_F(RegistryTest, RescanKeepsNumbersAndSettings) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    devices_->add(1, DS4_GUID, "Wireless Controller");
    auto first = registry_.scanControllers();
    std::string ds4_id = first[1].identifier();

    ASSERT_TRUE(registry_.assignControllerNumber(ds4_id, 5));
    ASSERT_TRUE(registry_.setInputMethod(ds4_id, InputMethod::XInput));

    for (int i = 0; i < 3; ++i) {
        auto scanned = registry_.scanControllers();
        ASSERT_EQ(scanned.size(), 2u);
    }
    auto ds4 = registry_.getControllerByIdentifier(ds4_id);
    ASSERT_TRUE(ds4);
    EXPECT_EQ(ds4->assigned_number, 5);
    EXPECT_EQ(ds4->preferred_input_method, InputMethod::XInput);
}

// Unplugging the first of two pads must not hand its identity to the second
TEST_F(RegistryTest, UnplugKeepsIdentityOfRemainingDevice) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    devices_->add(1, XBOX_GUID, "Xbox 360 Controller");
    auto first = registry_.scanControllers();
    ASSERT_EQ(first.size(), 2u);
    std::string second_id = first[1].identifier();
    ASSERT_EQ(first[1].assigned_number, 2);

    devices_->remove(0);
    auto scanned = registry_.scanControllers();

    auto connected = registry_.getConnectedControllers();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].identifier(), second_id);
    EXPECT_EQ(connected[0].assigned_number, 2);
    EXPECT_EQ(connected[0].device_index, 0);

    ASSERT_EQ(scanned.size(), 2u);
    EXPECT_EQ(scanned[1].state, ConnectionState::Disconnected);
    EXPECT_EQ(scanned[1].identifier(), first[0].identifier());
}

TEST_F(RegistryTest, ReplugIsNewAttachment) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    auto first = registry_.scanControllers();
    devices_->remove(0);
    registry_.scanControllers();

    devices_->add(3, XBOX_GUID, "Xbox 360 Controller");
    registry_.scanControllers();
    auto connected = registry_.getConnectedControllers();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_NE(connected[0].identifier(), first[0].identifier());
    // The disconnected record still holds number 1
    EXPECT_EQ(connected[0].assigned_number, 2);

    EXPECT_EQ(registry_.forgetDisconnected(), 1);
    EXPECT_FALSE(registry_.getControllerByIdentifier(first[0].identifier()));
    EXPECT_EQ(registry_.forgetDisconnected(), 0);
}

TEST_F(RegistryTest, AssignStealsNumberFromOtherHolder) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    devices_->add(1, DS4_GUID, "Wireless Controller");
    auto scanned = registry_.scanControllers();

    ASSERT_TRUE(registry_.assignControllerNumber(scanned[1].identifier(), 1));
    EXPECT_FALSE(registry_.getControllerByIdentifier(scanned[0].identifier())->assigned_number);
    EXPECT_EQ(registry_.getControllerByIdentifier(scanned[1].identifier())->assigned_number, 1);
}

TEST_F(RegistryTest, AssignRejectsOutOfRangeAndUnknown) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    auto scanned = registry_.scanControllers();
    EXPECT_FALSE(registry_.assignControllerNumber(scanned[0].identifier(), 0));
    EXPECT_FALSE(registry_.assignControllerNumber(scanned[0].identifier(), 9));
    EXPECT_FALSE(registry_.assignControllerNumber("ffff_0", 3));
    EXPECT_FALSE(registry_.setInputMethod("ffff_0", InputMethod::DInput));
    EXPECT_FALSE(registry_.unassignController("ffff_0"));
    EXPECT_EQ(registry_.getControllerByIdentifier(scanned[0].identifier())->assigned_number, 1);
}

TEST_F(RegistryTest, AssignFallsBackToGuidPrefix) {
    devices_->add(4, XBOX_GUID, "Xbox 360 Controller");
    registry_.scanControllers();

    // Saved settings carry the instance id of an earlier session
    ASSERT_TRUE(registry_.assignControllerNumber(std::string(XBOX_GUID) + "_0", 6));
    auto connected = registry_.getConnectedControllers();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_EQ(connected[0].assigned_number, 6);
}

TEST_F(RegistryTest, UnassignFreesNumberForNextDevice) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    auto scanned = registry_.scanControllers();
    ASSERT_TRUE(registry_.unassignController(scanned[0].identifier()));
    EXPECT_FALSE(registry_.getControllerByIdentifier(scanned[0].identifier())->assigned_number);

    devices_->add(1, DS4_GUID, "Wireless Controller");
    registry_.scanControllers();
    auto ds4 = registry_.getControllerByDeviceId(1);
    ASSERT_TRUE(ds4);
    EXPECT_EQ(ds4->assigned_number, 1);
}

TEST_F(RegistryTest, NinthDeviceGetsNoNumber) {
    for (int i = 0; i < 9; ++i) {
        devices_->add(i, XBOX_GUID, "Xbox 360 Controller");
    }
    auto scanned = registry_.scanControllers();
    ASSERT_EQ(scanned.size(), 9u);
    EXPECT_EQ(scanned[7].assigned_number, 8);
    EXPECT_FALSE(scanned[8].assigned_number);
}

TEST(Registry, NoAutoAssign) {
    auto devices = std::make_shared<FakeDevices>();
    devices->add(0, XBOX_GUID, "Xbox 360 Controller");
    ControllerRegistry registry(std::make_unique<FakeBackend>(devices), false);
    auto scanned = registry.scanControllers();
    ASSERT_EQ(scanned.size(), 1u);
    EXPECT_FALSE(scanned[0].assigned_number);
}

TEST_F(RegistryTest, ReadStateOnlyForConnectedRecords) {
    devices_->add(0, XBOX_GUID, "Xbox 360 Controller");
    auto scanned = registry_.scanControllers();
    RawDeviceState state;
    EXPECT_TRUE(registry_.readState(scanned[0], state));
    EXPECT_EQ(state.axes.size(), 6u);

    devices_->remove(0);
    registry_.scanControllers();
    EXPECT_FALSE(registry_.readState(scanned[0], state));
}

TEST_F(RegistryTest, LookupByIndex) {
    devices_->add(10, XBOX_GUID, "Xbox 360 Controller");
    devices_->add(11, DS4_GUID, "Wireless Controller");
    registry_.scanControllers();
    auto second = registry_.getControllerByIndex(1);
    ASSERT_TRUE(second);
    EXPECT_EQ(second->device_id, 11);
    EXPECT_FALSE(registry_.getControllerByIndex(2));
}

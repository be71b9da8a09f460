/*
 * Controller Data Model Tests
 */

#include "controller_types.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

using namespace input_link;

TEST(ControllerTypes, NumberRange) {
    EXPECT_FALSE(is_valid_controller_number(0));
    EXPECT_TRUE(is_valid_controller_number(1));
    EXPECT_TRUE(is_valid_controller_number(8));
    EXPECT_FALSE(is_valid_controller_number(9));
    EXPECT_FALSE(is_valid_controller_number(-3));
}

TEST(ControllerTypes, ButtonEqualityCoversEveryField) {
    for (const auto& field : BUTTON_FIELDS) {
        ButtonState a;
        ButtonState b;
        b.*field.member = true;
        EXPECT_NE(a, b) << field.name;
        EXPECT_TRUE(b.anyPressed()) << field.name;
    }
    EXPECT_FALSE(ButtonState().anyPressed());
}

TEST(ControllerTypes, AxisConstructorClamps) {
    AxisState axes(1.5, -2.0, 0.25, -0.25, 1.2, -0.5);
    EXPECT_DOUBLE_EQ(axes.left_stick_x, 1.0);
    EXPECT_DOUBLE_EQ(axes.left_stick_y, -1.0);
    EXPECT_DOUBLE_EQ(axes.right_stick_x, 0.25);
    EXPECT_DOUBLE_EQ(axes.right_stick_y, -0.25);
    EXPECT_DOUBLE_EQ(axes.left_trigger, 1.0);
    EXPECT_DOUBLE_EQ(axes.right_trigger, 0.0);
}

TEST(ControllerTypes, ClampAfterDirectAssignment) {
    AxisState axes;
    axes.right_stick_y = 7.0;
    axes.left_trigger = -1.0;
    axes.clamp();
    EXPECT_DOUBLE_EQ(axes.right_stick_y, 1.0);
    EXPECT_DOUBLE_EQ(axes.left_trigger, 0.0);
}

TEST(ControllerTypes, ValidateRejectsBadNumberAndBlankId) {
    ControllerInputData data;
    data.controller_id = "pad";
    data.controller_number = 4;
    EXPECT_NO_THROW(data.validate());

    data.controller_number = 9;
    EXPECT_THROW(data.validate(), ValidationError);

    data.controller_number = 2;
    data.controller_id = "   ";
    EXPECT_THROW(data.validate(), ValidationError);
}

TEST(ControllerTypes, IdentifierCombinesGuidAndInstance) {
    DetectedController controller;
    controller.guid = "abc";
    controller.device_id = 7;
    EXPECT_EQ(controller.identifier(), "abc_7");
}

TEST(ControllerTypes, RecommendedInputMethodFollowsName) {
    DetectedController controller;
    controller.name = "Microsoft X-Box 360 pad";
    EXPECT_TRUE(controller.isXboxController());
    EXPECT_EQ(controller.getRecommendedInputMethod(), InputMethod::XInput);

    controller.name = "Sony Interactive Entertainment Wireless Controller DualShock 4";
    EXPECT_FALSE(controller.isXboxController());
    EXPECT_TRUE(controller.isPlayStationController());
    EXPECT_EQ(controller.getRecommendedInputMethod(), InputMethod::DInput);

    controller.name = "8BitDo Pro 2";
    EXPECT_EQ(controller.getRecommendedInputMethod(), InputMethod::DInput);
}

TEST(ControllerTypes, InputMethodNames) {
    InputMethod method = InputMethod::XInput;
    EXPECT_TRUE(parse_input_method("dinput", method));
    EXPECT_EQ(method, InputMethod::DInput);
    EXPECT_STREQ(to_string(method), "dinput");
    EXPECT_FALSE(parse_input_method("joystick", method));
    EXPECT_EQ(method, InputMethod::DInput);
}

TEST(ControllerTypes, Trim) {
    EXPECT_EQ(trim("  pad 1\t\n"), "pad 1");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \t "), "");
}

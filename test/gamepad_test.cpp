#include "gamepad.hpp"
#include "joystick.hpp"
#include "test_pad.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <SDL3/SDL_gamepad.h>

#include <string>

using ::testing::HasSubstr;

class GamepadTest : public TestPadFixture {};

// ==================== Names ====================

TEST(GamepadNamesTest, AxisNamesRoundTrip) {
  for (int i = 0; i < SDL_GAMEPAD_AXIS_COUNT; ++i) {
    auto axis = SDL_GamepadAxis(i);
    EXPECT_EQ(AxisFromName(AxisNameOf(axis)), axis) << AxisNameOf(axis);
  }
}

TEST(GamepadNamesTest, ButtonNamesRoundTrip) {
  for (int i = 0; i < SDL_GAMEPAD_BUTTON_COUNT; ++i) {
    auto button = SDL_GamepadButton(i);
    EXPECT_EQ(ButtonFromName(ButtonNameOf(button)), button) << ButtonNameOf(button);
  }
}

TEST(GamepadNamesTest, KnownNames) {
  EXPECT_EQ(AxisNameOf(SDL_GAMEPAD_AXIS_LEFTX), "leftx");
  EXPECT_EQ(AxisFromName("righttrigger"), SDL_GAMEPAD_AXIS_RIGHT_TRIGGER);
  EXPECT_EQ(ButtonNameOf(SDL_GAMEPAD_BUTTON_START), "start");
  EXPECT_EQ(ButtonFromName("dpup"), SDL_GAMEPAD_BUTTON_DPAD_UP);
}

TEST(GamepadNamesTest, UnknownIdsAndNamesAreUnknownIdentifier) {
  EXPECT_EQ(RaisedKind([] { AxisNameOf(SDL_GAMEPAD_AXIS_INVALID); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([] { AxisNameOf(SDL_GAMEPAD_AXIS_COUNT); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([] { ButtonNameOf(SDL_GAMEPAD_BUTTON_INVALID); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([] { ButtonNameOf(SDL_GAMEPAD_BUTTON_COUNT); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([] { AxisFromName("not-an-axis"); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([] { ButtonFromName("not-a-button"); }), ErrorKind::UnknownIdentifier);
}

TEST(GamepadNamesTest, UnknownNameMessageQuotesTheName) {
  try {
    AxisFromName("wheel");
    FAIL() << "expected a BindingError";
  } catch (const BindingError& e) {
    EXPECT_THAT(e.what(), HasSubstr("\"wheel\""));
  }
}

TEST(GamepadNamesTest, ConstantTablesUseSdlValues) {
  for (auto& axis : gamepad_axis_constants) {
    if (axis.value == SDL_GAMEPAD_AXIS_INVALID || axis.value == SDL_GAMEPAD_AXIS_COUNT) continue;
    EXPECT_NO_THROW(AxisNameOf(axis.value)) << axis.name;
  }
  for (auto& button : gamepad_button_constants) {
    if (button.value == SDL_GAMEPAD_BUTTON_INVALID || button.value == SDL_GAMEPAD_BUTTON_COUNT) continue;
    EXPECT_NO_THROW(ButtonNameOf(button.value)) << button.name;
  }
}

// ==================== Mappings ====================

TEST_F(GamepadTest, AddMappingReportsNewThenUpdated) {
  const std::string guid = "03000000aaaa0000bbbb000000000000";
  const std::string mapping = guid + ",Made Up Pad,a:b0,b:b1,leftx:a0,lefty:a1,";

  EXPECT_EQ(AddMapping(mapping), 1);
  EXPECT_EQ(AddMapping(mapping), 0);
  EXPECT_THAT(MappingFor(guid), HasSubstr("Made Up Pad"));
}

TEST_F(GamepadTest, MalformedMappingIsDeviceError) {
  EXPECT_EQ(RaisedKind([] { AddMapping("not a mapping"); }), ErrorKind::Device);
}

TEST_F(GamepadTest, MissingMappingsFileIsDeviceError) {
  EXPECT_EQ(RaisedKind([] { AddMappingsFromFile("/nonexistent/gamecontrollerdb.txt"); }), ErrorKind::Device);
}

TEST_F(GamepadTest, MappingForUnknownGuidIsDeviceError) {
  EXPECT_EQ(RaisedKind([] { MappingFor("0300000000000000ffff00000000ffff"); }), ErrorKind::Device);
}

TEST_F(GamepadTest, DeviceNamesCoverEveryJoystick) {
  auto names = DeviceNames();
  ASSERT_EQ(int(names.size()), NumConnectedJoysticks());
  ASSERT_TRUE(names[index].has_value());
  EXPECT_EQ(*names[index], "Test Pad");
}

// ==================== Gamepad handle ====================

TEST_F(GamepadTest, OpensVirtualPadByName) {
  auto gamepad = OpenGamepad(index);
  EXPECT_TRUE(gamepad.IsAttached());
  EXPECT_EQ(gamepad.GetName(), "Test Pad");
  EXPECT_EQ(gamepad.GetInstanceID(), vjoy->instance_id);
}

TEST_F(GamepadTest, MappingNamesTheDevice) {
  auto gamepad = OpenGamepad(index);
  EXPECT_THAT(gamepad.GetMapping(), HasSubstr("Test Pad"));
  EXPECT_THAT(MappingFor(Devices()[index].guid), HasSubstr("Test Pad"));
}

TEST_F(GamepadTest, ButtonFollowsInjectedState) {
  auto gamepad = OpenGamepad(index);

  EXPECT_FALSE(gamepad.IsButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));

  vjoy->SetButton(SDL_GAMEPAD_BUTTON_SOUTH, true);
  Push();
  EXPECT_TRUE(gamepad.IsButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));
  EXPECT_FALSE(gamepad.IsButtonPressed(SDL_GAMEPAD_BUTTON_EAST));

  vjoy->SetButton(SDL_GAMEPAD_BUTTON_SOUTH, false);
  Push();
  EXPECT_FALSE(gamepad.IsButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH));
}

TEST_F(GamepadTest, AxesStayInRange) {
  auto gamepad = OpenGamepad(index);

  for (float value : {-1.f, -0.5f, 0.f, 0.5f, 1.f}) {
    for (int i = 0; i < SDL_GAMEPAD_AXIS_COUNT; ++i) {
      vjoy->SetAxis(i, value);
    }
    Push();

    for (int i = 0; i < SDL_GAMEPAD_AXIS_COUNT; ++i) {
      auto axis = SDL_GamepadAxis(i);
      auto reading = gamepad.GetAxis(axis);
      EXPECT_GE(reading, -32768);
      EXPECT_LE(reading, 32767);
      if (axis == SDL_GAMEPAD_AXIS_LEFT_TRIGGER || axis == SDL_GAMEPAD_AXIS_RIGHT_TRIGGER) {
        EXPECT_GE(reading, 0) << AxisNameOf(axis) << " at " << value;
      }
    }
  }
}

TEST_F(GamepadTest, StickFollowsInjectedState) {
  auto gamepad = OpenGamepad(index);

  vjoy->SetAxis(SDL_GAMEPAD_AXIS_LEFTX, 1.f);
  Push();
  EXPECT_EQ(gamepad.GetAxis(SDL_GAMEPAD_AXIS_LEFTX), 32767);
}

TEST_F(GamepadTest, DestroyIsIdempotentAndInvalidatesHandle) {
  auto gamepad = OpenGamepad(index);
  gamepad.Destroy();
  gamepad.Destroy();
  EXPECT_TRUE(gamepad.IsDestroyed());

  EXPECT_EQ(RaisedKind([&] { gamepad.GetName(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { gamepad.GetMapping(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { gamepad.IsAttached(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { gamepad.GetAxis(SDL_GAMEPAD_AXIS_LEFTX); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { gamepad.IsButtonPressed(SDL_GAMEPAD_BUTTON_SOUTH); }), ErrorKind::InvalidHandle);
}

TEST_F(GamepadTest, PlainJoystickIsNotAGamepad) {
  auto plain = CreateVirtualJoystick({.name = "Plain Stick", .num_axes = 2, .num_buttons = 2});
  auto plain_index = IndexOf(plain->instance_id);
  ASSERT_GE(plain_index, 0);

  EXPECT_FALSE(IsGamepad(plain_index));
  ASSERT_LT(plain_index, int(DeviceNames().size()));
  EXPECT_FALSE(DeviceNames()[plain_index].has_value());
  EXPECT_EQ(RaisedKind([&] { OpenGamepad(plain_index); }), ErrorKind::Device);

  plain->Destroy();
}

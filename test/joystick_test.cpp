#include "joystick.hpp"
#include "subsystem.hpp"
#include "test_pad.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>

#include <tuple>

using ::testing::MatchesRegex;
using ::testing::HasSubstr;

class JoystickTest : public TestPadFixture {};

// ==================== Device list ====================

TEST_F(JoystickTest, DevicesMatchConnectedCount) {
  auto devices = Devices();
  EXPECT_EQ(int(devices.size()), NumConnectedJoysticks());
  ASSERT_LT(index, int(devices.size()));
  EXPECT_EQ(devices[index].name, "Test Pad");
  for (auto& device : devices) {
    EXPECT_THAT(device.guid, MatchesRegex("^[0-9a-f]{32}$"));
  }
}

TEST_F(JoystickTest, EveryIndexOpensAnAttachedHandle) {
  for (int i = 0; i < NumConnectedJoysticks(); ++i) {
    auto joystick = OpenJoystick(i);
    EXPECT_FALSE(joystick.IsDestroyed());
    EXPECT_TRUE(joystick.IsAttached()) << "index " << i;
  }
}

TEST_F(JoystickTest, OpenByIndexAndIDAgree) {
  auto by_index = OpenJoystick(index);
  auto by_id = OpenJoystickByID(vjoy->instance_id);
  EXPECT_EQ(by_index.GetInstanceID(), vjoy->instance_id);
  EXPECT_EQ(by_id.GetInstanceID(), vjoy->instance_id);
  EXPECT_EQ(by_index.GetGUID(), by_id.GetGUID());
  EXPECT_EQ(by_index.GetGUID(), Devices()[index].guid);
}

TEST_F(JoystickTest, BadIndexIsDeviceError) {
  EXPECT_EQ(RaisedKind([] { OpenJoystick(-1); }), ErrorKind::Device);
  EXPECT_EQ(RaisedKind([] { OpenJoystick(NumConnectedJoysticks()); }), ErrorKind::Device);
  EXPECT_FALSE(IsGamepad(-1));
  EXPECT_FALSE(IsGamepad(NumConnectedJoysticks()));
}

TEST_F(JoystickTest, BadIndexMessageNamesTheIndex) {
  try {
    OpenJoystick(99);
    FAIL() << "expected a BindingError";
  } catch (const BindingError& e) {
    EXPECT_THAT(e.what(), HasSubstr("99"));
  }
}

TEST_F(JoystickTest, VirtualGamepadIsGamepad) {
  EXPECT_TRUE(IsGamepad(index));
}

// ==================== Capabilities ====================

TEST_F(JoystickTest, ReportsVirtualCapabilities) {
  auto joystick = OpenJoystick(index);
  EXPECT_EQ(joystick.GetName(), "Test Pad");
  EXPECT_EQ(joystick.GetNumAxes(), SDL_GAMEPAD_AXIS_COUNT);
  EXPECT_EQ(joystick.GetNumButtons(), SDL_GAMEPAD_BUTTON_DPAD_RIGHT + 1);
  EXPECT_EQ(joystick.GetNumBalls(), 1);
  EXPECT_EQ(joystick.GetNumHats(), 1);
}

// ==================== Input state ====================

TEST_F(JoystickTest, ButtonFollowsInjectedState) {
  auto joystick = OpenJoystick(index);

  vjoy->SetButton(2, true);
  Push();
  EXPECT_TRUE(joystick.GetButton(2));
  EXPECT_FALSE(joystick.GetButton(1));

  vjoy->SetButton(2, false);
  Push();
  EXPECT_FALSE(joystick.GetButton(2));
}

TEST_F(JoystickTest, AxisFollowsInjectedState) {
  auto joystick = OpenJoystick(index);

  vjoy->SetAxis(0, 1.f);
  vjoy->SetAxis(1, -1.f);
  Push();
  EXPECT_EQ(joystick.GetAxis(0), 32767);
  EXPECT_EQ(joystick.GetAxis(1), -32767);

  // Out of range values are clamped before they reach SDL
  vjoy->SetAxis(0, 4.f);
  EXPECT_FLOAT_EQ(vjoy->GetAxis(0), 1.f);
}

TEST_F(JoystickTest, HatFollowsInjectedState) {
  auto joystick = OpenJoystick(index);

  vjoy->SetHat(0, SDL_HAT_LEFTUP);
  Push();
  EXPECT_EQ(joystick.GetHat(0), SDL_HAT_LEFTUP);
  EXPECT_EQ(HatName(joystick.GetHat(0)), "LEFTUP");

  vjoy->SetHat(0, SDL_HAT_CENTERED);
  Push();
  EXPECT_EQ(HatName(joystick.GetHat(0)), "CENTERED");
}

TEST_F(JoystickTest, BallReportsMotionSinceLastRead) {
  auto joystick = OpenJoystick(index);

  vjoy->MoveBall(0, 3, -2);
  Push();
  EXPECT_EQ(joystick.GetBall(0), std::make_tuple(3, -2));
  EXPECT_EQ(joystick.GetBall(0), std::make_tuple(0, 0));
}

TEST_F(JoystickTest, MissingBallIsDeviceError) {
  auto joystick = OpenJoystick(index);
  EXPECT_EQ(RaisedKind([&] { joystick.GetBall(5); }), ErrorKind::Device);
}

TEST_F(JoystickTest, UnknownVirtualChannelIsUnknownIdentifier) {
  EXPECT_EQ(RaisedKind([&] { vjoy->SetButton(100, true); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([&] { vjoy->SetHat(1, SDL_HAT_UP); }), ErrorKind::UnknownIdentifier);
  EXPECT_EQ(RaisedKind([&] { vjoy->MoveBall(1, 1, 1); }), ErrorKind::UnknownIdentifier);
}

// ==================== Lifetime ====================

TEST_F(JoystickTest, DestroyIsIdempotent) {
  auto joystick = OpenJoystick(index);
  joystick.Destroy();
  EXPECT_TRUE(joystick.IsDestroyed());
  joystick.Destroy();
  EXPECT_TRUE(joystick.IsDestroyed());
}

TEST_F(JoystickTest, OperationsAfterDestroyAreInvalidHandle) {
  auto joystick = OpenJoystick(index);
  joystick.Destroy();

  EXPECT_EQ(RaisedKind([&] { joystick.GetName(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetGUID(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetInstanceID(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.IsAttached(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetNumAxes(); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetAxis(0); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetButton(0); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetHat(0); }), ErrorKind::InvalidHandle);
  EXPECT_EQ(RaisedKind([&] { joystick.GetBall(0); }), ErrorKind::InvalidHandle);
}

TEST_F(JoystickTest, MovedFromHandleIsDestroyed) {
  auto joystick = OpenJoystick(index);
  auto moved = std::move(joystick);
  EXPECT_TRUE(joystick.IsDestroyed());
  EXPECT_FALSE(moved.IsDestroyed());
  EXPECT_EQ(moved.GetName(), "Test Pad");
}

// ==================== Subsystem shutdown ====================

TEST(JoystickSubsystemTest, HandleIsStaleAfterShutdown) {
  InitSubsystems();
  auto vjoy = CreateVirtualJoystick({.name = "Short Lived", .num_buttons = 1});
  auto joystick = OpenJoystickByID(vjoy->instance_id);
  auto generation = SubsystemGeneration();

  QuitSubsystems();
  EXPECT_FALSE(IsSubsystemActive());
  EXPECT_NE(SubsystemGeneration(), generation);

  // Not destroyed by the caller, but every query now fails
  EXPECT_FALSE(joystick.IsDestroyed());
  EXPECT_EQ(RaisedKind([&] { joystick.GetName(); }), ErrorKind::InvalidHandle);

  // Neither of these may touch the already shut down subsystem
  joystick.Destroy();
  vjoy->Destroy();
  EXPECT_TRUE(joystick.IsDestroyed());
}

TEST(JoystickSubsystemTest, InitNests) {
  InitSubsystems();
  InitSubsystems();
  QuitSubsystems();
  EXPECT_TRUE(IsSubsystemActive());
  QuitSubsystems();
  EXPECT_FALSE(IsSubsystemActive());
}

TEST(HatNameTest, NamesEveryPosition) {
  for (auto& hat : hat_constants) {
    EXPECT_EQ(HatName(hat.value), hat.name);
  }
  EXPECT_EQ(HatName(SDL_HAT_UP | SDL_HAT_DOWN), "?");
}

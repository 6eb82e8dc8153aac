#pragma once

#include <sol/sol.hpp>

// Registers the global SDL table: SDL.Joystick, SDL.Gamepad, SDL.DeviceInfo,
// version information and SDL.GetTime.
//
// Joystick and Gamepad userdata close their device when garbage collected.
// Errors raised by the wrappers surface as Lua errors carrying SDL's message.
void RegisterBindings(sol::state_view lua);

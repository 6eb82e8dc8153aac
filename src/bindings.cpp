#include "bindings.hpp"
#include "gamepad.hpp"
#include "joystick.hpp"

#include <SDL3/SDL_timer.h>
#include <SDL3/SDL_version.h>

#include <format>
#include <ranges>
#include <string>

template<typename Constants>
static
sol::table ConstantTable(sol::state_view lua, const Constants& constants)
{
    auto table = lua.create_table(0, int(constants.size()));
    for (auto& constant : constants) {
        table[constant.name] = int(constant.value);
    }
    return table;
}

// Lua integers are range checked before they become SDL enum values

static
SDL_GamepadAxis ToAxis(lua_Integer axis)
{
    if (axis < 0 || axis >= SDL_GAMEPAD_AXIS_COUNT) {
        Error(ErrorKind::UnknownIdentifier, "Unknown axis {}", axis);
    }
    return SDL_GamepadAxis(axis);
}

static
SDL_GamepadButton ToButton(lua_Integer button)
{
    if (button < 0 || button >= SDL_GAMEPAD_BUTTON_COUNT) {
        Error(ErrorKind::UnknownIdentifier, "Unknown button {}", button);
    }
    return SDL_GamepadButton(button);
}

static
std::string HatNameOf(lua_Integer bits)
{
    if (bits < 0 || bits > 0xFF) return "?";
    return std::string(HatName(uint8_t(bits)));
}

static
void RegisterJoystick(sol::state_view lua, sol::table sdl)
{
    sdl.new_usertype<DeviceInfo>("DeviceInfo",
        sol::no_constructor,
        "guid", sol::readonly(&DeviceInfo::guid),
        "name", sol::readonly(&DeviceInfo::name));

    auto type = sdl.new_usertype<Joystick>("Joystick",
        sol::no_constructor,

        "NumConnectedJoysticks", &NumConnectedJoysticks,
        "Devices",               []() { return sol::as_table(Devices()); },
        "Open",                  &OpenJoystick,
        "OpenByID",              &OpenJoystickByID,
        "IsGamepad",             &IsGamepad,
        "HatName",               &HatNameOf,

        "Destroy",       &Joystick::Destroy,
        "Close",         &Joystick::Destroy,
        "IsDestroyed",   &Joystick::IsDestroyed,
        "IsAttached",    &Joystick::IsAttached,
        "GetGUID",       &Joystick::GetGUID,
        "GetInstanceID", &Joystick::GetInstanceID,
        "GetName",       &Joystick::GetName,
        "GetNumAxes",    &Joystick::GetNumAxes,
        "GetNumBalls",   &Joystick::GetNumBalls,
        "GetNumButtons", &Joystick::GetNumButtons,
        "GetNumHats",    &Joystick::GetNumHats,
        "GetAxis",       &Joystick::GetAxis,
        "GetBall",       &Joystick::GetBall,
        "GetButton",     &Joystick::GetButton,
        "GetHat",        [](const Joystick& self, int which) { return int(self.GetHat(which)); });

    type["Hat"] = ConstantTable(lua, hat_constants);
}

static
void RegisterGamepad(sol::state_view lua, sol::table sdl)
{
    auto type = sdl.new_usertype<Gamepad>("Gamepad",
        sol::no_constructor,

        "AddMapping",     &AddMapping,
        "AxisNameOf",     [](lua_Integer axis)   { return AxisNameOf(ToAxis(axis)); },
        "ButtonNameOf",   [](lua_Integer button) { return ButtonNameOf(ToButton(button)); },
        "AxisFromName",   [](const std::string& name) { return int(AxisFromName(name)); },
        "ButtonFromName", [](const std::string& name) { return int(ButtonFromName(name)); },
        "MappingFor",     &MappingFor,
        "Open",           &OpenGamepad,
        "OpenByID",       &OpenGamepadByID,
        "DeviceNames",    [](sol::this_state s) {
            sol::state_view lua(s);
            auto names = DeviceNames();
            auto table = lua.create_table(int(names.size()), 0);
            for (auto[i, name] : names | std::views::enumerate) {
                if (name) table[i + 1] = *name;
            }
            return table;
        },

        "Destroy",         &Gamepad::Destroy,
        "Close",           &Gamepad::Destroy,
        "IsDestroyed",     &Gamepad::IsDestroyed,
        "IsAttached",      &Gamepad::IsAttached,
        "GetName",         &Gamepad::GetName,
        "GetMapping",      &Gamepad::GetMapping,
        "GetInstanceID",   &Gamepad::GetInstanceID,
        "GetAxis",         [](const Gamepad& self, lua_Integer axis)   { return self.GetAxis(ToAxis(axis)); },
        "IsButtonPressed", [](const Gamepad& self, lua_Integer button) { return self.IsButtonPressed(ToButton(button)); });

    type["Axis"] = ConstantTable(lua, gamepad_axis_constants);
    type["Button"] = ConstantTable(lua, gamepad_button_constants);
}

void RegisterBindings(sol::state_view lua)
{
    auto sdl = lua.create_named_table("SDL");

    RegisterJoystick(lua, sdl);
    RegisterGamepad(lua, sdl);

    sdl["VERSION"] = JOYBIND_VERSION;
    sdl["VERSION_NUMBER"] = lua.create_table_with(
        1, JOYBIND_VERSION_MAJOR,
        2, JOYBIND_VERSION_MINOR,
        3, JOYBIND_VERSION_PATCH);

    int linked = SDL_GetVersion();
    sdl["SDL_VERSION"] = std::format("{}.{}.{}",
        SDL_VERSIONNUM_MAJOR(linked),
        SDL_VERSIONNUM_MINOR(linked),
        SDL_VERSIONNUM_MICRO(linked));

    sdl.set_function("GetTime", []() -> double {
        return SDL_GetTicks() / 1000.0;
    });
}

#pragma once

#include "common.hpp"

#include <SDL3/SDL_gamepad.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Constant names as exposed to scripts. Values are SDL's own, so they stay
// valid in mapping strings handed to AddMapping and read from MappingFor.

constexpr std::array gamepad_axis_constants {
    NamedConstant<SDL_GamepadAxis>{"INVALID",      SDL_GAMEPAD_AXIS_INVALID},
    NamedConstant<SDL_GamepadAxis>{"LEFTX",        SDL_GAMEPAD_AXIS_LEFTX},
    NamedConstant<SDL_GamepadAxis>{"LEFTY",        SDL_GAMEPAD_AXIS_LEFTY},
    NamedConstant<SDL_GamepadAxis>{"RIGHTX",       SDL_GAMEPAD_AXIS_RIGHTX},
    NamedConstant<SDL_GamepadAxis>{"RIGHTY",       SDL_GAMEPAD_AXIS_RIGHTY},
    NamedConstant<SDL_GamepadAxis>{"TRIGGERLEFT",  SDL_GAMEPAD_AXIS_LEFT_TRIGGER},
    NamedConstant<SDL_GamepadAxis>{"TRIGGERRIGHT", SDL_GAMEPAD_AXIS_RIGHT_TRIGGER},
    NamedConstant<SDL_GamepadAxis>{"MAX",          SDL_GAMEPAD_AXIS_COUNT},
};

constexpr std::array gamepad_button_constants {
    NamedConstant<SDL_GamepadButton>{"INVALID",       SDL_GAMEPAD_BUTTON_INVALID},
    NamedConstant<SDL_GamepadButton>{"A",             SDL_GAMEPAD_BUTTON_SOUTH},
    NamedConstant<SDL_GamepadButton>{"B",             SDL_GAMEPAD_BUTTON_EAST},
    NamedConstant<SDL_GamepadButton>{"X",             SDL_GAMEPAD_BUTTON_WEST},
    NamedConstant<SDL_GamepadButton>{"Y",             SDL_GAMEPAD_BUTTON_NORTH},
    NamedConstant<SDL_GamepadButton>{"BACK",          SDL_GAMEPAD_BUTTON_BACK},
    NamedConstant<SDL_GamepadButton>{"GUIDE",         SDL_GAMEPAD_BUTTON_GUIDE},
    NamedConstant<SDL_GamepadButton>{"START",         SDL_GAMEPAD_BUTTON_START},
    NamedConstant<SDL_GamepadButton>{"LEFTSTICK",     SDL_GAMEPAD_BUTTON_LEFT_STICK},
    NamedConstant<SDL_GamepadButton>{"RIGHTSTICK",    SDL_GAMEPAD_BUTTON_RIGHT_STICK},
    NamedConstant<SDL_GamepadButton>{"LEFTSHOULDER",  SDL_GAMEPAD_BUTTON_LEFT_SHOULDER},
    NamedConstant<SDL_GamepadButton>{"RIGHTSHOULDER", SDL_GAMEPAD_BUTTON_RIGHT_SHOULDER},
    NamedConstant<SDL_GamepadButton>{"DPAD_UP",       SDL_GAMEPAD_BUTTON_DPAD_UP},
    NamedConstant<SDL_GamepadButton>{"DPAD_DOWN",     SDL_GAMEPAD_BUTTON_DPAD_DOWN},
    NamedConstant<SDL_GamepadButton>{"DPAD_LEFT",     SDL_GAMEPAD_BUTTON_DPAD_LEFT},
    NamedConstant<SDL_GamepadButton>{"DPAD_RIGHT",    SDL_GAMEPAD_BUTTON_DPAD_RIGHT},
    NamedConstant<SDL_GamepadButton>{"MISC1",         SDL_GAMEPAD_BUTTON_MISC1},
    NamedConstant<SDL_GamepadButton>{"RIGHT_PADDLE1", SDL_GAMEPAD_BUTTON_RIGHT_PADDLE1},
    NamedConstant<SDL_GamepadButton>{"LEFT_PADDLE1",  SDL_GAMEPAD_BUTTON_LEFT_PADDLE1},
    NamedConstant<SDL_GamepadButton>{"RIGHT_PADDLE2", SDL_GAMEPAD_BUTTON_RIGHT_PADDLE2},
    NamedConstant<SDL_GamepadButton>{"LEFT_PADDLE2",  SDL_GAMEPAD_BUTTON_LEFT_PADDLE2},
    NamedConstant<SDL_GamepadButton>{"TOUCHPAD",      SDL_GAMEPAD_BUTTON_TOUCHPAD},
    NamedConstant<SDL_GamepadButton>{"MISC2",         SDL_GAMEPAD_BUTTON_MISC2},
    NamedConstant<SDL_GamepadButton>{"MISC3",         SDL_GAMEPAD_BUTTON_MISC3},
    NamedConstant<SDL_GamepadButton>{"MISC4",         SDL_GAMEPAD_BUTTON_MISC4},
    NamedConstant<SDL_GamepadButton>{"MISC5",         SDL_GAMEPAD_BUTTON_MISC5},
    NamedConstant<SDL_GamepadButton>{"MISC6",         SDL_GAMEPAD_BUTTON_MISC6},
    NamedConstant<SDL_GamepadButton>{"MAX",           SDL_GAMEPAD_BUTTON_COUNT},
};

// -----------------------------------------------------------------------------
//          Mappings
// -----------------------------------------------------------------------------

// Returns 1 when the mapping is new, 0 when it replaced an existing one
int AddMapping(const std::string& mapping);
int AddMappingsFromFile(const std::string& path);

std::string MappingFor(const std::string& guid);

std::string AxisNameOf(SDL_GamepadAxis axis);
std::string ButtonNameOf(SDL_GamepadButton button);
SDL_GamepadAxis AxisFromName(const std::string& name);
SDL_GamepadButton ButtonFromName(const std::string& name);

// One entry per connected joystick, empty for devices without a gamepad name
std::vector<std::optional<std::string>> DeviceNames();

// -----------------------------------------------------------------------------
//          Gamepad
// -----------------------------------------------------------------------------

class Gamepad
{
public:
    Gamepad(SDL_Gamepad* gamepad);
    ~Gamepad();

    Gamepad(Gamepad&& other) noexcept;
    Gamepad& operator=(Gamepad&& other) noexcept;

    Gamepad(const Gamepad&) = delete;
    Gamepad& operator=(const Gamepad&) = delete;

    void Destroy();
    bool IsDestroyed() const;

    std::string GetName() const;
    bool IsAttached() const;
    std::string GetMapping() const;
    SDL_JoystickID GetInstanceID() const;

    // [-32768, 32767], triggers [0, 32767]
    int16_t GetAxis(SDL_GamepadAxis axis) const;
    bool IsButtonPressed(SDL_GamepadButton button) const;

    SDL_Gamepad* Get() const;

private:
    SDL_Gamepad* gamepad = nullptr;
    uint64_t generation = 0;
};

Gamepad OpenGamepad(int index);
Gamepad OpenGamepadByID(SDL_JoystickID instance_id);

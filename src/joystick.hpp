#pragma once

#include "common.hpp"

#include <SDL3/SDL_joystick.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

struct DeviceInfo
{
    std::string guid;
    std::string name;
};

// Hat state is an OR of UP/RIGHT/DOWN/LEFT, CENTERED is 0
constexpr std::array hat_constants {
    NamedConstant<uint8_t>{"CENTERED",  SDL_HAT_CENTERED},
    NamedConstant<uint8_t>{"UP",        SDL_HAT_UP},
    NamedConstant<uint8_t>{"RIGHT",     SDL_HAT_RIGHT},
    NamedConstant<uint8_t>{"DOWN",      SDL_HAT_DOWN},
    NamedConstant<uint8_t>{"LEFT",      SDL_HAT_LEFT},
    NamedConstant<uint8_t>{"RIGHTUP",   SDL_HAT_RIGHTUP},
    NamedConstant<uint8_t>{"RIGHTDOWN", SDL_HAT_RIGHTDOWN},
    NamedConstant<uint8_t>{"LEFTUP",    SDL_HAT_LEFTUP},
    NamedConstant<uint8_t>{"LEFTDOWN",  SDL_HAT_LEFTDOWN},
};

// Returns "?" for bit combinations that are not a hat position
std::string_view HatName(uint8_t bits);

std::string GUIDToString(SDL_GUID guid);

// -----------------------------------------------------------------------------
//          Devices
// -----------------------------------------------------------------------------

int NumConnectedJoysticks();
std::vector<DeviceInfo> Devices();

// Instance id of the device at the given index in the current device list
SDL_JoystickID JoystickIDForIndex(int index);

bool IsGamepad(int index);

// -----------------------------------------------------------------------------
//          Joystick
// -----------------------------------------------------------------------------

// An opened joystick. SDL owns the device; this holds the handle until
// Destroy() or destruction, after which every query fails.
class Joystick
{
public:
    Joystick(SDL_Joystick* joystick);
    ~Joystick();

    Joystick(Joystick&& other) noexcept;
    Joystick& operator=(Joystick&& other) noexcept;

    Joystick(const Joystick&) = delete;
    Joystick& operator=(const Joystick&) = delete;

    void Destroy();
    bool IsDestroyed() const;

    bool IsAttached() const;
    std::string GetGUID() const;
    SDL_JoystickID GetInstanceID() const;
    std::string GetName() const;

    int GetNumAxes() const;
    int GetNumBalls() const;
    int GetNumButtons() const;
    int GetNumHats() const;

    int16_t GetAxis(int which) const;
    std::tuple<int, int> GetBall(int which) const;
    bool GetButton(int which) const;
    uint8_t GetHat(int which) const;

    SDL_Joystick* Get() const;

private:
    SDL_Joystick* joystick = nullptr;
    uint64_t generation = 0;
};

Joystick OpenJoystick(int index);
Joystick OpenJoystickByID(SDL_JoystickID instance_id);

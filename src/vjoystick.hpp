#pragma once

#include <SDL3/SDL_joystick.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

struct VirtualJoystickDesc
{
    std::string name = {};

    uint16_t vendor_id = 0;
    uint16_t product_id = 0;

    // Gamepads with no axis/button count get the standard set
    uint16_t num_axes = 0;
    uint16_t num_buttons = 0;
    uint16_t num_balls = 0;
    uint16_t num_hats = 0;

    // Attach as a gamepad. Axes and buttons follow SDL's gamepad order, so
    // axis i is SDL_GamepadAxis i and button i is SDL_GamepadButton i.
    bool gamepad = false;
};

template<typename T>
struct ChannelState
{
    T last = T{};
    T current = {};
    bool dirty = true;

    bool Update()
    {
        if (dirty || current != last) {
            last = current;
            dirty = false;
            return true;
        }
        return false;
    }
};

struct VirtualJoystick : VirtualJoystickDesc
{
    SDL_JoystickID instance_id = 0;
    SDL_Joystick* joystick = nullptr;
    uint64_t generation = 0;

    std::vector<ChannelState<float>> axes;
    std::vector<ChannelState<bool>> buttons;
    std::vector<ChannelState<uint8_t>> hats;
    std::vector<std::array<int, 2>> ball_motion;

    void Destroy();

    float   GetAxis(uint32_t index) const;
    bool  GetButton(uint32_t index) const;
    uint8_t  GetHat(uint32_t index) const;

    void   SetAxis(uint32_t index, float value);
    void SetButton(uint32_t index, bool state);
    void    SetHat(uint32_t index, uint8_t bits);
    void  MoveBall(uint32_t index, int dx, int dy);

    // Pushes changed channels to SDL. Takes effect on the next joystick update.
    bool Update();
};

VirtualJoystick* CreateVirtualJoystick(const VirtualJoystickDesc& desc);

#include "vjoystick.hpp"
#include "common.hpp"
#include "subsystem.hpp"

#include <SDL3/SDL_gamepad.h>

#include <algorithm>
#include <limits>
#include <memory>
#include <ranges>

constexpr int16_t axis_max_value = 32767;

constexpr uint16_t standard_gamepad_axes = SDL_GAMEPAD_AXIS_COUNT;
constexpr uint16_t standard_gamepad_buttons = SDL_GAMEPAD_BUTTON_DPAD_RIGHT + 1;

static
uint32_t LowBits(uint32_t count)
{
    return count >= 32 ? ~0u : (1u << count) - 1;
}

VirtualJoystick* CreateVirtualJoystick(const VirtualJoystickDesc& desc)
{
    auto vjoy = std::make_unique<VirtualJoystick>(VirtualJoystick{{desc}});

    if (vjoy->gamepad) {
        if (!vjoy->num_axes) vjoy->num_axes = standard_gamepad_axes;
        if (!vjoy->num_buttons) vjoy->num_buttons = standard_gamepad_buttons;
        vjoy->num_axes = std::min<uint16_t>(vjoy->num_axes, SDL_GAMEPAD_AXIS_COUNT);
        vjoy->num_buttons = std::min<uint16_t>(vjoy->num_buttons, SDL_GAMEPAD_BUTTON_COUNT);
    }

    SDL_VirtualJoystickDesc sdl_desc;
    SDL_INIT_INTERFACE(&sdl_desc);
    sdl_desc.type = vjoy->gamepad ? SDL_JOYSTICK_TYPE_GAMEPAD : SDL_JOYSTICK_TYPE_UNKNOWN;
    sdl_desc.vendor_id = vjoy->vendor_id;
    sdl_desc.product_id = vjoy->product_id;
    sdl_desc.naxes = vjoy->num_axes;
    sdl_desc.nbuttons = vjoy->num_buttons;
    sdl_desc.nballs = vjoy->num_balls;
    sdl_desc.nhats = vjoy->num_hats;
    sdl_desc.name = vjoy->name.c_str();
    if (vjoy->gamepad) {
        sdl_desc.axis_mask = LowBits(vjoy->num_axes);
        sdl_desc.button_mask = LowBits(vjoy->num_buttons);
    }

    vjoy->instance_id = SDL_AttachVirtualJoystick(&sdl_desc);
    if (!vjoy->instance_id) {
        SdlError(ErrorKind::Device);
    }

    // State is injected through an opened handle
    vjoy->joystick = SDL_OpenJoystick(vjoy->instance_id);
    if (!vjoy->joystick) {
        auto message = std::string(SDL_GetError());
        SDL_DetachVirtualJoystick(vjoy->instance_id);
        Error(ErrorKind::Device, "{}", message);
    }

    vjoy->generation = SubsystemGeneration();
    vjoy->axes.resize(vjoy->num_axes);
    vjoy->buttons.resize(vjoy->num_buttons);
    vjoy->hats.resize(vjoy->num_hats);
    vjoy->ball_motion.resize(vjoy->num_balls);

    Log("Virtual joystick attached: {} ({})", vjoy->name, vjoy->instance_id);

    return vjoy.release();
}

void VirtualJoystick::Destroy()
{
    if (IsSubsystemActive() && generation == SubsystemGeneration()) {
        SDL_CloseJoystick(joystick);
        SDL_DetachVirtualJoystick(instance_id);
    }

    delete this;
}

template<typename Channels>
static
auto& Channel(Channels& channels, uint32_t index, const char* kind)
{
    if (index >= channels.size()) {
        Error(ErrorKind::UnknownIdentifier, "Virtual joystick has no {} {}", kind, index);
    }
    return channels[index];
}

float VirtualJoystick::GetAxis(uint32_t index) const
{
    return Channel(axes, index, "axis").current;
}

bool VirtualJoystick::GetButton(uint32_t index) const
{
    return Channel(buttons, index, "button").current;
}

uint8_t VirtualJoystick::GetHat(uint32_t index) const
{
    return Channel(hats, index, "hat").current;
}

void VirtualJoystick::SetAxis(uint32_t index, float value)
{
    Channel(axes, index, "axis").current = std::clamp(value, -1.f, 1.f);
}

void VirtualJoystick::SetButton(uint32_t index, bool state)
{
    Channel(buttons, index, "button").current = state;
}

void VirtualJoystick::SetHat(uint32_t index, uint8_t bits)
{
    Channel(hats, index, "hat").current = bits;
}

void VirtualJoystick::MoveBall(uint32_t index, int dx, int dy)
{
    auto& motion = Channel(ball_motion, index, "ball");
    motion[0] += dx;
    motion[1] += dy;
}

bool VirtualJoystick::Update()
{
    if (!IsSubsystemActive() || generation != SubsystemGeneration()) return false;

    bool any_change = false;

    for (auto[i, axis] : axes | std::views::enumerate) {
        if (!axis.Update()) continue;
        SDL_SetJoystickVirtualAxis(joystick, int(i), int16_t(axis.current * axis_max_value));
        any_change = true;
    }

    for (auto[i, button] : buttons | std::views::enumerate) {
        if (!button.Update()) continue;
        SDL_SetJoystickVirtualButton(joystick, int(i), button.current);
        any_change = true;
    }

    for (auto[i, hat] : hats | std::views::enumerate) {
        if (!hat.Update()) continue;
        SDL_SetJoystickVirtualHat(joystick, int(i), hat.current);
        any_change = true;
    }

    constexpr int motion_limit = std::numeric_limits<int16_t>::max();
    for (auto[i, motion] : ball_motion | std::views::enumerate) {
        if (!motion[0] && !motion[1]) continue;
        auto dx = int16_t(std::clamp(motion[0], -motion_limit, motion_limit));
        auto dy = int16_t(std::clamp(motion[1], -motion_limit, motion_limit));
        SDL_SetJoystickVirtualBall(joystick, int(i), dx, dy);
        motion = {0, 0};
        any_change = true;
    }

    return any_change;
}

#include "gamepad.hpp"
#include "common.hpp"
#include "joystick.hpp"
#include "subsystem.hpp"

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_stdinc.h>

#include <memory>

// Mapping strings returned by SDL are owned by the caller
using SdlString = std::unique_ptr<char, decltype(&SDL_free)>;

static
std::string TakeSdlString(char* str)
{
    if (!str) {
        SdlError(ErrorKind::Device);
    }
    SdlString owned(str, &SDL_free);
    return owned.get();
}

int AddMapping(const std::string& mapping)
{
    int result = SDL_AddGamepadMapping(mapping.c_str());
    if (result < 0) {
        SdlError(ErrorKind::Device);
    }
    return result;
}

int AddMappingsFromFile(const std::string& path)
{
    int count = SDL_AddGamepadMappingsFromFile(path.c_str());
    if (count < 0) {
        SdlError(ErrorKind::Device);
    }
    return count;
}

std::string MappingFor(const std::string& guid)
{
    auto mapping = SDL_GetGamepadMappingForGUID(SDL_StringToGUID(guid.c_str()));
    if (!mapping) {
        SDL_SetError("No mapping for GUID \"%s\"", guid.c_str());
    }
    return TakeSdlString(mapping);
}

std::string AxisNameOf(SDL_GamepadAxis axis)
{
    auto name = SDL_GetGamepadStringForAxis(axis);
    if (!name) {
        SDL_SetError("Unknown axis %d", int(axis));
        SdlError(ErrorKind::UnknownIdentifier);
    }
    return name;
}

std::string ButtonNameOf(SDL_GamepadButton button)
{
    auto name = SDL_GetGamepadStringForButton(button);
    if (!name) {
        SDL_SetError("Unknown button %d", int(button));
        SdlError(ErrorKind::UnknownIdentifier);
    }
    return name;
}

SDL_GamepadAxis AxisFromName(const std::string& name)
{
    auto axis = SDL_GetGamepadAxisFromString(name.c_str());
    if (axis == SDL_GAMEPAD_AXIS_INVALID) {
        SDL_SetError("Unknown axis name \"%s\"", name.c_str());
        SdlError(ErrorKind::UnknownIdentifier);
    }
    return axis;
}

SDL_GamepadButton ButtonFromName(const std::string& name)
{
    auto button = SDL_GetGamepadButtonFromString(name.c_str());
    if (button == SDL_GAMEPAD_BUTTON_INVALID) {
        SDL_SetError("Unknown button name \"%s\"", name.c_str());
        SdlError(ErrorKind::UnknownIdentifier);
    }
    return button;
}

std::vector<std::optional<std::string>> DeviceNames()
{
    int count = 0;
    auto ids = SDL_GetJoysticks(&count);
    if (!ids) {
        SdlError(ErrorKind::Device);
    }
    Defer _ = [&] { SDL_free(ids); };

    std::vector<std::optional<std::string>> names;
    names.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto name = SDL_GetGamepadNameForID(ids[i]);
        if (name) names.emplace_back(name);
        else      names.emplace_back(std::nullopt);
    }

    return names;
}

// -----------------------------------------------------------------------------

Gamepad::Gamepad(SDL_Gamepad* _gamepad)
    : gamepad(_gamepad)
    , generation(SubsystemGeneration())
{}

Gamepad::~Gamepad()
{
    Destroy();
}

Gamepad::Gamepad(Gamepad&& other) noexcept
    : gamepad(std::exchange(other.gamepad, nullptr))
    , generation(other.generation)
{}

Gamepad& Gamepad::operator=(Gamepad&& other) noexcept
{
    if (this != &other) {
        Destroy();
        gamepad = std::exchange(other.gamepad, nullptr);
        generation = other.generation;
    }
    return *this;
}

void Gamepad::Destroy()
{
    if (gamepad && IsSubsystemActive() && generation == SubsystemGeneration()) {
        SDL_CloseGamepad(gamepad);
    }
    gamepad = nullptr;
}

bool Gamepad::IsDestroyed() const
{
    return !gamepad;
}

SDL_Gamepad* Gamepad::Get() const
{
    if (!gamepad) {
        Error(ErrorKind::InvalidHandle, "Gamepad is already destroyed");
    }
    if (!IsSubsystemActive() || generation != SubsystemGeneration()) {
        Error(ErrorKind::InvalidHandle, "Gamepad was closed by subsystem shutdown");
    }
    return gamepad;
}

std::string Gamepad::GetName() const
{
    auto name = SDL_GetGamepadName(Get());
    if (!name) {
        SdlError(ErrorKind::Device);
    }
    return name;
}

bool Gamepad::IsAttached() const
{
    return SDL_GamepadConnected(Get());
}

std::string Gamepad::GetMapping() const
{
    return TakeSdlString(SDL_GetGamepadMapping(Get()));
}

SDL_JoystickID Gamepad::GetInstanceID() const
{
    auto id = SDL_GetGamepadID(Get());
    if (!id) {
        SdlError(ErrorKind::Device);
    }
    return id;
}

int16_t Gamepad::GetAxis(SDL_GamepadAxis axis) const
{
    return SDL_GetGamepadAxis(Get(), axis);
}

bool Gamepad::IsButtonPressed(SDL_GamepadButton button) const
{
    return SDL_GetGamepadButton(Get(), button);
}

// -----------------------------------------------------------------------------

Gamepad OpenGamepadByID(SDL_JoystickID instance_id)
{
    auto gamepad = SDL_OpenGamepad(instance_id);
    if (!gamepad) {
        SdlError(ErrorKind::Device);
    }
    return Gamepad(gamepad);
}

Gamepad OpenGamepad(int index)
{
    return OpenGamepadByID(JoystickIDForIndex(index));
}

#include "joystick.hpp"
#include "common.hpp"
#include "subsystem.hpp"

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_stdinc.h>

std::string_view HatName(uint8_t bits)
{
    for (auto& hat : hat_constants) {
        if (hat.value == bits) return hat.name;
    }
    return "?";
}

std::string GUIDToString(SDL_GUID guid)
{
    char buf[33];
    SDL_GUIDToString(guid, buf, sizeof(buf));
    return buf;
}

// -----------------------------------------------------------------------------

// The SDL device list, freed on scope exit
struct JoystickList
{
    SDL_JoystickID* ids = nullptr;
    int count = 0;

    JoystickList()
    {
        ids = SDL_GetJoysticks(&count);
        if (!ids) {
            SdlError(ErrorKind::Device);
        }
    }

    ~JoystickList()
    {
        SDL_free(ids);
    }

    JoystickList(const JoystickList&) = delete;
    JoystickList& operator=(const JoystickList&) = delete;
};

int NumConnectedJoysticks()
{
    return JoystickList{}.count;
}

std::vector<DeviceInfo> Devices()
{
    JoystickList list;

    std::vector<DeviceInfo> devices;
    devices.reserve(list.count);
    for (int i = 0; i < list.count; ++i) {
        auto name = SDL_GetJoystickNameForID(list.ids[i]);
        devices.emplace_back(GUIDToString(SDL_GetJoystickGUIDForID(list.ids[i])), name ? name : "");
    }

    return devices;
}

SDL_JoystickID JoystickIDForIndex(int index)
{
    JoystickList list;
    if (index < 0 || index >= list.count) {
        SDL_SetError("Joystick index %d out of range (%d connected)", index, list.count);
        SdlError(ErrorKind::Device);
    }
    return list.ids[index];
}

bool IsGamepad(int index)
{
    JoystickList list;
    if (index < 0 || index >= list.count) return false;
    return SDL_IsGamepad(list.ids[index]);
}

// -----------------------------------------------------------------------------

Joystick::Joystick(SDL_Joystick* _joystick)
    : joystick(_joystick)
    , generation(SubsystemGeneration())
{}

Joystick::~Joystick()
{
    Destroy();
}

Joystick::Joystick(Joystick&& other) noexcept
    : joystick(std::exchange(other.joystick, nullptr))
    , generation(other.generation)
{}

Joystick& Joystick::operator=(Joystick&& other) noexcept
{
    if (this != &other) {
        Destroy();
        joystick = std::exchange(other.joystick, nullptr);
        generation = other.generation;
    }
    return *this;
}

void Joystick::Destroy()
{
    // After subsystem shutdown SDL has already closed the device
    if (joystick && IsSubsystemActive() && generation == SubsystemGeneration()) {
        SDL_CloseJoystick(joystick);
    }
    joystick = nullptr;
}

bool Joystick::IsDestroyed() const
{
    return !joystick;
}

SDL_Joystick* Joystick::Get() const
{
    if (!joystick) {
        Error(ErrorKind::InvalidHandle, "Joystick is already destroyed");
    }
    if (!IsSubsystemActive() || generation != SubsystemGeneration()) {
        Error(ErrorKind::InvalidHandle, "Joystick was closed by subsystem shutdown");
    }
    return joystick;
}

bool Joystick::IsAttached() const
{
    return SDL_JoystickConnected(Get());
}

std::string Joystick::GetGUID() const
{
    return GUIDToString(SDL_GetJoystickGUID(Get()));
}

SDL_JoystickID Joystick::GetInstanceID() const
{
    auto id = SDL_GetJoystickID(Get());
    if (!id) {
        SdlError(ErrorKind::Device);
    }
    return id;
}

std::string Joystick::GetName() const
{
    auto name = SDL_GetJoystickName(Get());
    return name ? name : "";
}

static
int CheckCount(int count)
{
    if (count < 0) {
        SdlError(ErrorKind::Device);
    }
    return count;
}

int Joystick::GetNumAxes()    const { return CheckCount(SDL_GetNumJoystickAxes(Get()));    }
int Joystick::GetNumBalls()   const { return CheckCount(SDL_GetNumJoystickBalls(Get()));   }
int Joystick::GetNumButtons() const { return CheckCount(SDL_GetNumJoystickButtons(Get())); }
int Joystick::GetNumHats()    const { return CheckCount(SDL_GetNumJoystickHats(Get()));    }

int16_t Joystick::GetAxis(int which) const
{
    return SDL_GetJoystickAxis(Get(), which);
}

std::tuple<int, int> Joystick::GetBall(int which) const
{
    int dx = 0, dy = 0;
    if (!SDL_GetJoystickBall(Get(), which, &dx, &dy)) {
        SdlError(ErrorKind::Device);
    }
    return {dx, dy};
}

bool Joystick::GetButton(int which) const
{
    return SDL_GetJoystickButton(Get(), which);
}

uint8_t Joystick::GetHat(int which) const
{
    return SDL_GetJoystickHat(Get(), which);
}

// -----------------------------------------------------------------------------

Joystick OpenJoystickByID(SDL_JoystickID instance_id)
{
    auto joystick = SDL_OpenJoystick(instance_id);
    if (!joystick) {
        SdlError(ErrorKind::Device);
    }
    return Joystick(joystick);
}

Joystick OpenJoystick(int index)
{
    return OpenJoystickByID(JoystickIDForIndex(index));
}

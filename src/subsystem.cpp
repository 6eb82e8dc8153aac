#include "subsystem.hpp"
#include "common.hpp"

#include <SDL3/SDL_init.h>

constexpr SDL_InitFlags subsystem_flags = SDL_INIT_JOYSTICK | SDL_INIT_GAMEPAD;

static uint32_t init_count = 0;
static uint64_t generation = 1;

void InitSubsystems()
{
    if (init_count == 0 && !SDL_InitSubSystem(subsystem_flags)) {
        SdlError(ErrorKind::Device);
    }
    ++init_count;
}

void QuitSubsystems()
{
    if (init_count == 0) return;
    if (--init_count > 0) return;

    SDL_QuitSubSystem(subsystem_flags);
    ++generation;
}

bool IsSubsystemActive()
{
    return init_count > 0;
}

uint64_t SubsystemGeneration()
{
    return generation;
}

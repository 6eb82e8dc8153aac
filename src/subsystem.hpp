#pragma once

#include <cstdint>

// Joystick and gamepad subsystem lifetime. Init/quit calls nest; the
// subsystems are only shut down when the last reference is released.

void InitSubsystems();
void QuitSubsystems();

bool IsSubsystemActive();

// Advanced every time the subsystems are shut down. Handles remember the
// generation they were opened under and are stale once it changes.
uint64_t SubsystemGeneration();

struct SubsystemGuard
{
    SubsystemGuard()
    {
        InitSubsystems();
    }

    ~SubsystemGuard()
    {
        QuitSubsystems();
    }

    SubsystemGuard(const SubsystemGuard&) = delete;
    SubsystemGuard& operator=(const SubsystemGuard&) = delete;
};

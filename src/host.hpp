#pragma once

#include "common.hpp"
#include "gamepad.hpp"
#include "joystick.hpp"
#include "vjoystick.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <SDL3/SDL.h>

#include <sol/sol.hpp>

inline
float FromSNorm(int16_t value)
{
    return std::clamp(float(value) / 32767.f, -1.f, 1.f);
}

// -----------------------------------------------------------------------------
//          Event loop
// -----------------------------------------------------------------------------

inline uint64_t frame = 0;

// Set while the current batch of events touched a joystick
inline bool joystick_event = false;

// Open handles for every attached device, keyed by instance id
inline std::map<SDL_JoystickID, Joystick> joysticks;
inline std::map<SDL_JoystickID, Gamepad> gamepads;

// Sees every event before the host handles it
inline std::function<void(const SDL_Event&)> event_hook;

void Initialize(bool background_events);
void Shutdown();
bool ProcessEvents();
void UpdateScripts();
void PushJoystickUpdateEvent();

// -----------------------------------------------------------------------------
//          Scripts
// -----------------------------------------------------------------------------

struct Script
{
    std::filesystem::path path;
    std::optional<sol::state> lua;
    std::vector<sol::protected_function> callbacks;
    std::vector<VirtualJoystick*> vjoysticks;

    bool disabled = true;
    std::string error;

    void Disable();
    void Destroy();
};

inline std::vector<Script*> scripts;
inline std::vector<Script*> scripts_delete_queue;

void QueueUnloadScript(Script* script);
void FlushScriptDeleteQueue();
void ReportScriptError(Script* script, const std::string& error);
void LoadScript(Script* script);
Script* LoadScript(const std::filesystem::path& script_path);
void UnloadAllScripts();

// -----------------------------------------------------------------------------
//          Inspector
// -----------------------------------------------------------------------------

void OpenGUI();
void DrawGUI();
void CloseGUI();

#include "host.hpp"
#include "subsystem.hpp"

static Uint32 joystick_update_event;

void Initialize(bool background_events)
{
    if (background_events) {
        SDL_SetHint(SDL_HINT_JOYSTICK_ALLOW_BACKGROUND_EVENTS, "1");
    }
    InitSubsystems();
    SDL_SetJoystickEventsEnabled(true);
    SDL_SetGamepadEventsEnabled(true);

    joystick_update_event = SDL_RegisterEvents(1);
    frame = 0;
}

void Shutdown()
{
    UnloadAllScripts();
    gamepads.clear();
    joysticks.clear();
    QuitSubsystems();
    SDL_Quit();
}

// -----------------------------------------------------------------------------

static
void OnJoystickAdded(SDL_JoystickID id)
{
    try {
        auto [it, inserted] = joysticks.try_emplace(id, OpenJoystickByID(id));
        if (!inserted) return;

        auto& joystick = it->second;
        Log("Joystick added: {} [{}] ({} axes, {} buttons, {} hats, {} balls)",
            joystick.GetName(), joystick.GetGUID(),
            joystick.GetNumAxes(), joystick.GetNumButtons(),
            joystick.GetNumHats(), joystick.GetNumBalls());
    } catch (const BindingError& e) {
        Log("WARN: could not open joystick {}: {}", id, e.what());
    }
}

static
void OnGamepadAdded(SDL_JoystickID id)
{
    try {
        auto [it, inserted] = gamepads.try_emplace(id, OpenGamepadByID(id));
        if (inserted) {
            Log("Gamepad added: {}", it->second.GetName());
        }
    } catch (const BindingError& e) {
        Log("WARN: could not open gamepad {}: {}", id, e.what());
    }
}

static
void OnDeviceRemoved(SDL_JoystickID id)
{
    gamepads.erase(id);

    auto node = joysticks.extract(id);
    if (node.empty()) {
        Log("WARN: unknown joystick {} removed", id);
        return;
    }
    Log("Joystick removed: {}", node.mapped().GetName());
}

static
bool IsJoystickActivity(Uint32 type)
{
    switch (type) {
        case SDL_EVENT_JOYSTICK_AXIS_MOTION:
        case SDL_EVENT_JOYSTICK_BALL_MOTION:
        case SDL_EVENT_JOYSTICK_HAT_MOTION:
        case SDL_EVENT_JOYSTICK_BUTTON_DOWN:
        case SDL_EVENT_JOYSTICK_BUTTON_UP:
        case SDL_EVENT_JOYSTICK_UPDATE_COMPLETE:
        case SDL_EVENT_GAMEPAD_REMAPPED:
            return true;
        default:
            return type == joystick_update_event;
    }
}

bool ProcessEvents()
{
    // Poll through start-up, block once the device list has settled
    bool wait = frame++ > 1;

    joystick_event = false;

    SDL_Event event;
    while (wait ? SDL_WaitEvent(&event) : SDL_PollEvent(&event)) {
        wait = false;

        if (event_hook) event_hook(event);

        switch (event.type) {
            case SDL_EVENT_QUIT:
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                Log("Quitting");
                return false;

            case SDL_EVENT_JOYSTICK_ADDED:
                OnJoystickAdded(event.jdevice.which);
                joystick_event = true;
                break;

            case SDL_EVENT_GAMEPAD_ADDED:
                OnGamepadAdded(event.gdevice.which);
                joystick_event = true;
                break;

            case SDL_EVENT_JOYSTICK_REMOVED:
                OnDeviceRemoved(event.jdevice.which);
                joystick_event = true;
                break;

            default:
                joystick_event |= IsJoystickActivity(event.type);
        }
    }

    return true;
}

// -----------------------------------------------------------------------------

// Runs every callback of one script. Returns false if one of them failed.
static
bool RunCallbacks(Script* script)
{
    // Callbacks may Register more callbacks; those first run on the next update
    const size_t count = script->callbacks.size();
    for (size_t i = 0; i < count; ++i) {
        auto callback = script->callbacks[i];

        std::optional<std::string> error;
        {
            auto result = callback.call();
            if (!result.valid()) {
                sol::error e = result;
                error = e.what();
            }
        }

        if (error) {
            ReportScriptError(script, *error);
            return false;
        }
    }
    return true;
}

void UpdateScripts()
{
    if (!joystick_event) return;

    for (auto* script : scripts) {
        if (script->disabled) continue;
        if (!RunCallbacks(script)) {
            script->Disable();
            QueueUnloadScript(script);
        }
    }
    FlushScriptDeleteQueue();

    for (auto* script : scripts) {
        for (auto* vjoy : script->vjoysticks) {
            vjoy->Update();
        }
    }
}

void PushJoystickUpdateEvent()
{
    SDL_Event event = {};
    event.type = joystick_update_event;
    SDL_PushEvent(&event);
}

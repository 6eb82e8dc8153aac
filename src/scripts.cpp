#include "host.hpp"
#include "bindings.hpp"

void Script::Disable()
{
    // Lua handles first, so their devices are closed before virtual ones detach
    callbacks.clear();
    lua = std::nullopt;

    for (auto& joystick : vjoysticks) {
        joystick->Destroy();
    }
    vjoysticks.clear();

    disabled = true;
}

void Script::Destroy()
{
    Disable();
    delete this;
}

void QueueUnloadScript(Script* script)
{
    if (std::ranges::find(scripts_delete_queue, script) != scripts_delete_queue.end()) return;
    scripts_delete_queue.emplace_back(script);
}

void FlushScriptDeleteQueue()
{
    if (scripts_delete_queue.empty()) return;

    for (auto* script : scripts_delete_queue) {
        Log("Unloading [{}]", script->path.string());
        std::erase(scripts, script);
        script->Destroy();
    }
    scripts_delete_queue.clear();
}

void ReportScriptError(Script* script, const std::string& error)
{
    Log("Error in script: {}", error);
    Log("In script: {}", script->path.string());
    script->error = error;
}

void LoadScript(Script* script)
{
    script->Disable();
    script->error.clear();

    auto& lua = script->lua.emplace();

    lua.open_libraries(sol::lib::base, sol::lib::math, sol::lib::string, sol::lib::table);

    RegisterBindings(lua);

    struct LuaVirtualJoystick {
        VirtualJoystick* joystick;
    };

    lua.new_usertype<LuaVirtualJoystick>("VirtualJoystick",
        "GetInstanceID", [](LuaVirtualJoystick& self) { return self.joystick->instance_id; },
        "SetAxis",       [](LuaVirtualJoystick& self, uint32_t i, float v) { self.joystick->SetAxis(i, v); },
        "SetButton",     [](LuaVirtualJoystick& self, uint32_t i, bool v) { self.joystick->SetButton(i, v); },
        "SetHat",        [](LuaVirtualJoystick& self, uint32_t i, int bits) { self.joystick->SetHat(i, uint8_t(bits)); },
        "MoveBall",      [](LuaVirtualJoystick& self, uint32_t i, int dx, int dy) { self.joystick->MoveBall(i, dx, dy); });

    lua.set_function("CreateVirtualJoystick", [script](const sol::table& table) -> LuaVirtualJoystick {
        auto vjoy = CreateVirtualJoystick({
            .name        = table["name"].get<std::string>(),
            .vendor_id   = table["vendor_id"].get_or<uint16_t>(0),
            .product_id  = table["product_id"].get_or<uint16_t>(0),
            .num_axes    = table["num_axes"].get_or<uint16_t>(0),
            .num_buttons = table["num_buttons"].get_or<uint16_t>(0),
            .num_balls   = table["num_balls"].get_or<uint16_t>(0),
            .num_hats    = table["num_hats"].get_or<uint16_t>(0),
            .gamepad     = table["gamepad"].get_or(false),
        });
        script->vjoysticks.emplace_back(vjoy);
        return {vjoy};
    });

    lua.set_function("Register", [script](sol::protected_function f) {
        script->callbacks.emplace_back(std::move(f));
    });

    std::optional<std::string> error;
    {
        auto result = lua.safe_script_file(script->path.string(), sol::script_pass_on_error);
        if (!result.valid()) {
            sol::error e = result;
            error = e.what();
        }
    }

    if (error) {
        ReportScriptError(script, *error);
        script->Disable();
    } else {
        script->disabled = false;
    }
}

static
void UnloadScript(const std::filesystem::path& script_path)
{
    std::erase_if(scripts, [&](auto& script) {
        if (script->path != script_path) return false;
        Log("Unloading [{}]", script_path.string());
        std::erase(scripts_delete_queue, script);
        script->Destroy();
        return true;
    });
}

Script* LoadScript(const std::filesystem::path& script_path)
{
    UnloadScript(script_path);

    Log("Loading [{}]", script_path.string());

    auto script = new Script{script_path};

    LoadScript(script);

    scripts.emplace_back(script);

    return script;
}

void UnloadAllScripts()
{
    scripts_delete_queue.clear();
    for (auto* script : scripts) {
        script->Destroy();
    }
    scripts.clear();
}

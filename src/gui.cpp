#include "host.hpp"

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wlanguage-extension-token"
#include <SDL3/SDL_opengl.h>
#pragma clang diagnostic pop

#include <imgui.h>
#include <backends/imgui_impl_sdl3.h>
#include <backends/imgui_impl_opengl3.h>

static SDL_Window* window;
static SDL_GLContext context;

void OpenGUI()
{
    if (!SDL_InitSubSystem(SDL_INIT_VIDEO)) {
        SdlError(ErrorKind::Device);
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);

    window = SDL_CreateWindow("joybind", 800, 600, SDL_WINDOW_RESIZABLE | SDL_WINDOW_OPENGL);
    if (!window) {
        SdlError(ErrorKind::Device);
    }

    context = SDL_GL_CreateContext(window);
    if (!context) {
        auto message = std::string(SDL_GetError());
        SDL_DestroyWindow(window);
        window = nullptr;
        Error(ErrorKind::Device, "{}", message);
    }
    SDL_GL_MakeCurrent(window, context);
    SDL_GL_SetSwapInterval(1);

    ImGui::CreateContext();
    ImGui_ImplSDL3_InitForOpenGL(window, context);
    ImGui_ImplOpenGL3_Init("#version 330");

    event_hook = [](const SDL_Event& event) {
        ImGui_ImplSDL3_ProcessEvent(&event);
    };
}

void CloseGUI()
{
    if (!window) return;

    event_hook = nullptr;

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(context);
    SDL_DestroyWindow(window);
    context = nullptr;
    window = nullptr;

    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

// -----------------------------------------------------------------------------

// Read-only meter for a signed axis reading
static
void AxisMeter(const std::string& label, int16_t raw)
{
    ImGui::ProgressBar((FromSNorm(raw) + 1.f) * 0.5f, ImVec2(200, 0), std::format("{}", raw).c_str());
    ImGui::SameLine();
    ImGui::TextUnformatted(label.c_str());
}

// Lit while pressed. Wraps to a new row every `per_row` buttons.
static
void ButtonLamp(const std::string& label, bool pressed, int slot, int per_row)
{
    if (slot % per_row) ImGui::SameLine();
    ImGui::BeginDisabled(!pressed);
    ImGui::SmallButton(label.c_str());
    ImGui::EndDisabled();
}

static
void DrawJoystick(SDL_JoystickID id, const Joystick& joystick)
{
    ImGui::PushID(int(id));

    auto header = std::format("{} [{}]###joystick", joystick.GetName(), joystick.GetGUID());
    if (ImGui::CollapsingHeader(header.c_str(), ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("instance %u, %s", unsigned(id), joystick.IsAttached() ? "attached" : "detached");

        for (int i = 0; i < joystick.GetNumAxes(); ++i) {
            AxisMeter(std::format("axis {}", i), joystick.GetAxis(i));
        }
        for (int i = 0; i < joystick.GetNumButtons(); ++i) {
            ButtonLamp(std::format("{}", i), joystick.GetButton(i), i, 12);
        }
        for (int i = 0; i < joystick.GetNumHats(); ++i) {
            ImGui::Text("hat %d: %s", i, std::string(HatName(joystick.GetHat(i))).c_str());
        }
        if (int balls = joystick.GetNumBalls()) {
            ImGui::Text("%d ball(s)", balls);
        }
    }

    ImGui::PopID();
}

static
void DrawGamepad(SDL_JoystickID id, const Gamepad& gamepad)
{
    ImGui::PushID(int(id));

    if (ImGui::CollapsingHeader(std::format("{}###gamepad", gamepad.GetName()).c_str(), ImGuiTreeNodeFlags_DefaultOpen)) {
        for (auto& axis : gamepad_axis_constants) {
            if (axis.value == SDL_GAMEPAD_AXIS_INVALID || axis.value == SDL_GAMEPAD_AXIS_COUNT) continue;
            AxisMeter(AxisNameOf(axis.value), gamepad.GetAxis(axis.value));
        }

        int slot = 0;
        for (auto& button : gamepad_button_constants) {
            if (button.value == SDL_GAMEPAD_BUTTON_INVALID || button.value == SDL_GAMEPAD_BUTTON_COUNT) continue;
            if (!SDL_GamepadHasButton(gamepad.Get(), button.value)) continue;
            ButtonLamp(button.name, gamepad.IsButtonPressed(button.value), slot++, 6);
        }

        if (ImGui::TreeNode("Mapping")) {
            ImGui::TextWrapped("%s", gamepad.GetMapping().c_str());
            ImGui::TreePop();
        }
    }

    ImGui::PopID();
}

void DrawGUI()
{
    if (!window) return;

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();

    auto viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("Devices", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove);

    if (ImGui::BeginTabBar("views")) {
        if (ImGui::BeginTabItem(std::format("Joysticks ({})###joysticks", joysticks.size()).c_str())) {
            for (auto& [id, joystick] : joysticks) {
                DrawJoystick(id, joystick);
            }
            ImGui::EndTabItem();
        }
        if (ImGui::BeginTabItem(std::format("Gamepads ({})###gamepads", gamepads.size()).c_str())) {
            for (auto& [id, gamepad] : gamepads) {
                DrawGamepad(id, gamepad);
            }
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    ImGui::End();

    ImGui::Render();
    int w, h;
    SDL_GetWindowSizeInPixels(window, &w, &h);
    glViewport(0, 0, w, h);
    glClearColor(0.1f, 0.1f, 0.1f, 1.f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(window);
}

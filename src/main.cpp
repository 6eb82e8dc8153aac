#include "host.hpp"

// -----------------------------------------------------------------------------

struct ProgramArgs
{
    bool gui = false;
    bool list = false;
    bool background_events = true;
    std::vector<std::filesystem::path> mapping_files;
    std::vector<std::filesystem::path> initial_script_paths;
};

static
std::filesystem::path ExistingPath(std::string_view arg, std::string_view what)
{
    auto path = std::filesystem::path(arg);
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error(std::format("could not find {} file: {}", what, path.string()));
    }
    return std::filesystem::canonical(path);
}

static
ProgramArgs ParseArgs(int argc, char* argv[])
{
    ProgramArgs args;

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view(argv[i]);
        if      (arg == "--gui")                  args.gui = true;
        else if (arg == "--list")                 args.list = true;
        else if (arg == "--no-background-events") args.background_events = false;
        else if (arg == "--mappings") {
            if (++i == argc) {
                throw std::runtime_error("--mappings expects a file");
            }
            args.mapping_files.emplace_back(ExistingPath(argv[i], "mapping"));
        }
        else if (arg.starts_with("--")) {
            throw std::runtime_error(std::format("unknown option: {}", arg));
        }
        else {
            args.initial_script_paths.emplace_back(ExistingPath(arg, "script"));
        }
    }

    return args;
}

// -----------------------------------------------------------------------------

static
void ListDevices()
{
    auto devices = Devices();
    auto names = DeviceNames();

    Log("{} joystick(s) connected", devices.size());
    for (size_t i = 0; i < devices.size(); ++i) {
        auto gamepad_name = i < names.size() ? names[i] : std::nullopt;
        Log("  [{}] {} ({}){}", i, devices[i].name, devices[i].guid,
            gamepad_name ? std::format(" gamepad: {}", *gamepad_name) : "");
    }
}

static
int Main(int argc, char* argv[]) try
{
    auto args = ParseArgs(argc, argv);

    Initialize(args.background_events);
    Defer _ = [] { Shutdown(); };

    for (auto& mapping_file : args.mapping_files) {
        auto added = AddMappingsFromFile(mapping_file.string());
        Log("Loaded {} mapping(s) from [{}]", added, mapping_file.string());
    }

    if (args.list) {
        ListDevices();
        if (args.initial_script_paths.empty() && !args.gui) return EXIT_SUCCESS;
    }

    for (auto& script_path : args.initial_script_paths) {
        LoadScript(script_path);
    }

    if (args.gui) OpenGUI();
    Defer close_gui = [] { CloseGUI(); };

    while (ProcessEvents()) {
        UpdateScripts();
        if (args.gui) DrawGUI();
    }

    return EXIT_SUCCESS;
}
catch (const std::exception& e)
{
    Log("Exception: {}", e.what());
    return EXIT_FAILURE;
}

int main(int argc, char* argv[])
{
    return Main(argc, argv);
}

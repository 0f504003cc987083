#include "markdd/edit/markdown_editor.hpp"

#include "markdd/hotkeys.hpp"
#include "markdd/logging.hpp"

#include <plog/Log.h>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace
{

void printHelp()
{
    std::cout << markdd::edit::appName() << " - " << markdd::edit::appShortDescription() << "\n\n";
    std::cout << "Usage: " << markdd::edit::appName() << " [OPTIONS] [FILE...]\n";
    std::cout << "Launch the editor and open each FILE provided on the command line.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help            Show this help and exit\n";
    std::cout << "  --set KEY=VALUE       Override a setting for this session\n";
    std::cout << "  --hotkeys SCHEME      Use a hotkey scheme for this session\n";
    std::cout << "  --list-options        Show the available settings and exit\n";
}

bool isHelpFlag(std::string_view arg)
{
    return arg == "--help" || arg == "-h";
}

void printOptions(const markdd::config::SettingsStore &store)
{
    std::cout << "Settings file: " << store.path().string() << "\n\n";
    for (const auto &setting : store.settings())
    {
        std::cout << setting.key << " = " << store.text(setting.key) << "\n";
        std::cout << "    " << setting.description << "\n";
    }
    std::cout << "\nHotkey schemes:\n";
    for (const auto &[id, name] : markdd::hotkeys::availableSchemes())
        std::cout << "  " << id << "  " << name << "\n";
}

// Removes --set arguments from argv and applies them to the store.
bool applySettingOverrides(int &argc, char **argv, markdd::config::SettingsStore &store)
{
    int writeIndex = 1;
    for (int readIndex = 1; readIndex < argc; ++readIndex)
    {
        std::string_view arg(argv[readIndex]);
        std::string_view assignment;
        if (arg.rfind("--set=", 0) == 0)
            assignment = arg.substr(6);
        else if (arg == "--set" && readIndex + 1 < argc)
            assignment = argv[++readIndex];
        else
        {
            argv[writeIndex++] = argv[readIndex];
            continue;
        }

        if (!store.assign(assignment))
        {
            std::cerr << markdd::edit::appName() << ": invalid setting '" << assignment << "'\n";
            return false;
        }
    }
    argc = writeIndex;
    argv[writeIndex] = nullptr;
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    bool listOptions = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg{argv[i]};
        if (isHelpFlag(arg))
        {
            printHelp();
            return 0;
        }
        if (arg == "--list-options")
            listOptions = true;
    }

    markdd::config::SettingsStore store{std::string(markdd::edit::kAppId)};
    markdd::edit::defineEditorSettings(store);
    bool settingsLoaded = store.load();

    if (!applySettingOverrides(argc, argv, store))
        return 2;
    std::optional<std::string> sessionScheme = markdd::hotkeys::takeCommandLineScheme(argc, argv);

    markdd::edit::EditorSettings settings = markdd::edit::loadEditorSettings(store);
    markdd::logging::initialize({markdd::logging::defaultLogPath(markdd::edit::kAppId), settings.logLevel});
    PLOGI << markdd::edit::appName() << " starting";
    if (!settingsLoaded)
        PLOGW << "Using default settings";

    markdd::hotkeys::init();
    if (!markdd::hotkeys::selectScheme(sessionScheme.value_or(settings.hotkeyScheme)))
        markdd::hotkeys::selectScheme(markdd::hotkeys::kAutoScheme);

    if (listOptions)
    {
        printOptions(store);
        return 0;
    }

    markdd::edit::MarkdownEditorApp app(argc, argv, store);
    app.run();
    app.shutDown();
    PLOGI << markdd::edit::appName() << " exiting";
    return 0;
}

#include "markdd/edit/editor_options.hpp"

#include "markdd/logging.hpp"

#include <plog/Log.h>

#include <cstdint>
#include <string>
#include <utility>

namespace markdd::edit
{

void defineEditorSettings(config::SettingsStore &store)
{
    using config::SettingKind;

    store.define({std::string(kOptionAutosaveEnabled), SettingKind::Toggle, false,
                  "Save documents that have a file name automatically."});
    store.define({std::string(kOptionAutosaveInterval), SettingKind::Number, 30,
                  "Seconds of inactivity before an automatic save.", 5, 3600});
    store.define({std::string(kOptionSmartLists), SettingKind::Toggle, true,
                  "Continue bullet, numbered and task lists when Enter is pressed."});

    config::Setting level{std::string(kOptionLogLevel), SettingKind::Choice, "info",
                          "Minimum severity written to the log file."};
    for (std::string_view name : logging::kSeverityNames)
        level.choices.emplace_back(name);
    store.define(std::move(level));

    config::Setting scheme{std::string(kOptionHotkeyScheme), SettingKind::Choice, "auto",
                           "Keyboard shortcut scheme used by menus and the status line."};
    scheme.choices = {"auto", "linux", "mac"};
    store.define(std::move(scheme));
}

EditorSettings loadEditorSettings(const config::SettingsStore &store)
{
    EditorSettings settings;
    settings.autosaveEnabled = store.toggle(kOptionAutosaveEnabled);
    settings.autosaveInterval = std::chrono::seconds(store.number(kOptionAutosaveInterval));
    settings.smartListContinuation = store.toggle(kOptionSmartLists);
    settings.logLevel = logging::parseSeverity(store.choice(kOptionLogLevel));
    settings.hotkeyScheme = store.choice(kOptionHotkeyScheme);
    return settings;
}

void storeEditorSettings(config::SettingsStore &store, const EditorSettings &settings)
{
    store.set(kOptionAutosaveEnabled, settings.autosaveEnabled);
    store.set(kOptionAutosaveInterval, static_cast<std::int64_t>(settings.autosaveInterval.count()));
    store.set(kOptionSmartLists, settings.smartListContinuation);
    store.set(kOptionLogLevel, std::string(logging::severityName(settings.logLevel)));
    store.set(kOptionHotkeyScheme, settings.hotkeyScheme);
    PLOGD << "Editor settings updated";
}

} // namespace markdd::edit

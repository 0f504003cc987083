#pragma once

#include "markdd/settings.hpp"

#include <plog/Severity.h>

#include <chrono>
#include <string>
#include <string_view>

namespace markdd::edit
{

inline constexpr std::string_view kAppId = "markdd-edit";

inline constexpr std::string_view kOptionAutosaveEnabled = "autosaveEnabled";
inline constexpr std::string_view kOptionAutosaveInterval = "autosaveIntervalSeconds";
inline constexpr std::string_view kOptionSmartLists = "smartListContinuation";
inline constexpr std::string_view kOptionLogLevel = "logLevel";
inline constexpr std::string_view kOptionHotkeyScheme = "hotkeyScheme";

struct EditorSettings
{
    bool autosaveEnabled = false;
    std::chrono::seconds autosaveInterval{30};
    bool smartListContinuation = true;
    plog::Severity logLevel = plog::info;
    // "auto" picks the scheme native to the platform.
    std::string hotkeyScheme = "auto";
};

void defineEditorSettings(config::SettingsStore &store);

EditorSettings loadEditorSettings(const config::SettingsStore &store);

void storeEditorSettings(config::SettingsStore &store, const EditorSettings &settings);

} // namespace markdd::edit

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace markdd::config
{

enum class SettingKind
{
    Toggle,
    Number,
    Choice
};

struct Setting
{
    std::string key;
    SettingKind kind = SettingKind::Toggle;
    nlohmann::json fallback;
    std::string description;
    // Number settings are clamped into [minimum, maximum].
    std::int64_t minimum = 0;
    std::int64_t maximum = 0;
    // Choice settings only accept these lowercase names.
    std::vector<std::string> choices;
};

// $XDG_CONFIG_HOME/markdd, falling back to ~/.config/markdd.
std::filesystem::path configRoot();

// Preferences of one application, kept as a single JSON object in
// <config root>/<appId>/settings.json. Values that do not fit their setting
// are rejected rather than coerced to something else.
class SettingsStore
{
public:
    explicit SettingsStore(std::string appId, std::filesystem::path file = {});

    const std::string &appId() const noexcept { return id; }
    const std::filesystem::path &path() const noexcept { return file; }

    void define(Setting setting);
    const std::vector<Setting> &settings() const noexcept { return definitions; }

    bool set(std::string_view key, const nlohmann::json &value);
    // "key=value" as typed on the command line.
    bool assign(std::string_view assignment);

    bool toggle(std::string_view key) const;
    std::int64_t number(std::string_view key) const;
    std::string choice(std::string_view key) const;
    std::string text(std::string_view key) const;

    // A missing file is not an error; a malformed one leaves the fallbacks.
    bool load();
    bool save() const;

private:
    const Setting *find(std::string_view key) const;
    const nlohmann::json &current(const Setting &setting) const;

    std::string id;
    std::filesystem::path file;
    std::vector<Setting> definitions;
    nlohmann::json values = nlohmann::json::object();
};

std::optional<nlohmann::json> parseSettingText(const Setting &setting, std::string_view text);

} // namespace markdd::config

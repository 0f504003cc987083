#include "markdd/settings.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace markdd::config
{
namespace
{

std::string lowercase(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lower;
}

std::optional<nlohmann::json> normalize(const Setting &setting, const nlohmann::json &value)
{
    switch (setting.kind)
    {
    case SettingKind::Toggle:
        if (value.is_boolean())
            return value;
        break;
    case SettingKind::Number:
        if (value.is_number_integer())
            return std::clamp(value.get<std::int64_t>(), setting.minimum, setting.maximum);
        break;
    case SettingKind::Choice:
        if (value.is_string())
        {
            std::string name = lowercase(value.get<std::string>());
            if (std::find(setting.choices.begin(), setting.choices.end(), name) != setting.choices.end())
                return name;
        }
        break;
    }
    return std::nullopt;
}

} // namespace

std::filesystem::path configRoot()
{
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return std::filesystem::path(xdg) / "markdd";
    const char *home = std::getenv("HOME");
    if (home && *home)
        return std::filesystem::path(home) / ".config" / "markdd";
    return std::filesystem::path(".config") / "markdd";
}

std::optional<nlohmann::json> parseSettingText(const Setting &setting, std::string_view text)
{
    switch (setting.kind)
    {
    case SettingKind::Toggle:
    {
        std::string word = lowercase(text);
        if (word == "true" || word == "on" || word == "yes" || word == "1")
            return true;
        if (word == "false" || word == "off" || word == "no" || word == "0")
            return false;
        return std::nullopt;
    }
    case SettingKind::Number:
    {
        std::int64_t number = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
        if (ec != std::errc() || end != text.data() + text.size())
            return std::nullopt;
        return number;
    }
    case SettingKind::Choice:
        return lowercase(text);
    }
    return std::nullopt;
}

SettingsStore::SettingsStore(std::string appId, std::filesystem::path settingsFile)
    : id(std::move(appId)), file(std::move(settingsFile))
{
    if (file.empty())
        file = configRoot() / id / "settings.json";
}

void SettingsStore::define(Setting setting)
{
    auto existing = std::find_if(definitions.begin(), definitions.end(),
                                 [&](const Setting &candidate) { return candidate.key == setting.key; });
    if (existing != definitions.end())
        *existing = std::move(setting);
    else
        definitions.push_back(std::move(setting));
}

const Setting *SettingsStore::find(std::string_view key) const
{
    for (const auto &setting : definitions)
    {
        if (setting.key == key)
            return &setting;
    }
    return nullptr;
}

const nlohmann::json &SettingsStore::current(const Setting &setting) const
{
    auto it = values.find(setting.key);
    return it != values.end() ? *it : setting.fallback;
}

bool SettingsStore::set(std::string_view key, const nlohmann::json &value)
{
    const Setting *setting = find(key);
    if (!setting)
        return false;
    auto normalized = normalize(*setting, value);
    if (!normalized)
        return false;
    values[setting->key] = std::move(*normalized);
    return true;
}

bool SettingsStore::assign(std::string_view assignment)
{
    auto separator = assignment.find('=');
    if (separator == std::string_view::npos)
        return false;
    std::string_view key = assignment.substr(0, separator);
    const Setting *setting = find(key);
    if (!setting)
    {
        PLOGW << "Unknown setting '" << key << "'";
        return false;
    }
    auto parsed = parseSettingText(*setting, assignment.substr(separator + 1));
    return parsed && set(key, *parsed);
}

bool SettingsStore::toggle(std::string_view key) const
{
    const Setting *setting = find(key);
    return setting && current(*setting).is_boolean() && current(*setting).get<bool>();
}

std::int64_t SettingsStore::number(std::string_view key) const
{
    const Setting *setting = find(key);
    if (!setting || !current(*setting).is_number_integer())
        return 0;
    return current(*setting).get<std::int64_t>();
}

std::string SettingsStore::choice(std::string_view key) const
{
    const Setting *setting = find(key);
    if (!setting || !current(*setting).is_string())
        return {};
    return current(*setting).get<std::string>();
}

std::string SettingsStore::text(std::string_view key) const
{
    const Setting *setting = find(key);
    if (!setting)
        return {};
    const nlohmann::json &value = current(*setting);
    return value.is_string() ? value.get<std::string>() : value.dump();
}

bool SettingsStore::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(file, ec))
        return true;

    std::ifstream in(file);
    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &error)
    {
        PLOGW << "Ignoring settings file " << file.string() << ": " << error.what();
        return false;
    }
    if (!data.is_object())
    {
        PLOGW << "Ignoring settings file " << file.string() << ": expected an object";
        return false;
    }

    for (const auto &[key, value] : data.items())
    {
        if (!set(key, value))
            PLOGW << "Ignoring setting '" << key << "' in " << file.string();
    }
    return true;
}

bool SettingsStore::save() const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &setting : definitions)
        data[setting.key] = current(setting);

    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    std::ofstream out(file);
    out << data.dump(2) << '\n';
    if (!out)
    {
        PLOGW << "Unable to write settings file " << file.string();
        return false;
    }
    return true;
}

} // namespace markdd::config

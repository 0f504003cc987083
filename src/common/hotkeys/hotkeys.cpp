#include "markdd/hotkeys.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include <plog/Log.h>

#include <tvision/util.h>

namespace markdd::hotkeys
{

void registerBuiltinHotkeySchemes();

namespace
{

struct SchemeData
{
    std::string id;
    std::string displayName;
    std::unordered_map<std::uint16_t, KeyBinding> bindings;
};

std::vector<SchemeData> gSchemes;
std::string gActiveId;
std::unordered_map<std::uint16_t, std::string> gLabels;

std::string platformSchemeId()
{
#ifdef __APPLE__
    return "mac";
#else
    return "linux";
#endif
}

SchemeData *findScheme(std::string_view id)
{
    auto it = std::find_if(gSchemes.begin(), gSchemes.end(), [&](const SchemeData &scheme) {
        return scheme.id == id;
    });
    return it != gSchemes.end() ? &*it : nullptr;
}

void replaceText(const char *&slot, const std::string &text)
{
    delete[] (char *)slot;
    slot = text.empty() ? nullptr : newStr(text.c_str());
}

} // namespace

void registerSchemes(std::span<const Scheme> schemes)
{
    for (const auto &scheme : schemes)
    {
        SchemeData *data = findScheme(scheme.id);
        if (!data)
        {
            gSchemes.push_back({std::string(scheme.id), std::string(scheme.displayName), {}});
            data = &gSchemes.back();
        }
        for (const auto &binding : scheme.bindings)
        {
            if (binding.command != 0)
                data->bindings[binding.command] = binding;
        }
    }
}

void registerCommandLabels(std::span<const CommandLabel> labels)
{
    for (const auto &entry : labels)
    {
        if (entry.command != 0)
            gLabels[entry.command] = std::string(entry.label);
    }
}

void init()
{
    static bool registered = false;
    if (registered)
        return;
    registered = true;
    registerBuiltinHotkeySchemes();
    if (gActiveId.empty())
        gActiveId = platformSchemeId();
}

std::string resolveScheme(std::string_view preference)
{
    if (preference.empty() || preference == kAutoScheme)
        return platformSchemeId();
    return std::string(preference);
}

bool selectScheme(std::string_view preference)
{
    std::string id = resolveScheme(preference);
    if (!findScheme(id))
    {
        PLOGW << "Unknown hotkey scheme '" << preference << "'";
        return false;
    }
    gActiveId = std::move(id);
    PLOGD << "Hotkey scheme '" << gActiveId << "' active";
    return true;
}

std::string_view activeScheme()
{
    return gActiveId;
}

const KeyBinding *lookup(std::uint16_t command) noexcept
{
    SchemeData *scheme = findScheme(gActiveId);
    if (!scheme)
        return nullptr;
    if (auto it = scheme->bindings.find(command); it != scheme->bindings.end())
        return &it->second;
    return nullptr;
}

std::string statusLabel(std::uint16_t command, std::string_view action)
{
    const auto *binding = lookup(command);
    if (!binding || binding->display.empty())
        return std::string(action);
    return "~" + binding->display + "~ " + std::string(action);
}

void configureMenuTree(TMenuItem &root)
{
    for (TMenuItem *item = &root; item; item = item->next)
    {
        if (item->command)
        {
            const auto *binding = lookup(item->command);
            item->keyCode = binding ? binding->key : TKey(kbNoKey);
            replaceText(item->param, binding ? binding->display : std::string());
        }
        else if (item->subMenu && item->subMenu->items)
            configureMenuTree(*item->subMenu->items);
    }
}

void configureStatusItem(TStatusItem &item, std::string_view action)
{
    const auto *binding = lookup(item.command);
    if (!binding)
        return;
    item.keyCode = binding->key;
    auto label = statusLabel(item.command, action);
    delete[] item.text;
    item.text = newStr(label.c_str());
}

std::string commandLabel(std::uint16_t command)
{
    if (auto it = gLabels.find(command); it != gLabels.end())
        return it->second;
    return {};
}

std::vector<KeyBinding> schemeBindings(std::string_view schemeId)
{
    std::vector<KeyBinding> result;
    if (SchemeData *scheme = findScheme(schemeId))
    {
        for (const auto &[command, binding] : scheme->bindings)
            result.push_back(binding);
        std::sort(result.begin(), result.end(), [](const KeyBinding &a, const KeyBinding &b) {
            return a.command < b.command;
        });
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> availableSchemes()
{
    init();
    std::vector<std::pair<std::string, std::string>> result;
    result.emplace_back(kAutoScheme, "Auto");
    for (const auto &scheme : gSchemes)
        result.emplace_back(scheme.id, scheme.displayName);
    return result;
}

std::optional<std::string> takeCommandLineScheme(int &argc, char **argv)
{
    std::optional<std::string> scheme;
    int writeIndex = 1;
    for (int readIndex = 1; readIndex < argc; ++readIndex)
    {
        std::string_view arg(argv[readIndex]);
        if (arg.rfind("--hotkeys=", 0) == 0)
            scheme = std::string(arg.substr(10));
        else if (arg == "--hotkeys" && readIndex + 1 < argc)
            scheme = std::string(argv[++readIndex]);
        else
            argv[writeIndex++] = argv[readIndex];
    }
    argc = writeIndex;
    argv[writeIndex] = nullptr;
    return scheme;
}

} // namespace markdd::hotkeys

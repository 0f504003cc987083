#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef Uses_TKeys
#define Uses_TKeys
#endif
#ifndef Uses_TMenu
#define Uses_TMenu
#endif
#ifndef Uses_TMenuItem
#define Uses_TMenuItem
#endif
#ifndef Uses_TStatusItem
#define Uses_TStatusItem
#endif

#include <tvision/tv.h>

namespace markdd::hotkeys
{

// Resolves to the scheme native to the platform.
inline constexpr std::string_view kAutoScheme = "auto";

struct KeyBinding
{
    std::uint16_t command = 0;
    TKey key{};
    std::string display; // Human readable label such as "Ctrl-X".
};

struct Scheme
{
    std::string_view id;
    std::string_view displayName;
    std::span<const KeyBinding> bindings;
};

struct CommandLabel
{
    std::uint16_t command = 0;
    std::string_view label;
};

void registerSchemes(std::span<const Scheme> schemes);

void registerCommandLabels(std::span<const CommandLabel> labels);

// Registers the built-in linux and mac schemes once.
void init();

std::string resolveScheme(std::string_view preference);

// Accepts a scheme id or "auto". Unknown ids leave the active scheme alone.
bool selectScheme(std::string_view preference);

std::string_view activeScheme();

const KeyBinding *lookup(std::uint16_t command) noexcept;

std::string statusLabel(std::uint16_t command, std::string_view action);

// Rewrites key codes and shortcut texts of a whole menu, including nested
// submenus. Items whose command is unbound in the active scheme lose their
// shortcut.
void configureMenuTree(TMenuItem &root);

void configureStatusItem(TStatusItem &item, std::string_view action);

std::string commandLabel(std::uint16_t command);

// Bindings of one scheme ordered by command id.
std::vector<KeyBinding> schemeBindings(std::string_view schemeId);

// "auto" first, then every registered scheme as (id, display name).
std::vector<std::pair<std::string, std::string>> availableSchemes();

// Removes "--hotkeys SCHEME" and "--hotkeys=SCHEME" from argv.
std::optional<std::string> takeCommandLineScheme(int &argc, char **argv);

} // namespace markdd::hotkeys

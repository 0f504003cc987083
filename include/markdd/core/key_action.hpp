#pragma once

#include "markdd/core/formatting_engine.hpp"
#include "markdd/core/selection_range.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace markdd::core
{

enum class KeyActionKind
{
    Tab,
    ShiftTab,
    Enter,
    Save,
    Undo,
    Redo,
    ToggleBold,
    ToggleItalic,
    Find,
    Replace,
    PlainInsert
};

struct KeyAction
{
    KeyActionKind kind = KeyActionKind::PlainInsert;
    std::string text; // only meaningful for PlainInsert

    static KeyAction of(KeyActionKind kind) { return KeyAction{kind, std::string()}; }
    static KeyAction insert(std::string text) { return KeyAction{KeyActionKind::PlainInsert, std::move(text)}; }
};

// Work the buffer cannot perform on its own and hands back to the host.
enum class HostCommand
{
    None,
    Save,
    Find,
    Replace
};

struct KeyActionPlan
{
    std::optional<EditInstruction> edit;
    HostCommand hostCommand = HostCommand::None;
    bool historyUndo = false;
    bool historyRedo = false;
};

struct ActionOutcome
{
    bool changed = false;
    HostCommand hostCommand = HostCommand::None;
};

KeyActionPlan planKeyAction(std::string_view content, SelectionRange selection, const KeyAction &action,
                            bool smartListContinuation = true);

} // namespace markdd::core

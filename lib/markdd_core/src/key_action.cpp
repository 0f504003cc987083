#include "markdd/core/key_action.hpp"

#include <utility>

namespace markdd::core
{
namespace
{

EditInstruction plainInsert(std::string_view content, SelectionRange selection, std::string text)
{
    SelectionRange range = selection.clampedTo(content.size());
    std::size_t caret = range.start + text.size();
    return EditInstruction{range, std::move(text), SelectionRange::caret(caret)};
}

} // namespace

KeyActionPlan planKeyAction(std::string_view content, SelectionRange selection, const KeyAction &action,
                            bool smartListContinuation)
{
    KeyActionPlan plan;
    switch (action.kind)
    {
    case KeyActionKind::Tab:
        plan.edit = planTab(content, selection);
        break;
    case KeyActionKind::ShiftTab:
        plan.edit = planOutdent(content, selection);
        break;
    case KeyActionKind::Enter:
        if (smartListContinuation)
            plan.edit = planEnter(content, selection);
        if (!plan.edit)
            plan.edit = plainInsert(content, selection, "\n");
        break;
    case KeyActionKind::ToggleBold:
        plan.edit = planInlineToggle(content, selection, InlineStyle::Bold);
        break;
    case KeyActionKind::ToggleItalic:
        plan.edit = planInlineToggle(content, selection, InlineStyle::Italic);
        break;
    case KeyActionKind::PlainInsert:
        if (!action.text.empty() || !selection.isCaret())
            plan.edit = plainInsert(content, selection, action.text);
        break;
    case KeyActionKind::Undo:
        plan.historyUndo = true;
        break;
    case KeyActionKind::Redo:
        plan.historyRedo = true;
        break;
    case KeyActionKind::Save:
        plan.hostCommand = HostCommand::Save;
        break;
    case KeyActionKind::Find:
        plan.hostCommand = HostCommand::Find;
        break;
    case KeyActionKind::Replace:
        plan.hostCommand = HostCommand::Replace;
        break;
    }
    return plan;
}

} // namespace markdd::core

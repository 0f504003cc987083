#define Uses_TView
#define Uses_TEditor
#include "markdd/hotkeys.hpp"

#include "markdd/commands/markdd_edit.hpp"

namespace markdd::hotkeys
{

namespace
{

namespace edit = markdd::commands::edit;

const KeyBinding kLinuxBindings[] = {
    {cmQuit, TKey(kbAltX), "Alt-X"},
    {cmClose, TKey(kbAltF3), "Alt-F3"},
    {cmMenu, TKey(kbF10), "F10"},
    {cmZoom, TKey(kbF5), "F5"},
    {cmResize, TKey(kbCtrlF5), "Ctrl-F5"},
    {cmNext, TKey(kbF6), "F6"},
    {cmNew, TKey(kbCtrlN), "Ctrl-N"},
    {cmOpen, TKey(kbF3), "F3"},
    {cmSave, TKey(kbCtrlS), "Ctrl-S"},
    {cmSaveAs, TKey(kbShiftF2), "Shift-F2"},

    {cmUndo, TKey(kbCtrlZ), "Ctrl-Z"},
    {edit::cmRedo, TKey(kbCtrlY), "Ctrl-Y"},
    {cmCut, TKey(kbCtrlX), "Ctrl-X"},
    {cmCopy, TKey(kbCtrlC), "Ctrl-C"},
    {cmPaste, TKey(kbCtrlV), "Ctrl-V"},

    {cmFind, TKey(kbCtrlF), "Ctrl-F"},
    {cmReplace, TKey(kbCtrlR), "Ctrl-R"},
    {cmSearchAgain, TKey(kbCtrlL), "Ctrl-L"},
    {edit::cmFindPrevious, TKey(kbCtrlP), "Ctrl-P"},

    {edit::cmBold, TKey(kbAltB), "Alt-B"},
    {edit::cmItalic, TKey(kbAltI), "Alt-I"},
    {edit::cmStrikethrough, TKey(kbAltS), "Alt-S"},
    {edit::cmInlineCode, TKey(kbAltC), "Alt-C"},
    {edit::cmSuperscript, TKey(kbAltU), "Alt-U"},
    {edit::cmSubscript, TKey(kbAltL), "Alt-L"},
    {edit::cmHeading1, TKey(kbAlt1), "Alt-1"},
    {edit::cmHeading2, TKey(kbAlt2), "Alt-2"},
    {edit::cmHeading3, TKey(kbAlt3), "Alt-3"},
    {edit::cmInsertLink, TKey(kbCtrlK), "Ctrl-K"},
    {edit::cmInsertTable, TKey(kbAltT), "Alt-T"},

    {edit::cmAbout, TKey(kbF1), "F1"},
    {edit::cmShowHotkeys, TKey(kbShiftF1), "Shift-F1"},
};

const KeyBinding kMacBindings[] = {
    {cmQuit, TKey(kbCtrlQ), "Ctrl-Q"},
    {cmClose, TKey(kbCtrlW), "Ctrl-W"},
    {cmMenu, TKey(kbF10), "F10"},
    {cmZoom, TKey(kbF5), "F5"},
    {cmResize, TKey(kbCtrlF5), "Ctrl-F5"},
    {cmNext, TKey(kbF6), "F6"},
    {cmNew, TKey(kbCtrlN), "Ctrl-N"},
    {cmOpen, TKey(kbCtrlO), "Ctrl-O"},
    {cmSave, TKey(kbCtrlS), "Ctrl-S"},
    {cmSaveAs, TKey(kbShiftF2), "Shift-F2"},

    {cmUndo, TKey(kbCtrlZ), "Ctrl-Z"},
    {edit::cmRedo, TKey(kbCtrlY), "Ctrl-Y"},
    {cmCut, TKey(kbCtrlX), "Ctrl-X"},
    {cmCopy, TKey(kbCtrlC), "Ctrl-C"},
    {cmPaste, TKey(kbCtrlV), "Ctrl-V"},

    {cmFind, TKey(kbCtrlF), "Ctrl-F"},
    {cmReplace, TKey(kbCtrlR), "Ctrl-R"},
    {cmSearchAgain, TKey(kbCtrlG), "Ctrl-G"},
    {edit::cmFindPrevious, TKey(kbCtrlP), "Ctrl-P"},

    {edit::cmBold, TKey(kbCtrlB), "Ctrl-B"},
    {edit::cmItalic, TKey(kbCtrlE), "Ctrl-E"},
    {edit::cmStrikethrough, TKey(kbCtrlT), "Ctrl-T"},
    {edit::cmInlineCode, TKey(kbCtrlU), "Ctrl-U"},
    {edit::cmHeading1, TKey('1', kbCtrlShift), "Ctrl-1"},
    {edit::cmHeading2, TKey('2', kbCtrlShift), "Ctrl-2"},
    {edit::cmHeading3, TKey('3', kbCtrlShift), "Ctrl-3"},
    {edit::cmInsertLink, TKey(kbCtrlK), "Ctrl-K"},

    {edit::cmAbout, TKey(kbF1), "F1"},
    {edit::cmShowHotkeys, TKey(kbShiftF1), "Shift-F1"},
};

const Scheme kBuiltInSchemes[] = {
    {"linux", "Linux", kLinuxBindings},
    {"mac", "macOS", kMacBindings},
};

const CommandLabel kCommandLabels[] = {
    {cmQuit, "Quit"},
    {cmClose, "Close"},
    {cmMenu, "Menu"},
    {cmZoom, "Zoom"},
    {cmResize, "Resize"},
    {cmNext, "Next Window"},
    {cmNew, "New"},
    {cmOpen, "Open"},
    {cmSave, "Save"},
    {cmSaveAs, "Save As"},
    {cmUndo, "Undo"},
    {edit::cmRedo, "Redo"},
    {cmCut, "Cut"},
    {cmCopy, "Copy"},
    {cmPaste, "Paste"},
    {cmFind, "Find"},
    {cmReplace, "Replace"},
    {cmSearchAgain, "Find Next"},
    {edit::cmFindPrevious, "Find Previous"},
    {edit::cmHeading1, "Heading 1"},
    {edit::cmHeading2, "Heading 2"},
    {edit::cmHeading3, "Heading 3"},
    {edit::cmHeading4, "Heading 4"},
    {edit::cmHeading5, "Heading 5"},
    {edit::cmHeading6, "Heading 6"},
    {edit::cmBold, "Bold"},
    {edit::cmItalic, "Italic"},
    {edit::cmStrikethrough, "Strikethrough"},
    {edit::cmInlineCode, "Inline Code"},
    {edit::cmHighlight, "Highlight"},
    {edit::cmSuperscript, "Superscript"},
    {edit::cmSubscript, "Subscript"},
    {edit::cmCodeBlock, "Code Block"},
    {edit::cmIncreaseIndent, "Indent"},
    {edit::cmDecreaseIndent, "Outdent"},
    {edit::cmInsertLink, "Link"},
    {edit::cmInsertImage, "Image"},
    {edit::cmInsertHorizontalRule, "Horizontal Rule"},
    {edit::cmInsertMath, "Math"},
    {edit::cmInsertKeyboardShortcut, "Keyboard Shortcut"},
    {edit::cmInsertTable, "Table"},
    {edit::cmToggleSmartList, "Smart Lists"},
    {edit::cmToggleAutosave, "Autosave"},
    {edit::cmHotkeyScheme, "Hotkey Scheme"},
    {edit::cmDocumentStats, "Statistics"},
    {edit::cmAbout, "About"},
    {edit::cmShowHotkeys, "Hotkeys"},
};

} // namespace

void registerBuiltinHotkeySchemes()
{
    registerSchemes(kBuiltInSchemes);
    registerCommandLabels(kCommandLabels);
}

} // namespace markdd::hotkeys

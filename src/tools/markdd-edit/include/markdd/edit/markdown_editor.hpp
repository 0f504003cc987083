#pragma once

#include "markdd/core/autosave_scheduler.hpp"
#include "markdd/core/search.hpp"
#include "markdd/core/text_buffer.hpp"
#include "markdd/edit/editor_options.hpp"
#include "markdd/edit/file_persistence.hpp"
#include "markdd/settings.hpp"

#define Uses_TWindow
#define Uses_TFrame
#define Uses_TScrollBar
#define Uses_TView
#define Uses_TRect
#define Uses_TMenu
#define Uses_TEvent
#define Uses_TPoint
#define Uses_TDrawBuffer
#define Uses_TPalette
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusLine
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_TDeskTop
#define Uses_TFileDialog
#define Uses_TCommandSet
#define Uses_TApplication
#define Uses_MsgBox
#define Uses_TKeys
#define Uses_TProgram
#define Uses_TDialog
#define Uses_TObject
#define Uses_TInputLine
#define Uses_TLabel
#define Uses_THistory
#define Uses_TCheckBoxes
#define Uses_TSItem
#define Uses_TButton
#define Uses_TStaticText
#define Uses_TClipboard
#define Uses_TEditor
#include <tvision/tv.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace markdd::edit
{

inline std::string_view appName()
{
    return kAppId;
}

inline std::string_view appShortDescription()
{
    return "Write Markdown in the terminal with list-aware editing.";
}

class MarkdownEditWindow;
class MarkdownEditorApp;

// Renders a TextBuffer and turns keyboard and mouse input into buffer
// operations. Tab, Shift-Tab and Enter always go through the buffer's key
// action path; everything bound to a command arrives as evCommand instead.
class MarkdownBufferView : public TView
{
public:
    MarkdownBufferView(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                       core::TextBuffer &buffer) noexcept;

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual void setState(ushort aState, Boolean enable) override;
    virtual void changeBounds(const TRect &bounds) override;
    virtual TPalette &getPalette() const override;

    // Re-reads the buffer after a change that did not originate here.
    void syncFromBuffer();
    void copySelection();
    void cutSelection();
    void paste();

private:
    core::TextBuffer &buffer;
    TScrollBar *hScrollBar = nullptr;
    TScrollBar *vScrollBar = nullptr;
    TPoint delta{0, 0};
    std::vector<std::size_t> lineStarts;
    std::size_t anchor = 0;
    std::size_t caret = 0;
    std::optional<std::size_t> desiredColumn;

    void rebuildLineIndex();
    std::size_t lineCount() const noexcept { return lineStarts.size(); }
    std::size_t lineOfOffset(std::size_t offset) const noexcept;
    std::string_view lineText(std::size_t line) const noexcept;
    int displayWidth(std::size_t line, std::size_t byteColumn) const;
    std::size_t byteColumnForWidth(std::size_t line, int width) const;

    void moveCaret(std::size_t offset, bool extend);
    void moveVertically(long lines, bool extend);
    void applySelection();
    void adoptBufferSelection();
    void scrollToCaret();
    void updateScrollBars();
    void updateCursor();
    bool handleKey(TEvent &event);
    void handleMouse(TEvent &event);
    std::size_t offsetAt(TPoint local) const;
};

class MarkdownEditWindow : public TWindow
{
public:
    MarkdownEditWindow(const TRect &bounds, std::optional<std::string> fileName, std::string content,
                       const EditorSettings &settings) noexcept;
    ~MarkdownEditWindow() override;

    core::TextBuffer &buffer() noexcept { return *textBuffer; }
    MarkdownBufferView *view() noexcept { return bufferView; }

    bool saveDocument(bool forceSaveAs);
    void applySettings(const EditorSettings &settings);
    void pollAutosave(core::AutosaveScheduler::Clock::time_point now);
    void focusEditor();

    virtual void handleEvent(TEvent &event) override;
    virtual Boolean valid(ushort command) override;

private:
    std::unique_ptr<core::TextBuffer> textBuffer;
    core::TextBuffer::SubscriptionId subscription = 0;
    core::AutosaveScheduler autosave;
    MarkdownBufferView *bufferView = nullptr;
    TScrollBar *hScrollBar = nullptr;
    TScrollBar *vScrollBar = nullptr;

    void onBufferChanged(const core::ChangeEvent &event);
    void updateWindowTitle();
    void applyWindowTitle(const std::string &titleText);
    bool handleEditCommand(ushort command);
    void runFind(bool backwards);
    void runReplace();
    void insertLink(bool image);
    void insertTable();
    void insertCodeBlock();
    bool reportSearchError(const core::InvalidSearchPattern &error);
};

struct SearchState
{
    std::string query;
    std::string replacement;
    core::SearchOptions options;
};

class MarkdownEditorApp : public TApplication
{
public:
    MarkdownEditorApp(int argc, char **argv, config::SettingsStore &store);

    static TMenuBar *initMenuBar(TRect);
    static TStatusLine *initStatusLine(TRect);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    const EditorSettings &settings() const noexcept { return editorSettings; }
    SearchState &search() noexcept { return searchState; }

    void showStatusMessage(const std::string &message);
    void refreshStatus();
    std::optional<std::string> promptSaveAs(const std::optional<std::string> &suggestion);

private:
    config::SettingsStore &store;
    EditorSettings editorSettings;
    SearchState searchState;
    std::optional<core::AutosaveScheduler::Clock::time_point> statusMessageExpiry;

    MarkdownEditWindow *openEditor(std::optional<std::string> fileName, std::string content);
    MarkdownEditWindow *activeEditor() const;
    void fileOpen();
    void fileNew();
    void openPath(const std::string &path);
    void showAbout();
    void showDocumentStats();
    void showHotkeys();
    void toggleSmartLists();
    void toggleAutosave();
    void chooseHotkeys();
    void persistSettings();
    void updateCommandState();
};

} // namespace markdd::edit

#pragma once

#include "markdd/core/cursor_locator.hpp"
#include "markdd/core/document_stats.hpp"
#include "markdd/core/formatting_engine.hpp"
#include "markdd/core/history_store.hpp"
#include "markdd/core/key_action.hpp"
#include "markdd/core/save_collaborator.hpp"
#include "markdd/core/search.hpp"
#include "markdd/core/selection_range.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace markdd::core
{

// Delivered synchronously after every content-changing operation. The view
// into the content is only valid for the duration of the callback.
struct ChangeEvent
{
    std::string_view content;
    bool isModified = false;
    std::optional<std::string> currentFile;
};

// Snapshot handed to a save collaborator. `revision` identifies the buffer
// state it was taken from so a late completion can be recognised.
struct SaveRequest
{
    std::optional<std::string> currentFile;
    std::string content;
    std::uint64_t revision = 0;
};

class TextBuffer
{
public:
    using Observer = std::function<void(const ChangeEvent &)>;
    using SubscriptionId = std::size_t;

    explicit TextBuffer(std::size_t historyCapacity = kDefaultHistoryCapacity);

    const std::string &getContent() const noexcept { return content; }
    const std::optional<std::string> &getCurrentFile() const noexcept { return currentFile; }
    bool isFileModified() const noexcept { return modified; }
    SelectionRange selection() const noexcept { return range; }
    std::string getSelectedText() const;
    CursorPosition cursorPosition() const noexcept;
    DocumentStats stats() const noexcept;
    const HistoryStore &history() const noexcept { return historyStore; }
    std::uint64_t revision() const noexcept { return contentRevision; }

    // Clamped to the content; never recorded in the history.
    void setSelection(std::size_t start, std::size_t end);

    void insertText(std::string_view text);
    void replaceSelection(std::string_view text);
    bool deleteBackward();
    bool deleteForward();
    std::string cutSelection();

    bool indent();
    bool outdent();
    void newline();

    void toggleBold();
    void toggleItalic();
    void toggleStrikethrough();
    void toggleHighlight();
    void toggleInlineCode();
    void toggleSuperscript();
    void toggleSubscript();

    void insertHeading(int level = 1);
    void insertLink(std::string_view url = {});
    void insertImage(std::string_view url = {});
    void insertTable(int rows = 3, int columns = 3);
    void insertMath();
    void insertKeyboardShortcut();
    void insertCodeBlock(std::string_view language = {});
    void insertHorizontalRule();

    bool undo();
    bool redo();

    void newFile();
    void openFile(std::string identity, std::string text);
    void setContent(std::string text);

    // Search operations throw InvalidSearchPattern for malformed regexes.
    bool findNext(std::string_view query, const SearchOptions &options);
    bool findPrevious(std::string_view query, const SearchOptions &options);
    bool replaceCurrent(std::string_view query, std::string_view replacement, const SearchOptions &options);
    std::size_t replaceAll(std::string_view query, std::string_view replacement, const SearchOptions &options);

    SaveRequest beginSave() const;
    void completeSave(const SaveRequest &request, const SaveResult &result);
    SaveResult save(SaveCollaborator &collaborator);

    SubscriptionId subscribe(Observer observer);
    bool unsubscribe(SubscriptionId id);

    ActionOutcome dispatch(const KeyAction &action);

    void setSmartListContinuation(bool enabled);
    bool smartListContinuation() const noexcept { return smartLists; }

private:
    void requireMutable(const char *operation) const;
    bool applyEdit(const EditInstruction &instruction);
    void materialize(const HistorySnapshot &snapshot);
    void recordSnapshot();
    void resetDocument(std::optional<std::string> identity, std::string text, bool recordBaseline);
    void refreshModified() noexcept;
    void notify();

    std::string content;
    std::string savedContent;
    SelectionRange range;
    bool modified = false;
    std::optional<std::string> currentFile;
    HistoryStore historyStore;
    bool smartLists = true;
    std::uint64_t contentRevision = 0;

    std::vector<std::pair<SubscriptionId, Observer>> observers;
    SubscriptionId nextSubscription = 1;
    bool notifying = false;
};

} // namespace markdd::core

#include "markdd/core/text_buffer.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace markdd::core
{
namespace
{

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

class NotificationScope
{
public:
    explicit NotificationScope(bool &flag) noexcept : flag(flag) { flag = true; }
    ~NotificationScope() { flag = false; }

    NotificationScope(const NotificationScope &) = delete;
    NotificationScope &operator=(const NotificationScope &) = delete;

private:
    bool &flag;
};

} // namespace

TextBuffer::TextBuffer(std::size_t historyCapacity) : historyStore(historyCapacity)
{
}

std::string TextBuffer::getSelectedText() const
{
    return content.substr(range.start, range.length());
}

CursorPosition TextBuffer::cursorPosition() const noexcept
{
    return CursorLocator::locate(content, range.start);
}

DocumentStats TextBuffer::stats() const noexcept
{
    return computeStats(content);
}

void TextBuffer::setSelection(std::size_t start, std::size_t end)
{
    requireMutable("setSelection");
    range = SelectionRange::clamped(start, end, content.size());
}

void TextBuffer::insertText(std::string_view text)
{
    requireMutable("insertText");
    std::size_t caret = range.start + text.size();
    applyEdit(EditInstruction{range, std::string(text), SelectionRange::caret(caret)});
}

void TextBuffer::replaceSelection(std::string_view text)
{
    requireMutable("replaceSelection");
    applyEdit(EditInstruction{range, std::string(text), SelectionRange{range.start, range.start + text.size()}});
}

bool TextBuffer::deleteBackward()
{
    requireMutable("deleteBackward");
    if (!range.isCaret())
        return applyEdit(EditInstruction{range, std::string(), SelectionRange::caret(range.start)});
    if (range.start == 0)
        return false;

    std::size_t from = range.start - 1;
    while (from > 0 && isContinuationByte(content[from]))
        --from;
    return applyEdit(EditInstruction{SelectionRange{from, range.start}, std::string(), SelectionRange::caret(from)});
}

bool TextBuffer::deleteForward()
{
    requireMutable("deleteForward");
    if (!range.isCaret())
        return applyEdit(EditInstruction{range, std::string(), SelectionRange::caret(range.start)});
    if (range.start >= content.size())
        return false;

    std::size_t to = range.start + 1;
    while (to < content.size() && isContinuationByte(content[to]))
        ++to;
    return applyEdit(EditInstruction{SelectionRange{range.start, to}, std::string(), SelectionRange::caret(range.start)});
}

std::string TextBuffer::cutSelection()
{
    requireMutable("cutSelection");
    if (range.isCaret())
        return std::string();
    std::string removed = getSelectedText();
    applyEdit(EditInstruction{range, std::string(), SelectionRange::caret(range.start)});
    return removed;
}

bool TextBuffer::indent()
{
    requireMutable("indent");
    return applyEdit(planTab(content, range));
}

bool TextBuffer::outdent()
{
    requireMutable("outdent");
    auto instruction = planOutdent(content, range);
    if (!instruction)
        return false;
    return applyEdit(*instruction);
}

void TextBuffer::newline()
{
    dispatch(KeyAction::of(KeyActionKind::Enter));
}

void TextBuffer::toggleBold()
{
    requireMutable("toggleBold");
    applyEdit(planInlineToggle(content, range, InlineStyle::Bold));
}

void TextBuffer::toggleItalic()
{
    requireMutable("toggleItalic");
    applyEdit(planInlineToggle(content, range, InlineStyle::Italic));
}

void TextBuffer::toggleStrikethrough()
{
    requireMutable("toggleStrikethrough");
    applyEdit(planInlineToggle(content, range, InlineStyle::Strikethrough));
}

void TextBuffer::toggleHighlight()
{
    requireMutable("toggleHighlight");
    applyEdit(planInlineToggle(content, range, InlineStyle::Highlight));
}

void TextBuffer::toggleInlineCode()
{
    requireMutable("toggleInlineCode");
    applyEdit(planInlineToggle(content, range, InlineStyle::Code));
}

void TextBuffer::insertHeading(int level)
{
    requireMutable("insertHeading");
    applyEdit(planHeading(content, range, level));
}

void TextBuffer::insertLink(std::string_view url)
{
    requireMutable("insertLink");
    applyEdit(planLink(content, range, url));
}

void TextBuffer::insertImage(std::string_view url)
{
    requireMutable("insertImage");
    applyEdit(planImage(content, range, url));
}

void TextBuffer::insertTable(int rows, int columns)
{
    requireMutable("insertTable");
    applyEdit(planTable(content, range, rows, columns));
}

void TextBuffer::toggleSuperscript()
{
    requireMutable("toggleSuperscript");
    applyEdit(planInlineToggle(content, range, InlineStyle::Superscript));
}

void TextBuffer::toggleSubscript()
{
    requireMutable("toggleSubscript");
    applyEdit(planInlineToggle(content, range, InlineStyle::Subscript));
}

void TextBuffer::insertKeyboardShortcut()
{
    requireMutable("insertKeyboardShortcut");
    applyEdit(planKeyboardShortcut(content, range));
}

void TextBuffer::insertMath()
{
    requireMutable("insertMath");
    applyEdit(planMath(content, range));
}

void TextBuffer::insertCodeBlock(std::string_view language)
{
    requireMutable("insertCodeBlock");
    applyEdit(planCodeBlock(content, range, language));
}

void TextBuffer::insertHorizontalRule()
{
    requireMutable("insertHorizontalRule");
    applyEdit(planHorizontalRule(content, range));
}

bool TextBuffer::undo()
{
    requireMutable("undo");
    const HistorySnapshot *snapshot = historyStore.undo();
    if (!snapshot)
        return false;
    materialize(*snapshot);
    return true;
}

bool TextBuffer::redo()
{
    requireMutable("redo");
    const HistorySnapshot *snapshot = historyStore.redo();
    if (!snapshot)
        return false;
    materialize(*snapshot);
    return true;
}

void TextBuffer::newFile()
{
    requireMutable("newFile");
    resetDocument(std::nullopt, std::string(), false);
}

void TextBuffer::openFile(std::string identity, std::string text)
{
    requireMutable("openFile");
    PLOGI << "Opened " << identity << " (" << text.size() << " bytes)";
    resetDocument(std::move(identity), std::move(text), true);
}

void TextBuffer::setContent(std::string text)
{
    requireMutable("setContent");
    resetDocument(std::nullopt, std::move(text), true);
}

bool TextBuffer::findNext(std::string_view query, const SearchOptions &options)
{
    requireMutable("findNext");
    SearchPattern pattern(query, options);
    auto match = pattern.findNext(content, range.end);
    if (!match)
        return false;
    range = *match;
    return true;
}

bool TextBuffer::findPrevious(std::string_view query, const SearchOptions &options)
{
    requireMutable("findPrevious");
    SearchPattern pattern(query, options);
    auto match = pattern.findPrevious(content, range.start);
    if (!match)
        return false;
    range = *match;
    return true;
}

bool TextBuffer::replaceCurrent(std::string_view query, std::string_view replacement, const SearchOptions &options)
{
    requireMutable("replaceCurrent");
    SearchPattern pattern(query, options);
    bool replaced = false;
    if (pattern.matchesExactly(content, range))
    {
        std::string text = pattern.replacementFor(content, range, replacement);
        std::size_t caret = range.start + text.size();
        applyEdit(EditInstruction{range, std::move(text), SelectionRange::caret(caret)});
        replaced = true;
    }

    if (auto next = pattern.findNext(content, range.end))
        range = *next;
    return replaced;
}

std::size_t TextBuffer::replaceAll(std::string_view query, std::string_view replacement, const SearchOptions &options)
{
    requireMutable("replaceAll");
    SearchPattern pattern(query, options);
    std::size_t count = 0;
    std::string replaced = pattern.replaceAll(content, replacement, count);
    if (count == 0)
        return 0;

    EditInstruction instruction{SelectionRange{0, content.size()}, std::move(replaced), SelectionRange()};
    instruction.selection = SelectionRange::caret(std::min(range.start, instruction.text.size()));
    applyEdit(instruction);
    PLOGD << "Replaced " << count << " occurrence(s) of '" << query << "'";
    return count;
}

SaveRequest TextBuffer::beginSave() const
{
    return SaveRequest{currentFile, content, contentRevision};
}

void TextBuffer::completeSave(const SaveRequest &request, const SaveResult &result)
{
    requireMutable("completeSave");
    if (!result.success)
    {
        if (result.error)
            PLOGW << "Save failed: " << *result.error;
        return;
    }

    if (result.filePath)
        currentFile = *result.filePath;
    else if (request.currentFile)
        currentFile = request.currentFile;
    savedContent = request.content;
    refreshModified();

    if (request.revision != contentRevision)
        PLOGI << "Saved an earlier revision of " << currentFile.value_or("untitled") << "; newer edits remain unsaved";
    else
        PLOGI << "Saved " << currentFile.value_or("untitled");
    notify();
}

SaveResult TextBuffer::save(SaveCollaborator &collaborator)
{
    requireMutable("save");
    SaveRequest request = beginSave();
    SaveResult result = collaborator.save(request.currentFile, request.content);
    completeSave(request, result);
    return result;
}

TextBuffer::SubscriptionId TextBuffer::subscribe(Observer observer)
{
    SubscriptionId id = nextSubscription++;
    observers.emplace_back(id, std::move(observer));
    return id;
}

bool TextBuffer::unsubscribe(SubscriptionId id)
{
    auto it = std::find_if(observers.begin(), observers.end(),
                           [id](const auto &entry) { return entry.first == id; });
    if (it == observers.end())
        return false;
    observers.erase(it);
    return true;
}

ActionOutcome TextBuffer::dispatch(const KeyAction &action)
{
    requireMutable("dispatch");
    KeyActionPlan plan = planKeyAction(content, range, action, smartLists);

    ActionOutcome outcome;
    outcome.hostCommand = plan.hostCommand;
    if (plan.historyUndo)
        outcome.changed = undo();
    else if (plan.historyRedo)
        outcome.changed = redo();
    else if (plan.edit)
        outcome.changed = applyEdit(*plan.edit);
    return outcome;
}

void TextBuffer::setSmartListContinuation(bool enabled)
{
    requireMutable("setSmartListContinuation");
    smartLists = enabled;
}

void TextBuffer::requireMutable(const char *operation) const
{
    if (notifying)
        throw std::logic_error(std::string("TextBuffer::") + operation + " called from a change observer");
}

bool TextBuffer::applyEdit(const EditInstruction &instruction)
{
    SelectionRange target = instruction.replace.clampedTo(content.size());
    if (target.isCaret() && instruction.text.empty())
    {
        range = instruction.selection.clampedTo(content.size());
        return false;
    }

    content.replace(target.start, target.length(), instruction.text);
    range = instruction.selection.clampedTo(content.size());
    ++contentRevision;
    refreshModified();
    recordSnapshot();
    notify();
    return true;
}

void TextBuffer::materialize(const HistorySnapshot &snapshot)
{
    content = snapshot.content;
    range = snapshot.selection.clampedTo(content.size());
    ++contentRevision;
    refreshModified();
    notify();
}

void TextBuffer::recordSnapshot()
{
    historyStore.record(HistorySnapshot{content, range, std::chrono::system_clock::now()});
}

void TextBuffer::resetDocument(std::optional<std::string> identity, std::string text, bool recordBaseline)
{
    content = std::move(text);
    savedContent = content;
    currentFile = std::move(identity);
    range = SelectionRange::caret(0);
    ++contentRevision;
    historyStore.clear();
    refreshModified();
    if (recordBaseline)
        recordSnapshot();
    notify();
}

void TextBuffer::refreshModified() noexcept
{
    modified = content != savedContent;
}

void TextBuffer::notify()
{
    if (observers.empty())
        return;
    NotificationScope scope(notifying);
    ChangeEvent event{content, modified, currentFile};
    auto snapshot = observers;
    for (const auto &entry : snapshot)
    {
        if (entry.second)
            entry.second(event);
    }
}

} // namespace markdd::core

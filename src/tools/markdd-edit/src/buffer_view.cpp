#include "markdd/edit/markdown_editor.hpp"

#include "markdd/core/cursor_locator.hpp"
#include "markdd/core/key_action.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>

namespace markdd::edit
{

namespace
{

#define cpMarkdownBufferView "\x06\x07"

constexpr int kWheelLines = 3;

// Shared by every window; mirrors what was last sent to the system clipboard.
std::string gClipboardText;

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::size_t previousBoundary(std::string_view content, std::size_t offset) noexcept
{
    if (offset == 0)
        return 0;
    --offset;
    while (offset > 0 && isContinuationByte(content[offset]))
        --offset;
    return offset;
}

std::size_t nextBoundary(std::string_view content, std::size_t offset) noexcept
{
    if (offset >= content.size())
        return content.size();
    ++offset;
    while (offset < content.size() && isContinuationByte(content[offset]))
        ++offset;
    return offset;
}

std::size_t alignToBoundary(std::string_view content, std::size_t offset) noexcept
{
    offset = std::min(offset, content.size());
    while (offset > 0 && offset < content.size() && isContinuationByte(content[offset]))
        --offset;
    return offset;
}

bool isWordByte(char ch) noexcept
{
    auto byte = static_cast<unsigned char>(ch);
    return byte >= 0x80 || std::isalnum(byte) || ch == '_';
}

std::size_t previousWord(std::string_view content, std::size_t offset) noexcept
{
    while (offset > 0 && !isWordByte(content[offset - 1]))
        --offset;
    while (offset > 0 && isWordByte(content[offset - 1]))
        --offset;
    return offset;
}

std::size_t nextWord(std::string_view content, std::size_t offset) noexcept
{
    while (offset < content.size() && isWordByte(content[offset]))
        ++offset;
    while (offset < content.size() && !isWordByte(content[offset]))
        ++offset;
    return offset;
}

// Tabs and carriage returns occupy one cell so byte and cell positions stay
// monotonic.
std::string displayText(std::string_view text)
{
    std::string result(text);
    for (char &ch : result)
    {
        if (ch == '\t' || ch == '\r')
            ch = ' ';
    }
    return result;
}

int cellWidth(std::string_view text)
{
    std::string shown = displayText(text);
    return strwidth(TStringView(shown.data(), shown.size()));
}

} // namespace

MarkdownBufferView::MarkdownBufferView(const TRect &bounds, TScrollBar *hScroll, TScrollBar *vScroll,
                                       core::TextBuffer &buffer) noexcept
    : TView(bounds), buffer(buffer), hScrollBar(hScroll), vScrollBar(vScroll)
{
    growMode = gfGrowHiX | gfGrowHiY;
    options |= ofSelectable | ofFirstClick;
    eventMask |= evBroadcast | evMouseWheel;
    showCursor();
    syncFromBuffer();
}

TPalette &MarkdownBufferView::getPalette() const
{
    static TPalette palette(cpMarkdownBufferView, sizeof(cpMarkdownBufferView) - 1);
    return palette;
}

void MarkdownBufferView::rebuildLineIndex()
{
    const std::string &content = buffer.getContent();
    lineStarts.clear();
    lineStarts.push_back(0);
    for (std::size_t i = 0; i < content.size(); ++i)
    {
        if (content[i] == '\n')
            lineStarts.push_back(i + 1);
    }
}

std::size_t MarkdownBufferView::lineOfOffset(std::size_t offset) const noexcept
{
    auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), offset);
    return static_cast<std::size_t>(std::distance(lineStarts.begin(), it)) - 1;
}

std::string_view MarkdownBufferView::lineText(std::size_t line) const noexcept
{
    std::string_view content = buffer.getContent();
    if (line >= lineStarts.size())
        return {};
    std::size_t start = lineStarts[line];
    std::size_t end = line + 1 < lineStarts.size() ? lineStarts[line + 1] - 1 : content.size();
    return content.substr(start, end - start);
}

int MarkdownBufferView::displayWidth(std::size_t line, std::size_t byteColumn) const
{
    std::string_view text = lineText(line);
    return cellWidth(text.substr(0, std::min(byteColumn, text.size())));
}

std::size_t MarkdownBufferView::byteColumnForWidth(std::size_t line, int width) const
{
    std::string_view text = lineText(line);
    std::size_t column = 0;
    while (column < text.size())
    {
        std::size_t next = nextBoundary(text, column);
        if (cellWidth(text.substr(0, next)) > width)
            break;
        column = next;
    }
    return column;
}

void MarkdownBufferView::syncFromBuffer()
{
    rebuildLineIndex();
    adoptBufferSelection();
    desiredColumn.reset();
    scrollToCaret();
}

void MarkdownBufferView::adoptBufferSelection()
{
    core::SelectionRange selection = buffer.selection();
    anchor = selection.start;
    caret = selection.end;
}

void MarkdownBufferView::applySelection()
{
    buffer.setSelection(std::min(anchor, caret), std::max(anchor, caret));
}

void MarkdownBufferView::moveCaret(std::size_t offset, bool extend)
{
    caret = alignToBoundary(buffer.getContent(), offset);
    if (!extend)
        anchor = caret;
    applySelection();
    scrollToCaret();
}

void MarkdownBufferView::moveVertically(long lines, bool extend)
{
    std::string_view content = buffer.getContent();
    core::CursorPosition position = core::CursorLocator::locate(content, caret);
    if (!desiredColumn)
        desiredColumn = position.column;

    long target = static_cast<long>(position.line) + lines;
    target = std::clamp(target, 1L, static_cast<long>(lineCount()));
    std::size_t offset = core::CursorLocator::offsetOf(
        content, core::CursorPosition{static_cast<std::size_t>(target), *desiredColumn});

    auto keep = desiredColumn;
    moveCaret(offset, extend);
    desiredColumn = keep;
}

void MarkdownBufferView::scrollToCaret()
{
    std::size_t line = lineOfOffset(caret);
    int column = displayWidth(line, caret - lineStarts[line]);
    int row = static_cast<int>(line);

    if (row < delta.y)
        delta.y = row;
    else if (row >= delta.y + size.y)
        delta.y = row - size.y + 1;
    if (column < delta.x)
        delta.x = column;
    else if (column >= delta.x + size.x)
        delta.x = column - size.x + 1;

    delta.y = std::max(0, delta.y);
    delta.x = std::max(0, delta.x);
    updateScrollBars();
    drawView();
    updateCursor();
}

void MarkdownBufferView::updateScrollBars()
{
    std::size_t longest = 0;
    for (std::size_t line = 0; line < lineCount(); ++line)
        longest = std::max(longest, lineText(line).size());

    if (vScrollBar)
    {
        int maxRow = std::max(0, static_cast<int>(lineCount()) - size.y);
        vScrollBar->setParams(delta.y, 0, std::max(maxRow, delta.y), std::max(1, size.y - 1), 1);
    }
    if (hScrollBar)
    {
        int maxColumn = std::max(0, static_cast<int>(longest) - size.x + 1);
        hScrollBar->setParams(delta.x, 0, std::max(maxColumn, delta.x), std::max(1, size.x / 2), 1);
    }
}

void MarkdownBufferView::updateCursor()
{
    std::size_t line = lineOfOffset(caret);
    int x = displayWidth(line, caret - lineStarts[line]) - delta.x;
    int y = static_cast<int>(line) - delta.y;
    setCursor(x, y);
}

void MarkdownBufferView::draw()
{
    const TColorAttr normal = getColor(1);
    const TColorAttr selected = getColor(2);
    const std::size_t selectionStart = std::min(anchor, caret);
    const std::size_t selectionEnd = std::max(anchor, caret);

    for (int y = 0; y < size.y; ++y)
    {
        TDrawBuffer row;
        row.moveChar(0, ' ', normal, size.x);

        std::size_t line = static_cast<std::size_t>(delta.y + y);
        if (line < lineCount())
        {
            std::string_view text = lineText(line);
            std::size_t firstByte = byteColumnForWidth(line, delta.x);
            std::string shown = displayText(text.substr(firstByte));
            row.moveStr(0, TStringView(shown.data(), shown.size()), normal);

            std::size_t lineStart = lineStarts[line];
            std::size_t lineEnd = lineStart + text.size();
            if (selectionStart < selectionEnd && selectionStart <= lineEnd && selectionEnd > lineStart)
            {
                std::size_t from = std::max(selectionStart, lineStart) - lineStart;
                std::size_t to = std::min(selectionEnd, lineEnd) - lineStart;
                int startCell = displayWidth(line, from) - delta.x;
                int endCell = displayWidth(line, to) - delta.x;
                // The selected newline shows as one highlighted cell.
                if (selectionEnd > lineEnd)
                    ++endCell;
                for (int x = std::max(0, startCell); x < std::min<int>(size.x, endCell); ++x)
                    row.putAttribute(x, selected);
            }
        }
        writeLine(0, y, size.x, 1, row);
    }
}

std::size_t MarkdownBufferView::offsetAt(TPoint local) const
{
    long line = static_cast<long>(delta.y) + local.y;
    line = std::clamp(line, 0L, static_cast<long>(lineCount()) - 1);
    std::size_t row = static_cast<std::size_t>(line);
    return lineStarts[row] + byteColumnForWidth(row, delta.x + std::max<int>(0, local.x));
}

void MarkdownBufferView::handleMouse(TEvent &event)
{
    bool extend = (event.mouse.controlKeyState & kbShift) != 0;
    do
    {
        moveCaret(offsetAt(makeLocal(event.mouse.where)), extend);
        extend = true;
    } while (mouseEvent(event, evMouseMove));
    desiredColumn.reset();
}

bool MarkdownBufferView::handleKey(TEvent &event)
{
    const std::string &content = buffer.getContent();
    const bool extend = (event.keyDown.controlKeyState & kbShift) != 0;
    const std::size_t selectionStart = std::min(anchor, caret);
    const std::size_t selectionEnd = std::max(anchor, caret);

    switch (event.keyDown.keyCode)
    {
    case kbTab:
        buffer.dispatch(core::KeyAction::of(core::KeyActionKind::Tab));
        return true;
    case kbShiftTab:
        buffer.dispatch(core::KeyAction::of(core::KeyActionKind::ShiftTab));
        return true;
    case kbEnter:
        buffer.dispatch(core::KeyAction::of(core::KeyActionKind::Enter));
        return true;
    case kbBack:
        buffer.deleteBackward();
        return true;
    case kbDel:
        buffer.deleteForward();
        return true;
    case kbLeft:
        if (!extend && selectionStart != selectionEnd)
            moveCaret(selectionStart, false);
        else
            moveCaret(previousBoundary(content, caret), extend);
        desiredColumn.reset();
        return true;
    case kbRight:
        if (!extend && selectionStart != selectionEnd)
            moveCaret(selectionEnd, false);
        else
            moveCaret(nextBoundary(content, caret), extend);
        desiredColumn.reset();
        return true;
    case kbCtrlLeft:
        moveCaret(previousWord(content, caret), extend);
        desiredColumn.reset();
        return true;
    case kbCtrlRight:
        moveCaret(nextWord(content, caret), extend);
        desiredColumn.reset();
        return true;
    case kbUp:
        moveVertically(-1, extend);
        return true;
    case kbDown:
        moveVertically(1, extend);
        return true;
    case kbPgUp:
        moveVertically(-std::max(1, size.y - 1), extend);
        return true;
    case kbPgDn:
        moveVertically(std::max(1, size.y - 1), extend);
        return true;
    case kbHome:
        moveCaret(lineStarts[lineOfOffset(caret)], extend);
        desiredColumn.reset();
        return true;
    case kbEnd:
    {
        std::size_t line = lineOfOffset(caret);
        moveCaret(lineStarts[line] + lineText(line).size(), extend);
        desiredColumn.reset();
        return true;
    }
    case kbCtrlHome:
        moveCaret(0, extend);
        desiredColumn.reset();
        return true;
    case kbCtrlEnd:
        moveCaret(content.size(), extend);
        desiredColumn.reset();
        return true;
    default:
        break;
    }

    std::string text;
    if (event.keyDown.textLength > 0)
        text.assign(event.keyDown.text, event.keyDown.textLength);
    else if (static_cast<unsigned char>(event.keyDown.charScan.charCode) >= 32 &&
             event.keyDown.charScan.charCode != 127)
        text.assign(1, event.keyDown.charScan.charCode);

    if (text.empty() || static_cast<unsigned char>(text.front()) < 32)
        return false;

    buffer.dispatch(core::KeyAction::insert(std::move(text)));
    return true;
}

void MarkdownBufferView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    switch (event.what)
    {
    case evKeyDown:
        if (handleKey(event))
            clearEvent(event);
        break;
    case evMouseDown:
        handleMouse(event);
        clearEvent(event);
        break;
    case evMouseWheel:
        if (event.mouse.wheel == mwUp || event.mouse.wheel == mwDown)
        {
            int step = event.mouse.wheel == mwUp ? -kWheelLines : kWheelLines;
            int maxRow = std::max(0, static_cast<int>(lineCount()) - size.y);
            delta.y = std::clamp(delta.y + step, 0, maxRow);
            updateScrollBars();
            drawView();
            updateCursor();
            clearEvent(event);
        }
        break;
    case evBroadcast:
        if (event.message.command == cmScrollBarChanged &&
            (event.message.infoPtr == hScrollBar || event.message.infoPtr == vScrollBar))
        {
            if (hScrollBar)
                delta.x = hScrollBar->value;
            if (vScrollBar)
                delta.y = vScrollBar->value;
            drawView();
            updateCursor();
        }
        break;
    default:
        break;
    }
}

void MarkdownBufferView::setState(ushort aState, Boolean enable)
{
    TView::setState(aState, enable);
    if ((aState & sfFocused) != 0 && enable)
        updateCursor();
}

void MarkdownBufferView::changeBounds(const TRect &bounds)
{
    TView::changeBounds(bounds);
    scrollToCaret();
}

void MarkdownBufferView::copySelection()
{
    std::string text = buffer.getSelectedText();
    if (text.empty())
        return;
    gClipboardText = text;
    TClipboard::setText(TStringView(gClipboardText.data(), gClipboardText.size()));
}

void MarkdownBufferView::cutSelection()
{
    copySelection();
    if (!buffer.cutSelection().empty())
        PLOGD << "Cut " << gClipboardText.size() << " bytes";
}

void MarkdownBufferView::paste()
{
    if (gClipboardText.empty())
        return;
    buffer.insertText(gClipboardText);
}

} // namespace markdd::edit

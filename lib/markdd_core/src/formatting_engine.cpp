#include "markdd/core/formatting_engine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace markdd::core
{
namespace
{

struct InlineStyleSpec
{
    InlineStyle style;
    std::string_view marker;
    std::string_view placeholder;
};

// Single-character markers ("*", "~") share their character with a doubled
// marker; the repetition parity in planInlineToggle keeps them apart.
constexpr std::array<InlineStyleSpec, 7> kInlineStyleSpecs{{
    {InlineStyle::Bold, "**", "bold text"},
    {InlineStyle::Italic, "*", "italic text"},
    {InlineStyle::Strikethrough, "~~", "strikethrough text"},
    {InlineStyle::Highlight, "==", "highlighted text"},
    {InlineStyle::Code, "`", "code"},
    {InlineStyle::Superscript, "^", "superscript"},
    {InlineStyle::Subscript, "~", "subscript"},
}};

constexpr std::string_view kDefaultLinkUrl = "https://example.com";
constexpr std::string_view kDefaultImageUrl = "https://example.com/image.jpg";
constexpr std::string_view kUncheckedTaskBox = "[ ] ";

const InlineStyleSpec &specFor(InlineStyle style) noexcept
{
    for (const auto &spec : kInlineStyleSpecs)
    {
        if (spec.style == style)
            return spec;
    }
    return kInlineStyleSpecs.front();
}

bool isBlank(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

std::string_view trim(std::string_view text) noexcept
{
    std::size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first])))
        ++first;
    std::size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1])))
        --last;
    return text.substr(first, last - first);
}

bool atLineStart(std::string_view content, std::size_t offset) noexcept
{
    return offset == 0 || content[offset - 1] == '\n';
}

// Digit string incremented in place so arbitrarily long numbers never overflow.
std::string incrementDecimal(std::string digits)
{
    for (std::size_t i = digits.size(); i-- > 0;)
    {
        if (digits[i] != '9')
        {
            ++digits[i];
            return digits;
        }
        digits[i] = '0';
    }
    digits.insert(digits.begin(), '1');
    return digits;
}

// Range of whole lines touched by the selection. A selection that ends right
// after a newline does not reach into the following line.
SelectionRange lineBlock(std::string_view content, SelectionRange selection) noexcept
{
    std::size_t lastOffset = selection.end;
    if (selection.end > selection.start && content[selection.end - 1] == '\n')
        lastOffset = selection.end - 1;
    return SelectionRange{lineStartAt(content, selection.start), lineEndAt(content, lastOffset)};
}

std::vector<std::string_view> splitLines(std::string_view block)
{
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (true)
    {
        std::size_t next = block.find('\n', pos);
        if (next == std::string_view::npos)
        {
            lines.push_back(block.substr(pos));
            break;
        }
        lines.push_back(block.substr(pos, next - pos));
        pos = next + 1;
    }
    return lines;
}

EditInstruction wrapSelection(std::string_view content, SelectionRange selection,
                              std::string_view prefix, std::string_view placeholder,
                              std::string_view suffix, bool block)
{
    SelectionRange range = selection.clampedTo(content.size());
    bool hadSelection = !range.isCaret();
    std::string lead = (block && !atLineStart(content, range.start)) ? "\n" : "";

    EditInstruction instruction;
    instruction.replace = range;
    instruction.text = lead;
    instruction.text.append(prefix);
    if (hadSelection)
        instruction.text.append(content.substr(range.start, range.length()));
    else
        instruction.text.append(placeholder);
    instruction.text.append(suffix);

    std::size_t endOffset = range.start + instruction.text.size();
    if (hadSelection)
        instruction.selection = SelectionRange{range.start + lead.size(), endOffset};
    else
        instruction.selection = SelectionRange::caret(endOffset);
    return instruction;
}

std::string tableRow(const std::vector<std::string> &cells)
{
    std::string row = "|";
    for (const auto &cell : cells)
    {
        row += ' ';
        row += cell;
        row += " |";
    }
    return row;
}

} // namespace

std::string_view inlineMarker(InlineStyle style) noexcept
{
    return specFor(style).marker;
}

std::string_view inlinePlaceholder(InlineStyle style) noexcept
{
    return specFor(style).placeholder;
}

std::size_t lineStartAt(std::string_view content, std::size_t offset) noexcept
{
    offset = std::min(offset, content.size());
    if (offset == 0)
        return 0;
    std::size_t newline = content.rfind('\n', offset - 1);
    return newline == std::string_view::npos ? 0 : newline + 1;
}

std::size_t lineEndAt(std::string_view content, std::size_t offset) noexcept
{
    offset = std::min(offset, content.size());
    std::size_t newline = content.find('\n', offset);
    return newline == std::string_view::npos ? content.size() : newline;
}

std::optional<ListMarker> detectListMarker(std::string_view line)
{
    std::size_t pos = 0;
    while (pos < line.size() && isBlank(line[pos]))
        ++pos;

    ListMarker marker;
    marker.indent = std::string(line.substr(0, pos));

    if (pos < line.size() && (line[pos] == '-' || line[pos] == '*' || line[pos] == '+'))
    {
        marker.token = std::string(1, line[pos]);
        ++pos;
    }
    else
    {
        std::size_t digitsEnd = pos;
        while (digitsEnd < line.size() && std::isdigit(static_cast<unsigned char>(line[digitsEnd])))
            ++digitsEnd;
        if (digitsEnd == pos || digitsEnd >= line.size() || line[digitsEnd] != '.')
            return std::nullopt;
        marker.token = std::string(line.substr(pos, digitsEnd - pos + 1));
        marker.ordered = true;
        pos = digitsEnd + 1;
    }

    if (pos >= line.size() || !std::isspace(static_cast<unsigned char>(line[pos])))
        return std::nullopt;
    ++pos;

    if (!marker.ordered && line.size() >= pos + 4 && line[pos] == '[' && line[pos + 2] == ']' &&
        (line[pos + 1] == ' ' || line[pos + 1] == 'x' || line[pos + 1] == 'X') &&
        line[pos + 3] == ' ')
    {
        marker.task = true;
        pos += 4;
    }

    marker.length = pos;
    return marker;
}

std::size_t countWrappingMarkers(std::string_view text, std::string_view marker) noexcept
{
    if (marker.empty())
        return 0;
    std::size_t m = marker.size();
    std::size_t count = 0;
    while ((count + 1) * 2 * m < text.size() &&
           text.substr(count * m, m) == marker &&
           text.substr(text.size() - (count + 1) * m, m) == marker)
    {
        ++count;
    }
    return count;
}

EditInstruction planTab(std::string_view content, SelectionRange selection)
{
    SelectionRange range = selection.clampedTo(content.size());
    if (range.isCaret())
    {
        return EditInstruction{range, std::string(kIndentUnit),
                               SelectionRange::caret(range.start + kIndentUnit.size())};
    }

    SelectionRange block = lineBlock(content, range);
    std::string text;
    bool first = true;
    for (auto line : splitLines(content.substr(block.start, block.length())))
    {
        if (!first)
            text += '\n';
        first = false;
        text.append(kIndentUnit);
        text.append(line);
    }
    return EditInstruction{block, text, SelectionRange{block.start, block.start + text.size()}};
}

std::optional<EditInstruction> planOutdent(std::string_view content, SelectionRange selection)
{
    SelectionRange range = selection.clampedTo(content.size());
    SelectionRange block = range.isCaret()
                               ? SelectionRange{lineStartAt(content, range.start), lineEndAt(content, range.start)}
                               : lineBlock(content, range);

    std::string text;
    std::size_t firstLineRemoved = 0;
    bool removedAny = false;
    bool first = true;
    for (auto line : splitLines(content.substr(block.start, block.length())))
    {
        std::size_t removed = 0;
        if (!line.empty() && line.front() == '\t')
        {
            removed = 1;
        }
        else
        {
            while (removed < kIndentUnit.size() && removed < line.size() && line[removed] == ' ')
                ++removed;
        }
        if (first)
            firstLineRemoved = removed;
        else
            text += '\n';
        first = false;
        removedAny = removedAny || removed > 0;
        text.append(line.substr(removed));
    }

    if (!removedAny)
        return std::nullopt;

    SelectionRange result;
    if (range.isCaret())
    {
        std::size_t column = range.start - block.start;
        std::size_t caret = column <= firstLineRemoved ? block.start : range.start - firstLineRemoved;
        result = SelectionRange::caret(caret);
    }
    else
    {
        result = SelectionRange{block.start, block.start + text.size()};
    }
    return EditInstruction{block, text, result};
}

std::optional<EditInstruction> planEnter(std::string_view content, SelectionRange selection)
{
    SelectionRange range = selection.clampedTo(content.size());
    std::size_t lineStart = lineStartAt(content, range.start);
    std::string_view beforeCaret = content.substr(lineStart, range.start - lineStart);

    auto marker = detectListMarker(beforeCaret);
    if (marker)
    {
        std::size_t lineEnd = lineEndAt(content, range.start);
        std::string_view wholeLine = content.substr(lineStart, lineEnd - lineStart);
        auto lineMarker = detectListMarker(wholeLine);
        bool emptyItem = lineMarker && trim(wholeLine.substr(lineMarker->length)).empty();
        if (range.isCaret() && emptyItem)
        {
            return EditInstruction{SelectionRange{lineStart, lineEnd}, std::string(),
                                   SelectionRange::caret(lineStart)};
        }

        std::string text = "\n" + marker->indent;
        text += marker->ordered ? incrementDecimal(marker->token.substr(0, marker->token.size() - 1)) + "." : marker->token;
        text += ' ';
        if (marker->task)
            text.append(kUncheckedTaskBox);
        return EditInstruction{range, text, SelectionRange::caret(range.start + text.size())};
    }

    std::size_t indentLength = 0;
    while (indentLength < beforeCaret.size() && isBlank(beforeCaret[indentLength]))
        ++indentLength;
    if (indentLength == 0)
        return std::nullopt;

    std::string text = "\n" + std::string(beforeCaret.substr(0, indentLength));
    return EditInstruction{range, text, SelectionRange::caret(range.start + text.size())};
}

EditInstruction planInlineToggle(std::string_view content, SelectionRange selection, InlineStyle style)
{
    const auto &spec = specFor(style);
    SelectionRange range = selection.clampedTo(content.size());
    if (range.isCaret())
        return wrapSelection(content, range, spec.marker, spec.placeholder, spec.marker, false);

    std::string_view selected = content.substr(range.start, range.length());
    std::size_t repetitions = countWrappingMarkers(selected, spec.marker);
    std::string text;
    if (repetitions % 2 == 1)
    {
        text = std::string(selected.substr(spec.marker.size(), selected.size() - 2 * spec.marker.size()));
    }
    else
    {
        text.reserve(selected.size() + 2 * spec.marker.size());
        text.append(spec.marker);
        text.append(selected);
        text.append(spec.marker);
    }
    SelectionRange result{range.start, range.start + text.size()};
    return EditInstruction{range, std::move(text), result};
}

EditInstruction planHeading(std::string_view content, SelectionRange selection, int level)
{
    level = std::clamp(level, 1, 6);
    std::string prefix(static_cast<std::size_t>(level), '#');
    prefix += ' ';
    std::string placeholder = "Heading " + std::to_string(level);
    return wrapSelection(content, selection, prefix, placeholder, "", true);
}

EditInstruction planLink(std::string_view content, SelectionRange selection, std::string_view url)
{
    std::string suffix = "](";
    suffix.append(url.empty() ? kDefaultLinkUrl : url);
    suffix += ')';
    return wrapSelection(content, selection, "[", "link text", suffix, false);
}

EditInstruction planImage(std::string_view content, SelectionRange selection, std::string_view url)
{
    std::string suffix = "](";
    suffix.append(url.empty() ? kDefaultImageUrl : url);
    suffix += ')';
    return wrapSelection(content, selection, "![", "image description", suffix, false);
}

EditInstruction planMath(std::string_view content, SelectionRange selection)
{
    return wrapSelection(content, selection, "$", "E = mc^2", "$", false);
}

EditInstruction planKeyboardShortcut(std::string_view content, SelectionRange selection)
{
    return wrapSelection(content, selection, "[[", "Ctrl+Key", "]]", false);
}

EditInstruction planCodeBlock(std::string_view content, SelectionRange selection, std::string_view language)
{
    std::string prefix = "```";
    prefix.append(language);
    prefix += '\n';
    return wrapSelection(content, selection, prefix, "code", "\n```", true);
}

EditInstruction planTable(std::string_view content, SelectionRange selection, int rows, int columns)
{
    rows = std::clamp(rows, 1, 50);
    columns = std::clamp(columns, 1, 12);

    SelectionRange range = selection.clampedTo(content.size());
    std::vector<std::string> cells;
    cells.reserve(static_cast<std::size_t>(columns));
    for (int c = 0; c < columns; ++c)
    {
        if (c == 0 && !range.isCaret())
            cells.emplace_back(content.substr(range.start, range.length()));
        else
            cells.push_back("Header " + std::to_string(c + 1));
    }

    std::ostringstream table;
    table << tableRow(cells) << '\n';
    table << tableRow(std::vector<std::string>(static_cast<std::size_t>(columns), "---")) << '\n';
    for (int r = 1; r < rows; ++r)
    {
        std::vector<std::string> rowCells;
        rowCells.reserve(static_cast<std::size_t>(columns));
        for (int c = 0; c < columns; ++c)
        {
            std::ostringstream cell;
            cell << "Cell " << r << '.' << (c + 1);
            rowCells.push_back(cell.str());
        }
        table << tableRow(rowCells) << '\n';
    }

    std::string lead = atLineStart(content, range.start) ? "" : "\n";
    EditInstruction instruction;
    instruction.replace = range;
    instruction.text = lead + table.str();
    std::size_t endOffset = range.start + instruction.text.size();
    if (range.isCaret())
        instruction.selection = SelectionRange::caret(endOffset);
    else
        instruction.selection = SelectionRange{range.start + lead.size(), endOffset};
    return instruction;
}

EditInstruction planHorizontalRule(std::string_view content, SelectionRange selection)
{
    SelectionRange range = selection.clampedTo(content.size());
    std::size_t at = range.end;
    std::string text;
    if (!atLineStart(content, at))
        text += '\n';
    // A rule directly below a text line would turn that line into a heading.
    if (at > 0)
        text += '\n';
    text += "---\n";
    return EditInstruction{SelectionRange::caret(at), text, SelectionRange::caret(at + text.size())};
}

} // namespace markdd::core

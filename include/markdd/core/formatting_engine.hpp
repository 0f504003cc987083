#pragma once

#include "markdd/core/selection_range.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace markdd::core
{

inline constexpr std::string_view kIndentUnit = "    ";

// A single replacement against the current content. `replace` addresses the
// content before the edit, `selection` the content after it.
struct EditInstruction
{
    SelectionRange replace;
    std::string text;
    SelectionRange selection;
};

enum class InlineStyle
{
    Bold,
    Italic,
    Strikethrough,
    Highlight,
    Code,
    Superscript,
    Subscript
};

struct ListMarker
{
    std::string indent;
    std::string token; // "-", "*", "+" or "<digits>."
    bool ordered = false;
    bool task = false;
    std::size_t length = 0; // indent, token, the following space and any task box
};

std::string_view inlineMarker(InlineStyle style) noexcept;
std::string_view inlinePlaceholder(InlineStyle style) noexcept;

std::size_t lineStartAt(std::string_view content, std::size_t offset) noexcept;
std::size_t lineEndAt(std::string_view content, std::size_t offset) noexcept;

std::optional<ListMarker> detectListMarker(std::string_view line);

// Number of whole marker repetitions wrapping `text` symmetrically while
// leaving a non-empty inner text.
std::size_t countWrappingMarkers(std::string_view text, std::string_view marker) noexcept;

EditInstruction planTab(std::string_view content, SelectionRange selection);
std::optional<EditInstruction> planOutdent(std::string_view content, SelectionRange selection);
std::optional<EditInstruction> planEnter(std::string_view content, SelectionRange selection);
EditInstruction planInlineToggle(std::string_view content, SelectionRange selection, InlineStyle style);

EditInstruction planHeading(std::string_view content, SelectionRange selection, int level);
EditInstruction planLink(std::string_view content, SelectionRange selection, std::string_view url);
EditInstruction planImage(std::string_view content, SelectionRange selection, std::string_view url);
EditInstruction planMath(std::string_view content, SelectionRange selection);
EditInstruction planKeyboardShortcut(std::string_view content, SelectionRange selection);
EditInstruction planCodeBlock(std::string_view content, SelectionRange selection, std::string_view language);
EditInstruction planTable(std::string_view content, SelectionRange selection, int rows, int columns);
EditInstruction planHorizontalRule(std::string_view content, SelectionRange selection);

} // namespace markdd::core

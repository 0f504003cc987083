#pragma once

#include <cstdint>

namespace markdd::commands::edit
{

// Turbo Vision has no redo command of its own.
inline constexpr std::uint16_t cmRedo = 3002;
inline constexpr std::uint16_t cmFindPrevious = 3003;
inline constexpr std::uint16_t cmHeading1 = 3010;
inline constexpr std::uint16_t cmHeading2 = 3011;
inline constexpr std::uint16_t cmHeading3 = 3012;
inline constexpr std::uint16_t cmHeading4 = 3013;
inline constexpr std::uint16_t cmHeading5 = 3014;
inline constexpr std::uint16_t cmHeading6 = 3015;
inline constexpr std::uint16_t cmBold = 3020;
inline constexpr std::uint16_t cmItalic = 3021;
inline constexpr std::uint16_t cmStrikethrough = 3023;
inline constexpr std::uint16_t cmInlineCode = 3024;
inline constexpr std::uint16_t cmCodeBlock = 3025;
inline constexpr std::uint16_t cmHighlight = 3027;
inline constexpr std::uint16_t cmSuperscript = 3028;
inline constexpr std::uint16_t cmSubscript = 3029;
inline constexpr std::uint16_t cmIncreaseIndent = 3035;
inline constexpr std::uint16_t cmDecreaseIndent = 3036;
inline constexpr std::uint16_t cmInsertLink = 3040;
inline constexpr std::uint16_t cmInsertImage = 3043;
inline constexpr std::uint16_t cmInsertHorizontalRule = 3045;
inline constexpr std::uint16_t cmInsertMath = 3047;
inline constexpr std::uint16_t cmInsertKeyboardShortcut = 3048;
inline constexpr std::uint16_t cmInsertTable = 3050;
inline constexpr std::uint16_t cmToggleSmartList = 3080;
inline constexpr std::uint16_t cmToggleAutosave = 3081;
inline constexpr std::uint16_t cmHotkeyScheme = 3082;
inline constexpr std::uint16_t cmDocumentStats = 3085;
inline constexpr std::uint16_t cmAbout = 3090;
inline constexpr std::uint16_t cmShowHotkeys = 3092;

} // namespace markdd::commands::edit

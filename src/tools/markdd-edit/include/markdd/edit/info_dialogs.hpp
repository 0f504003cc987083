#pragma once

#include "markdd/core/cursor_locator.hpp"
#include "markdd/core/document_stats.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace markdd::edit
{

inline constexpr std::string_view kAppDisplayName = "MarkDD Edit";

// Paragraphs separated by blank lines. An empty version or build is left out.
std::string aboutText(std::string_view version, std::string_view build);

std::string statisticsText(const core::DocumentStats &stats, const core::CursorPosition &position);

// One line per labelled binding of the scheme, keys padded to a column.
std::string hotkeyListText(std::string_view schemeId);

// Centered dialog with the message and an OK button.
void showInfoDialog(std::string_view title, const std::string &message);

// Radio list of the hotkey schemes with `current` preselected; nullopt on cancel.
std::optional<std::string> chooseHotkeyScheme(std::string_view current);

} // namespace markdd::edit

#include "markdd/core/cursor_locator.hpp"

#include <algorithm>

namespace markdd::core
{

CursorPosition CursorLocator::locate(std::string_view content, std::size_t offset) noexcept
{
    offset = std::min(offset, content.size());
    CursorPosition position;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset; ++i)
    {
        if (content[i] == '\n')
        {
            ++position.line;
            lineStart = i + 1;
        }
    }
    position.column = offset - lineStart + 1;
    return position;
}

std::size_t CursorLocator::offsetOf(std::string_view content, CursorPosition position) noexcept
{
    std::size_t targetLine = std::max<std::size_t>(position.line, 1);
    std::size_t lineStart = 0;
    std::size_t line = 1;
    while (line < targetLine)
    {
        std::size_t newline = content.find('\n', lineStart);
        if (newline == std::string_view::npos)
            break;
        lineStart = newline + 1;
        ++line;
    }

    std::size_t lineEnd = content.find('\n', lineStart);
    if (lineEnd == std::string_view::npos)
        lineEnd = content.size();
    std::size_t column = std::max<std::size_t>(position.column, 1) - 1;
    return lineStart + std::min(column, lineEnd - lineStart);
}

std::size_t CursorLocator::lineCount(std::string_view content) noexcept
{
    return static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

} // namespace markdd::core

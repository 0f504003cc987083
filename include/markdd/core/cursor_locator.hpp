#pragma once

#include <cstddef>
#include <string_view>

namespace markdd::core
{

// 1-based line and column; the column counts bytes from the line start.
struct CursorPosition
{
    std::size_t line = 1;
    std::size_t column = 1;

    bool operator==(const CursorPosition &other) const noexcept
    {
        return line == other.line && column == other.column;
    }
    bool operator!=(const CursorPosition &other) const noexcept { return !(*this == other); }
};

class CursorLocator
{
public:
    // Offsets past the end of the content are clamped.
    static CursorPosition locate(std::string_view content, std::size_t offset) noexcept;

    // Inverse of locate(). Lines past the end land on the last line and the
    // column is clamped to the line length.
    static std::size_t offsetOf(std::string_view content, CursorPosition position) noexcept;

    static std::size_t lineCount(std::string_view content) noexcept;
};

} // namespace markdd::core

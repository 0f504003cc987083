#pragma once

#include <cstddef>

namespace markdd::core
{

// Byte offsets into a buffer's content. start <= end always holds; equal
// values denote a caret.
struct SelectionRange
{
    std::size_t start = 0;
    std::size_t end = 0;

    static SelectionRange caret(std::size_t offset) noexcept { return SelectionRange{offset, offset}; }

    // Orders the two offsets and clamps both to [0, length].
    static SelectionRange clamped(std::size_t first, std::size_t second, std::size_t length) noexcept;

    SelectionRange clampedTo(std::size_t length) const noexcept { return clamped(start, end, length); }

    bool isCaret() const noexcept { return start == end; }
    std::size_t length() const noexcept { return end - start; }

    bool operator==(const SelectionRange &other) const noexcept
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const SelectionRange &other) const noexcept { return !(*this == other); }
};

} // namespace markdd::core

#include "markdd/core/selection_range.hpp"

#include <algorithm>

namespace markdd::core
{

SelectionRange SelectionRange::clamped(std::size_t first, std::size_t second, std::size_t length) noexcept
{
    std::size_t lo = std::min(std::min(first, second), length);
    std::size_t hi = std::min(std::max(first, second), length);
    return SelectionRange{lo, hi};
}

} // namespace markdd::core

#pragma once

#include <cstddef>
#include <string_view>

namespace markdd::core
{

struct DocumentStats
{
    std::size_t words = 0;
    std::size_t characters = 0; // UTF-8 code points
    std::size_t lines = 0;
};

DocumentStats computeStats(std::string_view content) noexcept;

} // namespace markdd::core

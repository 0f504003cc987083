#include "markdd/core/document_stats.hpp"

#include <cctype>

namespace markdd::core
{

DocumentStats computeStats(std::string_view content) noexcept
{
    DocumentStats stats;
    stats.lines = content.empty() ? 0 : 1;

    bool inWord = false;
    for (char raw : content)
    {
        auto ch = static_cast<unsigned char>(raw);
        // Continuation bytes belong to the preceding code point.
        if ((ch & 0xC0) != 0x80)
            ++stats.characters;
        if (ch == '\n')
            ++stats.lines;

        if (std::isspace(ch))
        {
            inWord = false;
        }
        else if (!inWord)
        {
            inWord = true;
            ++stats.words;
        }
    }
    return stats;
}

} // namespace markdd::core

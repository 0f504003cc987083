#include "markdd/core/search.hpp"

#include <plog/Log.h>

namespace markdd::core
{
namespace
{

std::string escapeLiteral(std::string_view text)
{
    static constexpr std::string_view kSpecial = "\\^$.|?*+()[]{}/";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char ch : text)
    {
        if (kSpecial.find(ch) != std::string_view::npos)
            escaped += '\\';
        escaped += ch;
    }
    return escaped;
}

} // namespace

SearchPattern::SearchPattern(std::string_view text, const SearchOptions &searchOptions)
    : query(text), options(searchOptions)
{
    if (query.empty())
        return;

    std::string source = options.regex ? query : escapeLiteral(query);
    if (options.wholeWord)
        source = "\\b(?:" + source + ")\\b";

    auto flags = std::regex::ECMAScript;
    if (!options.caseSensitive)
        flags |= std::regex::icase;

    try
    {
        pattern = std::regex(source, flags);
    }
    catch (const std::regex_error &error)
    {
        PLOGD << "Rejected search pattern '" << query << "': " << error.what();
        throw InvalidSearchPattern("Invalid regular expression");
    }
}

std::vector<SelectionRange> SearchPattern::findAll(std::string_view content) const
{
    std::vector<SelectionRange> matches;
    if (query.empty() || content.empty())
        return matches;

    const char *begin = content.data();
    std::cregex_iterator it(begin, begin + content.size(), pattern);
    for (std::cregex_iterator end; it != end; ++it)
    {
        if (it->length(0) == 0)
            continue;
        auto start = static_cast<std::size_t>(it->position(0));
        matches.push_back(SelectionRange{start, start + static_cast<std::size_t>(it->length(0))});
    }
    return matches;
}

std::optional<SelectionRange> SearchPattern::findNext(std::string_view content, std::size_t from, bool wrap) const
{
    auto matches = findAll(content);
    for (const auto &match : matches)
    {
        if (match.start >= from)
            return match;
    }
    if (wrap && !matches.empty())
        return matches.front();
    return std::nullopt;
}

std::optional<SelectionRange> SearchPattern::findPrevious(std::string_view content, std::size_t before, bool wrap) const
{
    auto matches = findAll(content);
    for (auto it = matches.rbegin(); it != matches.rend(); ++it)
    {
        if (it->start < before)
            return *it;
    }
    if (wrap && !matches.empty())
        return matches.back();
    return std::nullopt;
}

bool SearchPattern::searchAt(std::string_view content, std::size_t offset, std::cmatch &match) const
{
    if (query.empty() || offset >= content.size())
        return false;
    auto flags = std::regex_constants::match_continuous;
    if (offset > 0)
        flags |= std::regex_constants::match_prev_avail;
    const char *begin = content.data();
    return std::regex_search(begin + offset, begin + content.size(), match, pattern, flags);
}

bool SearchPattern::matchesExactly(std::string_view content, SelectionRange range) const
{
    if (range.isCaret() || range.end > content.size())
        return false;
    std::cmatch match;
    if (!searchAt(content, range.start, match))
        return false;
    return static_cast<std::size_t>(match.length(0)) == range.length();
}

std::string SearchPattern::replacementFor(std::string_view content, SelectionRange range,
                                          std::string_view replacement) const
{
    if (!options.regex)
        return std::string(replacement);
    std::cmatch match;
    if (!searchAt(content, range.start, match))
        return std::string(replacement);
    return match.format(std::string(replacement));
}

std::string SearchPattern::replaceAll(std::string_view content, std::string_view replacement,
                                      std::size_t &count) const
{
    count = 0;
    auto matches = findAll(content);
    if (matches.empty())
        return std::string(content);

    std::string result;
    result.reserve(content.size());
    std::size_t copied = 0;
    for (const auto &match : matches)
    {
        result.append(content.substr(copied, match.start - copied));
        result += replacementFor(content, match, replacement);
        copied = match.end;
        ++count;
    }
    result.append(content.substr(copied));
    return result;
}

} // namespace markdd::core

#pragma once

#include "markdd/core/selection_range.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace markdd::core
{

struct SearchOptions
{
    bool caseSensitive = false;
    bool wholeWord = false;
    bool regex = false;
};

class InvalidSearchPattern : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A compiled query. Plain queries are matched literally; regex queries use
// ECMAScript syntax. Zero-length matches are never reported.
class SearchPattern
{
public:
    SearchPattern(std::string_view query, const SearchOptions &options);

    bool empty() const noexcept { return query.empty(); }
    const SearchOptions &searchOptions() const noexcept { return options; }

    std::vector<SelectionRange> findAll(std::string_view content) const;
    std::optional<SelectionRange> findNext(std::string_view content, std::size_t from, bool wrap = true) const;
    std::optional<SelectionRange> findPrevious(std::string_view content, std::size_t before, bool wrap = true) const;

    bool matchesExactly(std::string_view content, SelectionRange range) const;

    // Replacement text for the match at `range`; regex queries expand $n
    // references, plain queries insert the replacement verbatim.
    std::string replacementFor(std::string_view content, SelectionRange range, std::string_view replacement) const;

    std::string replaceAll(std::string_view content, std::string_view replacement, std::size_t &count) const;

private:
    bool searchAt(std::string_view content, std::size_t offset, std::cmatch &match) const;

    std::string query;
    SearchOptions options;
    std::regex pattern;
};

} // namespace markdd::core

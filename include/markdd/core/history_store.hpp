#pragma once

#include "markdd/core/selection_range.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace markdd::core
{

inline constexpr std::size_t kDefaultHistoryCapacity = 100;

struct HistorySnapshot
{
    std::string content;
    SelectionRange selection;
    std::chrono::system_clock::time_point timestamp;
};

// Bounded, branch-truncating snapshot sequence. The cursor always points at
// the snapshot that is currently materialized in the owning buffer.
class HistoryStore
{
public:
    explicit HistoryStore(std::size_t capacity = kDefaultHistoryCapacity);

    // Discards every snapshot after the cursor, appends the new one and
    // drops the oldest entry once the capacity is exceeded.
    void record(HistorySnapshot snapshot);

    // Both return nullptr at the respective boundary.
    const HistorySnapshot *undo() noexcept;
    const HistorySnapshot *redo() noexcept;

    const HistorySnapshot *current() const noexcept;
    const HistorySnapshot &at(std::size_t position) const;

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    void clear() noexcept;

    bool empty() const noexcept { return snapshots.empty(); }
    std::size_t size() const noexcept { return snapshots.size(); }
    std::size_t capacity() const noexcept { return limit; }
    std::size_t index() const noexcept { return cursor; }

private:
    std::size_t limit;
    std::deque<HistorySnapshot> snapshots;
    std::size_t cursor = 0;
};

} // namespace markdd::core

#include "markdd/core/history_store.hpp"

#include <stdexcept>
#include <utility>

namespace markdd::core
{

HistoryStore::HistoryStore(std::size_t capacity) : limit(capacity)
{
    if (limit == 0)
        throw std::invalid_argument("History capacity must be at least one snapshot");
}

void HistoryStore::record(HistorySnapshot snapshot)
{
    if (!snapshots.empty() && cursor + 1 < snapshots.size())
        snapshots.erase(snapshots.begin() + static_cast<std::ptrdiff_t>(cursor + 1), snapshots.end());

    snapshots.push_back(std::move(snapshot));
    if (snapshots.size() > limit)
        snapshots.pop_front();
    cursor = snapshots.size() - 1;
}

const HistorySnapshot *HistoryStore::undo() noexcept
{
    if (!canUndo())
        return nullptr;
    --cursor;
    return &snapshots[cursor];
}

const HistorySnapshot *HistoryStore::redo() noexcept
{
    if (!canRedo())
        return nullptr;
    ++cursor;
    return &snapshots[cursor];
}

const HistorySnapshot *HistoryStore::current() const noexcept
{
    if (snapshots.empty())
        return nullptr;
    return &snapshots[cursor];
}

const HistorySnapshot &HistoryStore::at(std::size_t position) const
{
    if (position >= snapshots.size())
        throw std::out_of_range("History position out of range");
    return snapshots[position];
}

bool HistoryStore::canUndo() const noexcept
{
    return !snapshots.empty() && cursor > 0;
}

bool HistoryStore::canRedo() const noexcept
{
    return !snapshots.empty() && cursor + 1 < snapshots.size();
}

void HistoryStore::clear() noexcept
{
    snapshots.clear();
    cursor = 0;
}

} // namespace markdd::core

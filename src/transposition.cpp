#include "transposition.hpp"
#include <algorithm>

namespace rookmate {

TranspositionTable::TranspositionTable(std::size_t capacity) : capacity_(capacity) {
    entries.reserve(std::min<std::size_t>(capacity_, 1 << 16));
}

void TranspositionTable::clear() {
    entries.clear();
    hits_ = 0;
}

std::optional<int> TranspositionTable::lookup(const std::string& key, int minDepth) {
    if (!enabled) return std::nullopt;

    auto it = entries.find(key);
    if (it == entries.end()) return std::nullopt;

    const Entry& entry = it->second;
    if (entry.depth < minDepth || entry.bound != Bound::Exact) return std::nullopt;

    hits_++;
    return entry.value;
}

std::optional<int> TranspositionTable::probe(const std::string& key, int depth, int alpha, int beta) {
    if (!enabled) return std::nullopt;

    auto it = entries.find(key);
    if (it == entries.end()) return std::nullopt;

    const Entry& entry = it->second;
    if (entry.depth < depth) return std::nullopt;

    bool usable = entry.bound == Bound::Exact
               || (entry.bound == Bound::LowerBound && entry.value >= beta)
               || (entry.bound == Bound::UpperBound && entry.value <= alpha);
    if (!usable) return std::nullopt;

    hits_++;
    return entry.value;
}

void TranspositionTable::store(const std::string& key, int depth, int value, Bound bound) {
    if (!enabled) return;

    auto it = entries.find(key);
    if (it != entries.end()) {
        if (it->second.depth > depth) return;
        it->second = Entry(value, depth, bound);
        return;
    }
    if (entries.size() >= capacity_) return;
    entries.emplace(key, Entry(value, depth, bound));
}

} // namespace rookmate

#ifndef ROOKMATE_TRANSPOSITION_HPP
#define ROOKMATE_TRANSPOSITION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace rookmate {

class TranspositionTable {
public:
    enum class Bound : std::uint8_t {
        Exact,
        LowerBound,
        UpperBound
    };

    struct Entry {
        int value = 0;
        int depth = 0;
        Bound bound = Bound::Exact;

        Entry() = default;
        Entry(int value, int depth, Bound bound) : value(value), depth(depth), bound(bound) {}
    };

    static constexpr std::size_t defaultCapacity = 1 << 20;

    explicit TranspositionTable(std::size_t capacity = defaultCapacity);

    void clear();

    /**
     * Exact score stored for key, if it was searched at least minDepth plies deep.
     */
    std::optional<int> lookup(const std::string& key, int minDepth);

    /**
     * Score usable inside an (alpha, beta) window: exact entries, lower bounds
     * that fail high and upper bounds that fail low. Shallower entries miss.
     */
    std::optional<int> probe(const std::string& key, int depth, int alpha, int beta);

    // A shallower result never replaces a deeper one. New keys are dropped once
    // the table is full.
    void store(const std::string& key, int depth, int value, Bound bound = Bound::Exact);

    std::size_t size() const { return entries.size(); }
    std::size_t capacity() const { return capacity_; }
    std::uint64_t hits() const { return hits_; }

    bool enabled = true;

private:
    std::unordered_map<std::string, Entry> entries;
    std::size_t capacity_;
    std::uint64_t hits_ = 0;
};

} // namespace rookmate

#endif // ROOKMATE_TRANSPOSITION_HPP

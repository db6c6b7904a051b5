#include <gtest/gtest.h>
#include "transposition.hpp"

using rookmate::TranspositionTable;
using Bound = rookmate::TranspositionTable::Bound;

TEST(TranspositionTableTest, ShallowerEntriesAreIgnored) {
    TranspositionTable table;
    table.store("k", 2, 40);

    EXPECT_EQ(table.lookup("k", 1), 40);
    EXPECT_EQ(table.lookup("k", 2), 40);
    EXPECT_FALSE(table.lookup("k", 3).has_value());
    EXPECT_FALSE(table.lookup("missing", 0).has_value());
    EXPECT_EQ(table.hits(), 2u);
}

TEST(TranspositionTableTest, DeeperEntryIsNotOverwrittenByShallower) {
    TranspositionTable table;
    table.store("k", 4, 100);
    table.store("k", 2, -50);
    EXPECT_EQ(table.lookup("k", 4), 100);

    table.store("k", 5, 7);
    EXPECT_EQ(table.lookup("k", 5), 7);
    EXPECT_EQ(table.size(), 1u);
}

TEST(TranspositionTableTest, BoundsOnlyAnswerWhenTheyProveACutoff) {
    TranspositionTable table;
    table.store("lower", 3, 80, Bound::LowerBound);
    table.store("upper", 3, -20, Bound::UpperBound);

    EXPECT_EQ(table.probe("lower", 3, 0, 50), 80);
    EXPECT_FALSE(table.probe("lower", 3, 0, 100).has_value());
    EXPECT_EQ(table.probe("upper", 2, 0, 50), -20);
    EXPECT_FALSE(table.probe("upper", 2, -40, 50).has_value());

    // lookup() only reports exact scores.
    EXPECT_FALSE(table.lookup("lower", 0).has_value());
}

TEST(TranspositionTableTest, CapacityCapsNewKeys) {
    TranspositionTable table(2);
    table.store("a", 1, 1);
    table.store("b", 1, 2);
    table.store("c", 1, 3);

    EXPECT_EQ(table.size(), 2u);
    EXPECT_FALSE(table.lookup("c", 0).has_value());

    // Existing keys can still be refreshed.
    table.store("a", 2, 10);
    EXPECT_EQ(table.lookup("a", 2), 10);
}

TEST(TranspositionTableTest, DisabledAndClear) {
    TranspositionTable table;
    table.store("k", 1, 5);
    table.clear();
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.hits(), 0u);

    table.enabled = false;
    table.store("k", 1, 5);
    EXPECT_EQ(table.size(), 0u);
    EXPECT_FALSE(table.lookup("k", 0).has_value());
}

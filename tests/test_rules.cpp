#include <gtest/gtest.h>
#include "rules.hpp"
#include "precompute.hpp"
#include "test_helpers.hpp"

using namespace rookmate;
using namespace rookmate::test;

TEST(RulesTest, ClassifiesTerminalPositions) {
    EXPECT_EQ(rules::status(chess::Board(kBlackIsMated)), rules::Status::Checkmate);
    EXPECT_EQ(rules::status(chess::Board(kBlackIsStalemated)), rules::Status::Stalemate);
    EXPECT_EQ(rules::status(chess::Board(kBareKings)), rules::Status::InsufficientMaterial);
    EXPECT_EQ(rules::status(chess::Board(kAttackerStart)), rules::Status::Ongoing);
}

TEST(RulesTest, FiftyMoveRuleMakesDrawClaimable) {
    chess::Board board("4k3/8/8/8/8/8/8/R3K3 w - - 100 80");
    EXPECT_EQ(rules::status(board), rules::Status::DrawClaimable);
    EXPECT_TRUE(rules::isGameOver(board));
}

TEST(RulesTest, PositionKeyIgnoresMoveCounters) {
    chess::Board a("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    chess::Board b("4k3/8/8/8/8/8/8/R3K3 w - - 12 40");
    chess::Board c("4k3/8/8/8/8/8/8/R3K3 b - - 0 1");

    EXPECT_EQ(rules::positionKey(a), rules::positionKey(b));
    EXPECT_NE(rules::positionKey(a), rules::positionKey(c));
    EXPECT_EQ(rules::positionKey(a), "4k3/8/8/8/8/8/8/R3K3 w - -");
}

TEST(RulesTest, ScopedMoveUndoesOnScopeExit) {
    chess::Board board(kAttackerStart);
    const std::string fen = board.getFen();
    const auto hash = board.hash();

    {
        rules::ScopedMove scoped(board, moveFromUci(board, "a1a8"));
        EXPECT_TRUE(board.inCheck());
        EXPECT_EQ(board.sideToMove(), chess::Color::BLACK);
    }

    EXPECT_EQ(board.getFen(), fen);
    EXPECT_EQ(board.hash(), hash);
}

TEST(RulesTest, OppositeColour) {
    EXPECT_EQ(rules::opposite(chess::Color::WHITE), chess::Color::BLACK);
    EXPECT_EQ(rules::opposite(chess::Color::BLACK), chess::Color::WHITE);
}

TEST(PrecomputeTest, SquareGeometry) {
    chess::Square a1(0), e8(60), d4(27), h1(7), c6(42);

    EXPECT_EQ(PrecomputedSquareData::edgeDistance[a1.index()], 0);
    EXPECT_EQ(PrecomputedSquareData::edgeDistance[d4.index()], 3);
    EXPECT_EQ(PrecomputedSquareData::centreManhattanDistance[d4.index()], 0);
    EXPECT_EQ(PrecomputedSquareData::centreManhattanDistance[h1.index()], 6);
    EXPECT_EQ(PrecomputedSquareData::centreChebyshevDistance[a1.index()], 3);
    EXPECT_EQ(PrecomputedSquareData::kingDistance(a1, e8), 7);
    EXPECT_EQ(PrecomputedSquareData::kingDistance(d4, c6), 2);
    EXPECT_TRUE(PrecomputedSquareData::sharesLine(a1, h1));
    EXPECT_FALSE(PrecomputedSquareData::sharesLine(d4, c6));
    EXPECT_EQ(PrecomputedSquareData::fileOf(e8), 4);
    EXPECT_EQ(PrecomputedSquareData::rankOf(e8), 7);
}

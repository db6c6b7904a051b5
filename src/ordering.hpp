#ifndef ROOKMATE_ORDERING_HPP
#define ROOKMATE_ORDERING_HPP

#include "chess.hpp"

namespace rookmate {

// One-ply lookahead used to order moves before the alpha-beta search.
class MoveOrderer {
public:
    static constexpr int mateScore = 10000;
    static constexpr int checkScore = 50;
    static constexpr int captureScore = 30;
    static constexpr int castleScore = 40;
    static constexpr int centreKingBonus = 15;
    static constexpr int centreKingStep = 3;

    explicit MoveOrderer(chess::Color defender) : defender_(defender) {}

    /**
     * Scores the move by playing it and undoing it.
     * The board is left exactly as it was given.
     */
    int scoreMove(chess::Board& board, chess::Move move) const;

    /**
     * Sorts the moves best-first for the maximizing side and
     * worst-first for the minimizing side. Equal scores keep
     * their generation order.
     */
    void orderMoves(chess::Board& board, chess::Movelist& moves, bool maximizing) const;

private:
    chess::Color defender_;
};

} // namespace rookmate

#endif // ROOKMATE_ORDERING_HPP

#ifndef ROOKMATE_RULES_HPP
#define ROOKMATE_RULES_HPP

#include <string>
#include "chess.hpp"

namespace rookmate {

constexpr int MATE_SCORE = 10000;
constexpr int INFINITE_SCORE = 1000000;

namespace rules {

enum class Status {
    Ongoing,
    Checkmate,
    Stalemate,
    InsufficientMaterial,
    DrawClaimable
};

/**
 * Classifies the position for the side to move.
 * Checkmate and stalemate take priority over the draw rules.
 */
Status status(const chess::Board& board);
Status status(const chess::Board& board, const chess::Movelist& legalMoves);

bool isGameOver(const chess::Board& board);
bool isCheckmate(const chess::Board& board);
bool isStalemate(const chess::Board& board);

chess::Color opposite(chess::Color color);

// Placement, side to move, castling rights and en passant square. The move
// counters are left out so transposed positions share a key.
std::string positionKey(const chess::Board& board);

const char* statusName(Status status);

// Applies a move for the lifetime of the guard.
class ScopedMove {
public:
    ScopedMove(chess::Board& board, chess::Move move) : board_(board), move_(move) {
        board_.makeMove(move_);
    }
    ~ScopedMove() { board_.unmakeMove(move_); }

    ScopedMove(const ScopedMove&) = delete;
    ScopedMove& operator=(const ScopedMove&) = delete;

private:
    chess::Board& board_;
    chess::Move move_;
};

} // namespace rules
} // namespace rookmate

#endif // ROOKMATE_RULES_HPP

#include "ordering.hpp"
#include "precompute.hpp"
#include "rules.hpp"
#include <algorithm>
#include <cstdint>

namespace rookmate {

int MoveOrderer::scoreMove(chess::Board& board, chess::Move move) const {
    bool isCapture = board.isCapture(move);
    bool defenderKingMove = board.sideToMove() == defender_
                         && board.at(move.from()).type() == chess::PieceType::KING;

    int score = 0;
    {
        rules::ScopedMove probe(board, move);
        rules::Status status = rules::status(board);

        if (status == rules::Status::Checkmate) score = mateScore;
        else if (board.inCheck()) score = checkScore;
        else if (isCapture) score = captureScore;
    }

    if (move.typeOf() == chess::Move::CASTLING) score += castleScore;

    if (defenderKingMove) {
        score += centreKingBonus - centreKingStep * PrecomputedSquareData::centreChebyshevDistance[move.to().index()];
    }
    return score;
}

void MoveOrderer::orderMoves(chess::Board& board, chess::Movelist& moves, bool maximizing) const {
    for (auto& move : moves) {
        move.setScore(static_cast<std::int16_t>(scoreMove(board, move)));
    }

    std::stable_sort(moves.begin(), moves.end(), [maximizing](const chess::Move& a, const chess::Move& b) {
        return maximizing ? a.score() > b.score() : a.score() < b.score();
    });
}

} // namespace rookmate

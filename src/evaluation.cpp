#include "evaluation.hpp"
#include "precompute.hpp"
#include <utility>

namespace rookmate {

Evaluation::Evaluation(EvalProfile profile) : profile_(std::move(profile)) {
    profile_.validate();
}

int Evaluation::evaluate(const chess::Board& board) const {
    return evaluate(board, rules::status(board));
}

int Evaluation::evaluate(const chess::Board& board, rules::Status status) const {
    switch (status) {
        case rules::Status::Checkmate:
            // The side to move is mated.
            return board.sideToMove() == chess::Color::WHITE ? -MATE_SCORE : MATE_SCORE;
        case rules::Status::Stalemate:
        case rules::Status::InsufficientMaterial:
        case rules::Status::DrawClaimable:
            return 0;
        case rules::Status::Ongoing:
            break;
    }

    int score = heuristic(board);
    return profile_.attacker == chess::Color::WHITE ? score : -score;
}

int Evaluation::evaluateRelative(const chess::Board& board) const {
    int perspective = board.sideToMove() == chess::Color::WHITE ? 1 : -1;
    return evaluate(board) * perspective;
}

int Evaluation::heuristic(const chess::Board& board) const {
    chess::Bitboard rooks = board.pieces(chess::PieceType::ROOK, profile_.attacker);
    if (rooks.empty()) return 0;

    chess::Square rook(rooks.pop());
    chess::Square attackerKing = board.kingSq(profile_.attacker);
    chess::Square defenderKing = board.kingSq(profile_.defender());

    int score = 0;
    score += edgeConfinement(defenderKing);
    score += rookAlignment(rook, defenderKing);
    score += kingOpposition(attackerKing, defenderKing);
    score += rookCentrality(rook);

    if (board.sideToMove() == profile_.defender() && board.inCheck()) {
        score += profile_.checkBonus;
    }
    return score;
}

int Evaluation::edgeConfinement(chess::Square defenderKing) const {
    return (4 - PrecomputedSquareData::edgeDistance[defenderKing.index()]) * profile_.edgeWeight;
}

int Evaluation::rookAlignment(chess::Square rook, chess::Square defenderKing) const {
    if (!PrecomputedSquareData::sharesLine(rook, defenderKing)) return 0;

    int bonus = profile_.rookAlignedBonus;
    // Out of reach of the defending king.
    if (PrecomputedSquareData::kingDistance(rook, defenderKing) > 1) {
        bonus += profile_.rookSafeBonus;
    }
    return bonus;
}

int Evaluation::kingOpposition(chess::Square attackerKing, chess::Square defenderKing) const {
    int score = 0;
    if (PrecomputedSquareData::kingDistance(attackerKing, defenderKing) <= 1) {
        score -= profile_.kingAdjacentPenalty;
    }
    if (PrecomputedSquareData::sharesLine(attackerKing, defenderKing)
        && PrecomputedSquareData::kingDistance(attackerKing, defenderKing) == 2) {
        score += profile_.oppositionBonus;
    }
    return score;
}

int Evaluation::rookCentrality(chess::Square rook) const {
    return (6 - PrecomputedSquareData::centreManhattanDistance[rook.index()]) * profile_.rookCentralityWeight;
}

} // namespace rookmate

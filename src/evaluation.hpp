#ifndef ROOKMATE_EVALUATION_HPP
#define ROOKMATE_EVALUATION_HPP

#include "chess.hpp"
#include "profile.hpp"
#include "rules.hpp"

namespace rookmate {

/**
 * Static evaluation of king and rook vs king positions.
 * Scores are from White's point of view: positive favours White.
 */
class Evaluation {
public:
    explicit Evaluation(EvalProfile profile = EvalProfile::attackerWithRook());

    /**
     * Evaluates the position on the board
     * @param board The chess board to evaluate
     * @return +/-MATE_SCORE for checkmate, 0 for drawn positions, otherwise
     *         the weighted heuristic, all from White's perspective
     */
    int evaluate(const chess::Board& board) const;

    // Same as evaluate() when the legal moves are already known.
    int evaluate(const chess::Board& board, rules::Status status) const;

    // Negamax view: score from the perspective of the side to move.
    int evaluateRelative(const chess::Board& board) const;

    /**
     * Heuristic terms only, signed in the attacker's favour.
     * @return 0 when the attacker has no rook
     */
    int heuristic(const chess::Board& board) const;

    const EvalProfile& profile() const { return profile_; }

private:
    int edgeConfinement(chess::Square defenderKing) const;
    int rookAlignment(chess::Square rook, chess::Square defenderKing) const;
    int kingOpposition(chess::Square attackerKing, chess::Square defenderKing) const;
    int rookCentrality(chess::Square rook) const;

    EvalProfile profile_;
};

} // namespace rookmate

#endif // ROOKMATE_EVALUATION_HPP

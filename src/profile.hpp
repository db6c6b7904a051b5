#ifndef ROOKMATE_PROFILE_HPP
#define ROOKMATE_PROFILE_HPP

#include <string>
#include "chess.hpp"

namespace rookmate {

/**
 * Tunable weights for the king and rook vs king evaluator.
 * The attacker owns the rook; the defender is the lone king.
 */
struct EvalProfile {
    std::string name = "custom";
    chess::Color attacker = chess::Color::WHITE;

    int edgeWeight = 15;
    int rookAlignedBonus = 20;
    int rookSafeBonus = 10;
    int kingAdjacentPenalty = 30;
    int oppositionBonus = 25;
    int rookCentralityWeight = 2;
    int checkBonus = 50;

    chess::Color defender() const;

    /**
     * Largest absolute value the heuristic terms can sum to.
     * Used to keep every heuristic score clear of the mate sentinel.
     */
    int maxHeuristicMagnitude() const;

    // Throws std::invalid_argument on negative weights or weights that could
    // reach half the mate score.
    void validate() const;

    // White owns the rook (king and rook vs king, engine attacks).
    static EvalProfile attackerWithRook();
    // Black owns the rook against a lone white king.
    static EvalProfile defenderWithRook();
    // Same weights with the attacker colour swapped.
    EvalProfile mirrored() const;

    static EvalProfile byName(const std::string& name);
};

} // namespace rookmate

#endif // ROOKMATE_PROFILE_HPP

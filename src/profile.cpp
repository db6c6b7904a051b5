#include "profile.hpp"
#include "rules.hpp"
#include <stdexcept>

namespace rookmate {

chess::Color EvalProfile::defender() const {
    return rules::opposite(attacker);
}

int EvalProfile::maxHeuristicMagnitude() const {
    // Edge distance is at most 3 and rook centrality at most 6.
    int positive = 4 * edgeWeight + rookAlignedBonus + rookSafeBonus + oppositionBonus
                 + 6 * rookCentralityWeight + checkBonus;
    return positive > kingAdjacentPenalty ? positive : kingAdjacentPenalty;
}

void EvalProfile::validate() const {
    if (edgeWeight < 0 || rookAlignedBonus < 0 || rookSafeBonus < 0 || kingAdjacentPenalty < 0
        || oppositionBonus < 0 || rookCentralityWeight < 0 || checkBonus < 0) {
        throw std::invalid_argument("profile '" + name + "': weights must be non-negative");
    }
    if (maxHeuristicMagnitude() >= MATE_SCORE / 2) {
        throw std::invalid_argument("profile '" + name + "': weights too large, heuristic total "
                                    + std::to_string(maxHeuristicMagnitude())
                                    + " must stay below " + std::to_string(MATE_SCORE / 2));
    }
}

EvalProfile EvalProfile::attackerWithRook() {
    EvalProfile profile;
    profile.name = "attacker_with_rook";
    profile.attacker = chess::Color::WHITE;
    profile.edgeWeight = 10;
    profile.rookAlignedBonus = 10;
    profile.rookSafeBonus = 5;
    profile.kingAdjacentPenalty = 30;
    profile.oppositionBonus = 25;
    profile.rookCentralityWeight = 2;
    profile.checkBonus = 15;
    return profile;
}

EvalProfile EvalProfile::defenderWithRook() {
    EvalProfile profile;
    profile.name = "defender_with_rook";
    profile.attacker = chess::Color::BLACK;
    profile.edgeWeight = 15;
    profile.rookAlignedBonus = 20;
    profile.rookSafeBonus = 10;
    profile.kingAdjacentPenalty = 30;
    profile.oppositionBonus = 25;
    profile.rookCentralityWeight = 2;
    profile.checkBonus = 50;
    return profile;
}

EvalProfile EvalProfile::mirrored() const {
    EvalProfile profile = *this;
    profile.attacker = defender();
    return profile;
}

EvalProfile EvalProfile::byName(const std::string& name) {
    if (name == "attacker_with_rook") return attackerWithRook();
    if (name == "defender_with_rook") return defenderWithRook();
    throw std::invalid_argument("unknown profile '" + name + "'");
}

} // namespace rookmate

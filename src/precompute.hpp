#ifndef ROOKMATE_PRECOMPUTE_HPP
#define ROOKMATE_PRECOMPUTE_HPP

#include <array>
#include "chess.hpp"

namespace rookmate {

// Square geometry indexed by chess::Square::index() (a1 = 0, h8 = 63).
class PrecomputedSquareData {
public:
    static void initialize();

    static int fileOf(chess::Square square);
    static int rankOf(chess::Square square);
    static int kingDistance(chess::Square a, chess::Square b);
    static bool sharesLine(chess::Square a, chess::Square b);

    static std::array<int, 64> edgeDistance;
    static std::array<int, 64> centreManhattanDistance;
    static std::array<int, 64> centreChebyshevDistance;
    static std::array<std::array<int, 64>, 64> kingDistanceTable;
    static std::array<std::array<int, 64>, 64> orthogonalDistance;
};

} // namespace rookmate

#endif // ROOKMATE_PRECOMPUTE_HPP

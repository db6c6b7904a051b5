#include "precompute.hpp"
#include <algorithm>
#include <cstdlib>

namespace rookmate {

std::array<int, 64> PrecomputedSquareData::edgeDistance;
std::array<int, 64> PrecomputedSquareData::centreManhattanDistance;
std::array<int, 64> PrecomputedSquareData::centreChebyshevDistance;
std::array<std::array<int, 64>, 64> PrecomputedSquareData::kingDistanceTable;
std::array<std::array<int, 64>, 64> PrecomputedSquareData::orthogonalDistance;

namespace {
struct AutoInitialize {
    AutoInitialize() { PrecomputedSquareData::initialize(); }
};
AutoInitialize autoInitialize;
}

void PrecomputedSquareData::initialize() {
    for (int squareA = 0; squareA < 64; squareA++) {
        int rankA = squareA / 8;
        int fileA = squareA % 8;
        edgeDistance[squareA] = std::min({ fileA, 7 - fileA, rankA, 7 - rankA });

        int fileDistFromCentre = std::max(3 - fileA, fileA - 4);
        int rankDistFromCentre = std::max(3 - rankA, rankA - 4);
        centreManhattanDistance[squareA] = fileDistFromCentre + rankDistFromCentre;
        centreChebyshevDistance[squareA] = std::max(fileDistFromCentre, rankDistFromCentre);

        for (int squareB = 0; squareB < 64; squareB++) {
            int rankB = squareB / 8;
            int fileB = squareB % 8;
            int rankDist = std::abs(rankA - rankB);
            int fileDist = std::abs(fileA - fileB);
            orthogonalDistance[squareA][squareB] = fileDist + rankDist;
            kingDistanceTable[squareA][squareB] = std::max(fileDist, rankDist);
        }
    }
}

int PrecomputedSquareData::fileOf(chess::Square square) {
    return square.index() % 8;
}

int PrecomputedSquareData::rankOf(chess::Square square) {
    return square.index() / 8;
}

int PrecomputedSquareData::kingDistance(chess::Square a, chess::Square b) {
    return kingDistanceTable[a.index()][b.index()];
}

bool PrecomputedSquareData::sharesLine(chess::Square a, chess::Square b) {
    return fileOf(a) == fileOf(b) || rankOf(a) == rankOf(b);
}

} // namespace rookmate

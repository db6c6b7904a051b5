#ifndef ROOKMATE_TEST_HELPERS_HPP
#define ROOKMATE_TEST_HELPERS_HPP

#include <string>
#include <vector>
#include "chess.hpp"

namespace rookmate {
namespace test {

// King and rook vs king start positions and a few landmark positions.
constexpr const char* kAttackerStart = "4k3/8/8/8/8/8/8/R3K3 w - - 0 1";
constexpr const char* kDefenderStart = "4k2r/8/8/8/8/8/8/4K3 w - - 0 1";
constexpr const char* kWhiteMatesInOne = "7k/8/6K1/8/8/8/8/R7 w - - 0 1";
constexpr const char* kBlackMatesInOne = "r7/8/8/8/8/6k1/8/7K b - - 0 1";
constexpr const char* kWhiteMatesInTwo = "k7/8/2K5/8/8/8/8/1R6 w - - 0 1";
constexpr const char* kBlackIsMated = "R6k/8/6K1/8/8/8/8/8 b - - 0 1";
constexpr const char* kBlackIsStalemated = "k7/1R6/2K5/8/8/8/8/8 b - - 0 1";
constexpr const char* kBareKings = "k7/8/8/8/8/8/8/7K w - - 0 1";

// Flips the board vertically and swaps piece colours and the side to move.
// Castling and en passant fields are dropped.
std::string mirrorFen(const std::string& fen);

std::vector<chess::Move> legalMoves(const chess::Board& board);
bool isLegalMove(const chess::Board& board, chess::Move move);
chess::Move moveFromUci(const chess::Board& board, const std::string& uci);

// Moves that leave the opponent stalemated.
std::vector<chess::Move> stalematingMoves(chess::Board& board);

} // namespace test
} // namespace rookmate

#endif // ROOKMATE_TEST_HELPERS_HPP

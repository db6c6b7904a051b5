#include "rules.hpp"
#include <sstream>

namespace rookmate {
namespace rules {

Status status(const chess::Board& board) {
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    return status(board, moves);
}

Status status(const chess::Board& board, const chess::Movelist& legalMoves) {
    if (legalMoves.empty()) {
        return board.inCheck() ? Status::Checkmate : Status::Stalemate;
    }
    if (board.isInsufficientMaterial()) return Status::InsufficientMaterial;
    if (board.isHalfMoveDraw() || board.isRepetition(2)) return Status::DrawClaimable;
    return Status::Ongoing;
}

bool isGameOver(const chess::Board& board) {
    return status(board) != Status::Ongoing;
}

bool isCheckmate(const chess::Board& board) {
    return status(board) == Status::Checkmate;
}

bool isStalemate(const chess::Board& board) {
    return status(board) == Status::Stalemate;
}

chess::Color opposite(chess::Color color) {
    return color == chess::Color::WHITE ? chess::Color::BLACK : chess::Color::WHITE;
}

std::string positionKey(const chess::Board& board) {
    std::istringstream fen(board.getFen());
    std::string placement, side, castling, enPassant;
    fen >> placement >> side >> castling >> enPassant;
    return placement + " " + side + " " + castling + " " + enPassant;
}

const char* statusName(Status status) {
    switch (status) {
        case Status::Ongoing: return "ongoing";
        case Status::Checkmate: return "checkmate";
        case Status::Stalemate: return "stalemate";
        case Status::InsufficientMaterial: return "insufficient material";
        case Status::DrawClaimable: return "draw claimable";
    }
    return "?";
}

} // namespace rules
} // namespace rookmate

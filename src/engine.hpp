#ifndef ROOKMATE_ENGINE_HPP
#define ROOKMATE_ENGINE_HPP

#include <chrono>
#include "chess.hpp"
#include "config.hpp"
#include "search.hpp"

namespace rookmate {

// Entry point for the game loop.
class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig());

    /**
     * Picks a move for the side to move.
     * @param board Position to move from; left unchanged on return
     * @param maxDepth Deepest iteration in plies
     * @param timeBudget Soft wall-clock limit, checked between depths
     * @return The chosen legal move, or Move::NO_MOVE if there is none
     */
    chess::Move chooseMove(chess::Board& board, int maxDepth, std::chrono::milliseconds timeBudget);
    chess::Move chooseMove(chess::Board& board);

    const SearchResult& lastResult() const { return lastResult_; }
    const EngineConfig& config() const { return config_; }
    const Evaluation& evaluation() const { return search_.evaluation(); }

private:
    EngineConfig config_;
    Search search_;
    SearchResult lastResult_;
};

} // namespace rookmate

#endif // ROOKMATE_ENGINE_HPP

#include "engine.hpp"
#include <utility>
using namespace std;

namespace rookmate {

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , search_(config_.profile, config_.settings)
{
}

chess::Move Engine::chooseMove(chess::Board& board, int maxDepth, chrono::milliseconds timeBudget) {
    lastResult_ = search_.startSearch(board, maxDepth, timeBudget);
    return lastResult_.bestMove;
}

chess::Move Engine::chooseMove(chess::Board& board) {
    return chooseMove(board, config_.settings.depth, config_.settings.timeBudget);
}

} // namespace rookmate

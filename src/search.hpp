#ifndef ROOKMATE_SEARCH_HPP
#define ROOKMATE_SEARCH_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "chess.hpp"
#include "evaluation.hpp"
#include "ordering.hpp"
#include "transposition.hpp"

namespace rookmate {

struct AISettings {
    int depth = 3;
    std::chrono::milliseconds timeBudget{2000}; // 0 = no limit
    bool useTranspositionTable = true;
    std::size_t transpositionCapacity = TranspositionTable::defaultCapacity;
    bool verbose = false;
};

struct SearchOutcome {
    int score = 0;
    chess::Move move = chess::Move::NO_MOVE;
};

struct IterationInfo {
    int depth = 0;
    chess::Move move = chess::Move::NO_MOVE;
    int score = 0;
    std::uint64_t nodes = 0;
    long long elapsedMs = 0;
};

struct SearchStats {
    std::uint64_t nodes = 0;
    std::uint64_t evaluations = 0;
    std::uint64_t cutoffs = 0;
    std::uint64_t transpositionHits = 0;
};

// Diagnostics only; game logic reads bestMove and nothing else.
struct SearchResult {
    chess::Move bestMove = chess::Move::NO_MOVE;
    int score = 0; // White's perspective
    int depthCompleted = 0;
    bool immediateMate = false;
    SearchStats stats;
    long long elapsedMs = 0;
    std::vector<IterationInfo> iterations;
};

/**
 * Minimax with alpha-beta pruning. White is always the maximizing side and
 * every score is from White's perspective.
 */
class Search {
public:
    Search(EvalProfile profile, AISettings settings);

    Search(const Search&) = delete;
    Search& operator=(const Search&) = delete;

    /**
     * Iterative deepening from depth 1 to maxDepth. The time budget is only
     * checked between depths, so a started depth always runs to completion.
     * The transposition table is cleared first.
     */
    SearchResult startSearch(chess::Board& board, int maxDepth, std::chrono::milliseconds timeBudget);

    /**
     * Depth-limited alpha-beta search from the given position.
     * Returns NO_MOVE when the position has no legal moves or depth is 0.
     */
    SearchOutcome search(chess::Board& board, int depth, int alpha, int beta, bool maximizing);

    // Legal move that checkmates at once, or NO_MOVE.
    chess::Move findImmediateMate(chess::Board& board, const chess::Movelist& moves);

    const SearchStats& stats() const { return stats_; }
    const Evaluation& evaluation() const { return evaluation_; }
    TranspositionTable& transpositionTable() { return transpositionTable_; }

    AISettings settings;

    static bool isMateScore(int score);

private:
    SearchOutcome alphaBeta(chess::Board& board, int depth, int plyFromRoot, int alpha, int beta, bool maximizing);
    void initDebugInfo();
    void logIteration(const IterationInfo& info);
    void announceMate(const chess::Board& board, const SearchResult& result);
    long long elapsedMs() const;

    Evaluation evaluation_;
    MoveOrderer orderer_;
    TranspositionTable transpositionTable_;
    SearchStats stats_;
    std::chrono::steady_clock::time_point searchStartTime;
};

} // namespace rookmate

#endif // ROOKMATE_SEARCH_HPP

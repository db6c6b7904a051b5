#include "search.hpp"
#include "rules.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

using namespace std;
namespace rookmate {

Search::Search(EvalProfile profile, AISettings settings)
    : settings(settings)
    , evaluation_(std::move(profile))
    , orderer_(evaluation_.profile().defender())
    , transpositionTable_(settings.transpositionCapacity)
{
    transpositionTable_.enabled = settings.useTranspositionTable;
}

SearchResult Search::startSearch(chess::Board& board, int maxDepth, chrono::milliseconds timeBudget) {
    initDebugInfo();
    transpositionTable_.clear();
    transpositionTable_.enabled = settings.useTranspositionTable;
    maxDepth = max(1, maxDepth);

    SearchResult result;
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);

    if (moves.empty()) {
        result.score = evaluation_.evaluate(board, rules::status(board, moves));
        result.elapsedMs = elapsedMs();
        return result;
    }

    bool maximizing = board.sideToMove() == chess::Color::WHITE;

    chess::Move mate = findImmediateMate(board, moves);
    if (mate != chess::Move::NO_MOVE) {
        result.bestMove = mate;
        result.score = maximizing ? MATE_SCORE : -MATE_SCORE;
        result.depthCompleted = 1;
        result.immediateMate = true;
        result.stats = stats_;
        result.elapsedMs = elapsedMs();
        result.iterations.push_back({1, mate, result.score, stats_.nodes, result.elapsedMs});
        if (settings.verbose) {
            logIteration(result.iterations.back());
            announceMate(board, result);
        }
        return result;
    }

    bool rootTerminal = rules::status(board, moves) != rules::Status::Ongoing;

    for (int searchDepth = 1; searchDepth <= maxDepth; searchDepth++) {
        SearchOutcome outcome = search(board, searchDepth, -INFINITE_SCORE, INFINITE_SCORE, maximizing);

        result.bestMove = outcome.move;
        result.score = outcome.score;
        result.depthCompleted = searchDepth;
        result.iterations.push_back({searchDepth, outcome.move, outcome.score, stats_.nodes, elapsedMs()});
        if (settings.verbose) logIteration(result.iterations.back());

        if (rootTerminal || isMateScore(outcome.score)) break;
        if (timeBudget.count() > 0 && elapsedMs() > timeBudget.count()) break;
    }

    stats_.transpositionHits = transpositionTable_.hits();
    result.stats = stats_;
    result.elapsedMs = elapsedMs();
    if (settings.verbose) announceMate(board, result);
    return result;
}

SearchOutcome Search::search(chess::Board& board, int depth, int alpha, int beta, bool maximizing) {
    return alphaBeta(board, depth, 0, alpha, beta, maximizing);
}

chess::Move Search::findImmediateMate(chess::Board& board, const chess::Movelist& moves) {
    for (const auto& move : moves) {
        rules::ScopedMove scoped(board, move);
        if (rules::isCheckmate(board)) return move;
    }
    return chess::Move::NO_MOVE;
}

SearchOutcome Search::alphaBeta(chess::Board& board, int depth, int plyFromRoot, int alpha, int beta, bool maximizing) {
    stats_.nodes++;

    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    rules::Status status = rules::status(board, moves);

    // Draw rules only end the search below the root; the root still has to
    // produce a legal move.
    bool gameOver = moves.empty() || (plyFromRoot > 0 && status != rules::Status::Ongoing);
    if (depth <= 0 || gameOver) {
        stats_.evaluations++;
        return {evaluation_.evaluate(board, status), chess::Move::NO_MOVE};
    }

    string key;
    if (plyFromRoot > 0 && transpositionTable_.enabled) {
        key = rules::positionKey(board);
        if (auto cached = transpositionTable_.probe(key, depth, alpha, beta)) {
            return {*cached, chess::Move::NO_MOVE};
        }
    }

    orderer_.orderMoves(board, moves, maximizing);

    int originalAlpha = alpha;
    int originalBeta = beta;
    SearchOutcome best{maximizing ? -INFINITE_SCORE : INFINITE_SCORE, chess::Move::NO_MOVE};

    for (const auto& move : moves) {
        int eval;
        {
            rules::ScopedMove scoped(board, move);
            eval = alphaBeta(board, depth - 1, plyFromRoot + 1, alpha, beta, !maximizing).score;
        }

        if (maximizing) {
            if (eval > best.score) {
                best.score = eval;
                best.move = move;
            }
            alpha = max(alpha, eval);
        } else {
            if (eval < best.score) {
                best.score = eval;
                best.move = move;
            }
            beta = min(beta, eval);
        }

        if (beta <= alpha) {
            stats_.cutoffs++;
            break;
        }
    }

    if (!key.empty()) {
        TranspositionTable::Bound bound = TranspositionTable::Bound::Exact;
        if (best.score <= originalAlpha) bound = TranspositionTable::Bound::UpperBound;
        else if (best.score >= originalBeta) bound = TranspositionTable::Bound::LowerBound;
        transpositionTable_.store(key, depth, best.score, bound);
    }
    return best;
}

bool Search::isMateScore(int score) {
    return abs(score) >= MATE_SCORE;
}

void Search::initDebugInfo() {
    searchStartTime = chrono::steady_clock::now();
    stats_ = SearchStats();
}

long long Search::elapsedMs() const {
    return chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - searchStartTime).count();
}

void Search::logIteration(const IterationInfo& info) {
    cout << "info depth " << info.depth
         << " score cp " << info.score
         << " nodes " << info.nodes
         << " time " << info.elapsedMs
         << " pv " << chess::uci::moveToUci(info.move) << endl;
}

void Search::announceMate(const chess::Board& board, const SearchResult& result) {
    if (!isMateScore(result.score)) return;

    string sideWithMate = result.score > 0 ? "White" : "Black";
    printf("info string %s mates within %d ply from %s\n",
        sideWithMate.c_str(), result.depthCompleted, board.getFen().c_str());
}

} // namespace rookmate

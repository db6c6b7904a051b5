#include "uci.hpp"
#include "rules.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rookmate {
namespace uci {

namespace {

// Checks the placement and side-to-move fields before the board sees the FEN.
bool isPlausibleFen(const std::string& fen) {
    std::istringstream iss(fen);
    std::string placement, side;
    iss >> placement >> side;
    if (side != "w" && side != "b") return false;

    int ranks = 1, squares = 0, whiteKings = 0, blackKings = 0;
    for (char c : placement) {
        if (c == '/') {
            if (squares != 8) return false;
            ranks++;
            squares = 0;
        } else if (c >= '1' && c <= '8') {
            squares += c - '0';
        } else if (std::string("pnbrqkPNBRQK").find(c) != std::string::npos) {
            squares++;
            if (c == 'K') whiteKings++;
            if (c == 'k') blackKings++;
        } else {
            return false;
        }
    }
    return ranks == 8 && squares == 8 && whiteKings == 1 && blackKings == 1;
}

bool isLegal(const chess::Board& board, chess::Move move) {
    chess::Movelist moves;
    chess::movegen::legalmoves(moves, board);
    for (const auto& legal : moves) {
        if (legal == move) return true;
    }
    return false;
}

bool looksLikeUciMove(const std::string& text) {
    if (text.size() != 4 && text.size() != 5) return false;
    for (int i = 0; i < 4; i += 2) {
        if (text[i] < 'a' || text[i] > 'h') return false;
        if (text[i + 1] < '1' || text[i + 1] > '8') return false;
    }
    return text.size() == 4 || std::string("nbrq").find(text[4]) != std::string::npos;
}

int parseInt(const std::string& value, const std::string& what) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(what + " expects an integer, got '" + value + "'");
    }
}

} // namespace

std::string scenarioStartFen(chess::Color attacker) {
    if (attacker == chess::Color::WHITE) return "4k3/8/8/8/8/8/8/R3K3 w - - 0 1";
    return "4k2r/8/8/8/8/8/8/4K3 w - - 0 1";
}

Session::Session(std::ostream& out, EngineConfig config)
    : out_(out)
    , config_(std::move(config))
    , board_(scenarioStartFen(config_.profile.attacker))
{
    resetEngine();
}

void Session::loop(std::istream& in) {
    std::string command;
    while (std::getline(in, command)) {
        if (!handle(command)) break;
    }
}

bool Session::handle(const std::string& command) {
    std::istringstream iss(command);
    std::string token;
    iss >> token;

    if (token == "uci") {
        identify();
    }
    else if (token == "isready") {
        out_ << "readyok" << std::endl;
    }
    else if (token == "setoption") {
        setOption(iss);
    }
    else if (token == "ucinewgame") {
        board_ = chess::Board(scenarioStartFen(config_.profile.attacker));
        resetEngine();
    }
    else if (token == "position") {
        setPosition(iss);
    }
    else if (token == "go") {
        go(iss);
    }
    else if (token == "eval") {
        printEval();
    }
    else if (token == "d") {
        out_ << "info string fen " << board_.getFen() << std::endl;
    }
    else if (token == "quit") {
        return false;
    }
    else if (!token.empty()) {
        reportError("unknown command '" + token + "'");
    }
    return true;
}

void Session::identify() {
    out_ << "id name rookmate" << std::endl;
    out_ << "id author rookmate developers" << std::endl;
    out_ << "option name Profile type combo default " << config_.profile.name
         << " var attacker_with_rook var defender_with_rook" << std::endl;
    out_ << "option name Depth type spin default " << config_.settings.depth << " min 1 max 12" << std::endl;
    out_ << "option name MoveTime type spin default " << config_.settings.timeBudget.count()
         << " min 0 max 600000" << std::endl;
    out_ << "option name Config type string default " << std::endl;
    out_ << "uciok" << std::endl;
}

void Session::setOption(std::istringstream& iss) {
    std::string nameToken;
    iss >> nameToken; // Skip "name"
    if (nameToken != "name") {
        reportError("setoption expects 'name'");
        return;
    }

    // Read the option name (might contain spaces)
    std::string optionName;
    iss >> optionName;
    std::string part;
    while (iss >> part && part != "value") {
        optionName += " " + part;
    }

    std::string optionValue;
    std::getline(iss, optionValue);
    if (!optionValue.empty() && optionValue[0] == ' ') {
        optionValue = optionValue.substr(1);
    }

    EngineConfig updated = config_;
    try {
        if (optionName == "Profile") {
            updated.profile = EvalProfile::byName(optionValue);
        }
        else if (optionName == "Depth") {
            int depth = parseInt(optionValue, "Depth");
            if (depth < 1) throw std::invalid_argument("Depth must be at least 1");
            updated.settings.depth = depth;
        }
        else if (optionName == "MoveTime") {
            int budget = parseInt(optionValue, "MoveTime");
            if (budget < 0) throw std::invalid_argument("MoveTime must not be negative");
            updated.settings.timeBudget = std::chrono::milliseconds(budget);
        }
        else if (optionName == "Config") {
            updated = loadConfig(optionValue);
        }
        else {
            reportError("unknown option '" + optionName + "'");
            return;
        }
    } catch (const ConfigError& e) {
        reportError(e.what());
        return;
    } catch (const std::invalid_argument& e) {
        reportError(e.what());
        return;
    }

    config_ = updated;
    resetEngine();
}

void Session::setPosition(std::istringstream& iss) {
    std::string posType;
    iss >> posType;

    chess::Board next;
    std::string token;
    if (posType == "startpos") {
        next = chess::Board(scenarioStartFen(config_.profile.attacker));
        iss >> token;
    }
    else if (posType == "fen") {
        std::string fen;
        // Read everything until "moves" is found
        while (iss >> token && token != "moves") {
            if (!fen.empty()) fen += " ";
            fen += token;
        }
        if (fen.empty()) {
            reportError("position fen needs a FEN string");
            return;
        }
        if (!isPlausibleFen(fen)) {
            reportError("invalid FEN '" + fen + "'");
            return;
        }
        next.setFen(fen);
    }
    else {
        reportError("position expects 'startpos' or 'fen'");
        return;
    }

    if (token == "moves") {
        std::string moveText;
        while (iss >> moveText) {
            if (!looksLikeUciMove(moveText)) {
                reportError("malformed move '" + moveText + "'");
                return;
            }
            chess::Move move = chess::uci::uciToMove(next, moveText);
            if (!isLegal(next, move)) {
                reportError("illegal move '" + moveText + "' in " + next.getFen());
                return;
            }
            next.makeMove(move);
        }
    }
    board_ = next;
}

void Session::go(std::istringstream& iss) {
    int depth = config_.settings.depth;
    std::chrono::milliseconds budget = config_.settings.timeBudget;

    std::string token;
    try {
        while (iss >> token) {
            std::string value;
            if (token == "depth" && iss >> value) {
                depth = parseInt(value, "depth");
            } else if (token == "movetime" && iss >> value) {
                budget = std::chrono::milliseconds(parseInt(value, "movetime"));
            }
        }
    } catch (const std::invalid_argument& e) {
        reportError(e.what());
        return;
    }

    chess::Move best = engine_->chooseMove(board_, depth, budget);
    if (best == chess::Move::NO_MOVE) {
        out_ << "bestmove 0000" << std::endl;
    } else {
        out_ << "bestmove " << chess::uci::moveToUci(best) << std::endl;
    }
}

void Session::printEval() {
    const Evaluation& evaluation = engine_->evaluation();
    out_ << "info string eval " << evaluation.evaluateRelative(board_)
         << " white " << evaluation.evaluate(board_)
         << " status " << rules::statusName(rules::status(board_)) << std::endl;
}

void Session::resetEngine() {
    engine_ = std::make_unique<Engine>(config_);
}

void Session::reportError(const std::string& message) {
    out_ << "info string error " << message << std::endl;
}

} // namespace uci
} // namespace rookmate

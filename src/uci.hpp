#ifndef ROOKMATE_UCI_HPP
#define ROOKMATE_UCI_HPP

#include <iosfwd>
#include <memory>
#include <string>
#include "chess.hpp"
#include "config.hpp"
#include "engine.hpp"

namespace rookmate {
namespace uci {

// Start position of the king and rook vs king scenario for the given attacker.
std::string scenarioStartFen(chess::Color attacker);

class Session {
public:
    Session(std::ostream& out, EngineConfig config = EngineConfig());

    /**
     * Handles one command line.
     * @return false once "quit" has been received
     */
    bool handle(const std::string& command);
    void loop(std::istream& in);

    const chess::Board& board() const { return board_; }
    const EngineConfig& config() const { return config_; }

private:
    void identify();
    void setOption(std::istringstream& iss);
    void setPosition(std::istringstream& iss);
    void go(std::istringstream& iss);
    void printEval();
    void resetEngine();
    void reportError(const std::string& message);

    std::ostream& out_;
    EngineConfig config_;
    std::unique_ptr<Engine> engine_;
    chess::Board board_;
};

} // namespace uci
} // namespace rookmate

#endif // ROOKMATE_UCI_HPP

#include <iostream>
#include <string>
#include "config.hpp"
#include "uci.hpp"

using namespace rookmate;

int main(int argc, char* argv[]) {
    EngineConfig config;
    if (argc > 1) {
        try {
            config = loadConfig(argv[1]);
        } catch (const ConfigError& e) {
            std::cerr << "rookmate: " << e.what() << std::endl;
            return 1;
        }
    }

    uci::Session session(std::cout, config);
    session.loop(std::cin);
    return 0;
}

#include "klondike/Deck.hh"
#include "klondike/Errors.hh"
#include "klondike/Game.hh"
#include "main/CommandInterpreter.hh"
#include "main/Config.hh"
#include "Logging.hh"

#include <boost/core/demangle.hpp>

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>

namespace {

using namespace Klondike;

class KlondikeApp {
public:

    KlondikeApp(const std::vector<CardType>& deck) :
        game {deck},
        interpreter {game}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~KlondikeApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run(std::istream& in, std::ostream& out)
    {
        out << game;
        auto command = std::string {};
        while (!game.isFinished() && std::getline(in, command)) {
            if (command == "show") {
                out << game;
                continue;
            }
            try {
                if (!interpreter.interpret(command)) {
                    out << "Unknown command: " << command << std::endl;
                }
            } catch (const IllegalMoveError& e) {
                out << "Illegal move: " << e.what() << std::endl;
            }
        }
        if (game.isFinished()) {
            out << "Game finished" << std::endl;
        }
    }

private:

    Game game;
    Main::CommandInterpreter interpreter;
};

std::vector<CardType> createDeck(
    const Main::Config& config, std::optional<int> seed)
{
    if (const auto deck = config.getDeck()) {
        return *deck;
    }
    if (!seed) {
        seed = config.getSeed();
    }
    if (seed) {
        log(LogLevel::INFO, "Shuffling with seed %d", *seed);
        seedRng(static_cast<Rng::result_type>(*seed));
    }
    return generateShuffledDeck();
}

std::vector<CardType> parseArgs(int argc, char* argv[])
{
    auto config_path = std::string {};
    auto seed = std::optional<int> {};

    const auto short_opt = "vc:s:";
    auto long_opt = std::array {
        option { "verbose", no_argument, 0, 'v' },
        option { "config", required_argument, 0, 'c' },
        option { "seed", required_argument, 0, 's' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'c') {
            config_path = optarg;
        } else if (c == 's') {
            seed = std::stoi(optarg);
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);
    const auto config = Main::configFromPath(config_path);
    if (const auto level = config.getLogLevel(); level && verbosity == 0) {
        setupLogging(*level, std::cerr);
    }

    return createDeck(config, seed);
}

}

int main(int argc, char* argv[])
{
    try {
        KlondikeApp app {parseArgs(argc, argv)};
        app.run(std::cin, std::cout);
    } catch (const std::exception& e) {
        Klondike::log(
            Klondike::LogLevel::FATAL,
            "%s terminated with exception of type %s: %s",
            argv[0], boost::core::demangle(typeid(e).name()), e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

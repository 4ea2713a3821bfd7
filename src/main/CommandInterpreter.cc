#include "main/CommandInterpreter.hh"

#include "klondike/Game.hh"

#include <optional>
#include <sstream>

namespace Klondike {
namespace Main {

namespace {

struct PlaceArgs {
    int count;
    int source;
    int dest;
};

std::optional<PlaceArgs> interpretPlace(std::istringstream& is)
{
    auto args = PlaceArgs {};
    if (is >> args.count >> args.source >> args.dest && (is >> std::ws).eof()) {
        return args;
    }
    return std::nullopt;
}

}

CommandInterpreter::CommandInterpreter(Game& game) :
    game {game}
{
}

bool CommandInterpreter::interpret(const std::string& command)
{
    std::istringstream is {command};
    auto command_type = std::string {};
    is >> command_type;
    if (command_type == "place") {
        if (const auto args = interpretPlace(is)) {
            game.place(args->count, args->source, args->dest);
            return true;
        }
    } else if (command_type == "draw") {
        if ((is >> std::ws).eof()) {
            game.drawFromStock();
            return true;
        }
    }
    return false;
}

}
}

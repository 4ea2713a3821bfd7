/** \file
 *
 * \brief Definition of Klondike::Main::CommandInterpreter class
 */

#ifndef MAIN_COMMANDINTERPRETER_HH_
#define MAIN_COMMANDINTERPRETER_HH_

#include <boost/core/noncopyable.hpp>

#include <string>

namespace Klondike {

class Game;

namespace Main {

/** \brief A helper for parsing command strings to be forwarded to Game
 *
 * The recognized commands are:
 *
 * - <tt>place <count> <source> <dest></tt>: move cards between piles using
 *   the integer addressing of Game::place()
 * - \c draw: draw the next card from the stock
 */
class CommandInterpreter : private boost::noncopyable {
public:

    /** \brief Create command interpreter
     *
     * \note CommandInterpreter borrows reference to the given Game object.
     * The user of this class in responsible for ensuring that the lifetime of
     * the Game instance exceeds the lifetime of the command interpreter.
     *
     * \param game the game object the commands are forwarded to
     */
    CommandInterpreter(Game& game);

    /** \brief Interpret given command
     *
     * A syntactically valid command is forwarded to the game object. An
     * invalid command is not forwarded.
     *
     * \param command the command to interpret
     *
     * \return true if the command was valid, false otherwise
     *
     * \throw IllegalMoveError if the command was valid but the game rejected
     * the move
     */
    bool interpret(const std::string& command);

private:

    Game& game;
};

}
}

#endif // MAIN_COMMANDINTERPRETER_HH_

/** \file
 *
 * \brief Definition of the exceptions thrown by the Klondike rule engine
 */

#ifndef ERRORS_HH_
#define ERRORS_HH_

#include <stdexcept>

namespace Klondike {

/** \brief Exception to indicate taking more cards than a collection holds
 *
 * Thrown by CardCollection::take() and the piles built on it when the number
 * of requested cards exceeds the number of cards available. The collection is
 * left unchanged.
 */
class EmptyError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/** \brief Exception to indicate a card that breaks the foundation order
 *
 * Thrown by the write path of SuitDeck when a card of the wrong suit or rank
 * is put to it. The rules are checked with Pile::verify() before any card is
 * moved, so this exception indicates a broken invariant of the engine.
 */
class InvalidCardError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** \brief Exception to indicate an operation the pile does not support
 *
 * Thrown when taking cards from a foundation.
 */
class UnsupportedOperationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/** \brief Exception to indicate a move against the rules of the game
 *
 * This non-fatal exception is thrown by Game::place() when the move is not
 * allowed. The state of the game is unchanged and the caller may simply reject
 * the move.
 */
class IllegalMoveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}

#endif // ERRORS_HH_

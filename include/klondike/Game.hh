/** \file
 *
 * \brief Definition of Klondike::Game class
 */

#ifndef GAME_HH_
#define GAME_HH_

#include "klondike/CardCollection.hh"
#include "klondike/KlondikeConstants.hh"
#include "klondike/PileRef.hh"
#include "klondike/StockPile.hh"
#include "klondike/SuitDeck.hh"
#include "klondike/TableauPile.hh"

#include <boost/core/noncopyable.hpp>

#include <array>
#include <iosfwd>
#include <vector>

namespace Klondike {

/** \brief A game of Klondike solitaire
 *
 * Game owns the stock, the seven tableau piles and the four foundations, and
 * enforces the rules when cards are moved between them. Each of the 52 cards
 * is in exactly one pile at any time.
 *
 * All moves go through place(). The piles are addressed either by PileRef or
 * by the integer addressing described in pileRefFromIndex(). A move is
 * validated completely before any card is moved, so a rejected move leaves
 * the game unchanged.
 *
 * The game is finished when all foundations are complete. Game does not
 * detect positions where no moves are left.
 */
class Game : private boost::noncopyable {
public:

    /** \brief Create game dealt from an ordered deck
     *
     * The deck contains the cards in the order of enumerateCardType(), the
     * last card on top.
     */
    Game();

    /** \brief Create game dealt from the given deck
     *
     * The deck is placed to the stock and the tableau piles are dealt from
     * the top of the stock one card at a time: tableau pile n receives n + 1
     * cards, the last of which is turned face up. The remaining 24 cards stay
     * in the stock.
     *
     * \param deck the pre-shuffled deck, the top card last
     *
     * \throw std::invalid_argument unless \p deck contains each card exactly
     * once
     */
    explicit Game(const std::vector<CardType>& deck);

    /** \brief Move cards between piles
     *
     * Moves \p count cards from the top of the source pile to the top of the
     * destination pile. The move is checked by asking the destination whether
     * it accepts the bottom card of the moved run (the card \p count positions
     * from the top of the source).
     *
     * \param count the number of cards moved
     * \param source the pile the cards are taken from
     * \param dest the pile the cards are put to
     *
     * \return reference to this game
     *
     * \throw IllegalMoveError if the move is not allowed: \p source and \p
     * dest are the same pile, \p dest is the stock, more than one card is
     * taken from the stock or put to a foundation, the source does not have
     * \p count cards that can be moved, or the destination does not accept
     * the cards
     * \throw std::out_of_range if \p source or \p dest refers to a pile that
     * does not exist
     */
    Game& place(int count, const PileRef& source, const PileRef& dest);

    /** \brief Move cards between piles addressed by integers
     *
     * Decodes the addresses as described in pileRefFromIndex() and calls
     * place(int, const PileRef&, const PileRef&).
     *
     * \param count the number of cards moved
     * \param sourceIndex the address of the pile the cards are taken from
     * \param destIndex the address of the pile the cards are put to
     *
     * \return reference to this game
     *
     * \throw IllegalMoveError if the move is not allowed, or if \p
     * sourceIndex or \p destIndex does not address a pile
     */
    Game& place(int count, int sourceIndex, int destIndex);

    /** \brief Draw the next card from the stock
     *
     * Turns the top card of the stock to its bottom so that the card below it
     * can be played. Does nothing if the stock is empty.
     */
    void drawFromStock();

    /** \brief Determine if the game is finished
     *
     * \return true if all foundations are complete, false otherwise
     */
    bool isFinished() const;

    /** \brief Retrieve the stock
     */
    const StockPile& getStock() const;

    /** \brief Retrieve a tableau pile
     *
     * \param n the index of the pile (0..6)
     *
     * \throw std::out_of_range if \p n is not a valid index
     */
    const TableauPile& getTableau(int n) const;

    /** \brief Retrieve a foundation
     *
     * \param n the index of the foundation (0..3)
     *
     * \throw std::out_of_range if \p n is not a valid index
     */
    const SuitDeck& getFoundation(int n) const;

    /** \brief Retrieve the foundation of a suit
     */
    const SuitDeck& getFoundation(Suit suit) const;

    /** \brief Retrieve any pile
     *
     * \param ref the reference to the pile
     *
     * \throw std::out_of_range if \p ref refers to a pile that does not exist
     */
    const Pile& getPile(const PileRef& ref) const;

private:

    Pile& internalGetPile(const PileRef& ref);

    StockPile stock;
    std::array<TableauPile, N_TABLEAU_PILES> tableaus;
    std::array<SuitDeck, N_FOUNDATIONS> foundations;
    CardCollection hand;
};

/** \brief Output a Game to stream
 *
 * Writes the contents of the stock, the tableau piles and the foundations,
 * each on its own line.
 *
 * \param os the output stream
 * \param game the game to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const Game& game);

}

#endif // GAME_HH_

/** \file
 *
 * \brief Definition of Klondike::Pile interface
 */

#ifndef PILE_HH_
#define PILE_HH_

#include "klondike/CardCollection.hh"

#include <optional>

namespace Klondike {

/** \brief A pile of cards on the Klondike table
 *
 * Pile is the common interface of the stock, the tableau piles and the
 * foundations. It allows Game to move cards between any two piles without
 * knowing their kind: the destination decides with verify() whether it
 * accepts a card, the source gives its cards with take() and the destination
 * receives them with put().
 *
 * Each pile has visible cards, the ones the player can see and refer to. For
 * the stock and the foundations all cards are visible, and for a tableau pile
 * the face up cards are.
 */
class Pile {
public:

    /** \brief Result of taking cards from a pile
     */
    struct TakeResult {
        /** \brief The cards taken, the previous top card last
         */
        CardCollection::Cards cards;

        /** \brief Whether taking the cards turned a face down card up
         *
         * Only tableau piles have face down cards, so this is false for the
         * other piles.
         */
        bool revealed;
    };

    virtual ~Pile();

    /** \brief Determine if the pile accepts a card as its new top card
     *
     * When a run of cards is moved, \p candidate is the bottom card of the
     * run, i.e. the card that is put directly on the current top card of this
     * pile.
     *
     * \param candidate the card to check
     *
     * \return true if the rules allow placing \p candidate on this pile, false
     * otherwise
     */
    bool verify(const CardType& candidate) const;

    /** \brief Determine if cards can be taken from the pile
     *
     * \param n the number of cards
     *
     * \return true if take(n) would succeed, false otherwise
     */
    bool canTake(int n) const;

    /** \brief Take cards from the top of the pile
     *
     * \param n the number of cards taken
     *
     * \return the cards taken, and whether a card was revealed
     *
     * \throw EmptyError if the pile does not have \p n visible cards
     * \throw UnsupportedOperationError if the pile does not allow taking cards
     */
    TakeResult take(int n);

    /** \brief Put cards on the top of the pile
     *
     * \note put() does not consult verify(). It is the responsibility of the
     * caller to check the rules before moving cards.
     *
     * \param cards the cards, the new top card last
     *
     * \throw InvalidCardError if the pile enforces an order the cards break
     */
    void put(const CardCollection::Cards& cards);

    /** \brief Put one card on the top of the pile
     *
     * \sa put(const CardCollection::Cards&)
     */
    void put(const CardType& card);

    /** \brief Retrieve a visible card counting from the top
     *
     * peek(1) is the top card, peek(2) the one below it and so on. This is the
     * card that ends up at the bottom of the run moved by take(n).
     *
     * \param n the position of the card from the top
     *
     * \return the card, or none if there are less than \p n visible cards or
     * \p n < 1
     */
    std::optional<CardType> peek(int n) const;

    /** \brief Retrieve the top card
     *
     * \return the top card, or none if there are no visible cards
     */
    std::optional<CardType> getTop() const;

    /** \brief Retrieve the visible cards
     *
     * \return collection containing the visible cards, the top card last
     */
    const CardCollection& getVisibleCards() const;

    /** \brief Determine the number of cards in the pile
     *
     * \return The number of visible and face down cards together
     */
    int getNumberOfCards() const;

    /** \brief Determine if the pile is empty
     */
    bool isEmpty() const;

private:

    /** \brief Handle for checking a candidate
     *
     * \sa verify()
     */
    virtual bool handleVerify(const CardType& candidate) const = 0;

    /** \brief Handle for determining if cards can be taken
     *
     * It may be assumed that n >= 1. The default implementation returns true
     * if there are at least \p n visible cards.
     *
     * \sa canTake()
     */
    virtual bool handleCanTake(int n) const;

    /** \brief Handle for taking cards
     *
     * \sa take()
     */
    virtual TakeResult handleTake(int n) = 0;

    /** \brief Handle for putting cards
     *
     * \sa put()
     */
    virtual void handlePut(const CardCollection::Cards& cards) = 0;

    /** \brief Handle for returning the visible cards
     *
     * \sa getVisibleCards()
     */
    virtual const CardCollection& handleGetVisibleCards() const = 0;

    /** \brief Handle for returning the number of cards
     *
     * The default implementation returns the number of visible cards.
     *
     * \sa getNumberOfCards()
     */
    virtual int handleGetNumberOfCards() const;
};

}

#endif // PILE_HH_

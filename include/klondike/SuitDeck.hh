/** \file
 *
 * \brief Definition of Klondike::SuitDeck class
 */

#ifndef SUITDECK_HH_
#define SUITDECK_HH_

#include "klondike/Pile.hh"

#include <iosfwd>

namespace Klondike {

/** \brief A foundation collecting the cards of one suit
 *
 * The cards of a foundation form an ascending run of its suit starting from
 * the Ace. The foundation is complete when it holds all 13 cards of the suit.
 *
 * The order is enforced in two layers. verify() is the recoverable check
 * consulted before a move. put() enforces the same rule on the write path and
 * throws InvalidCardError if it is broken, which means that a caller bypassed
 * verify(). Cards never leave a foundation: take() always throws
 * UnsupportedOperationError.
 */
class SuitDeck : public Pile {
public:

    /** \brief Create empty foundation
     *
     * \param suit the suit of the foundation
     */
    explicit SuitDeck(Suit suit);

    /** \brief Determine the suit of the foundation
     */
    Suit getSuit() const;

    /** \brief Determine if the foundation holds all cards of its suit
     */
    bool isComplete() const;

private:

    bool follows(const CardType& card, int rank) const;

    bool handleVerify(const CardType& candidate) const override;

    bool handleCanTake(int n) const override;

    TakeResult handleTake(int n) override;

    void handlePut(const CardCollection::Cards& cards) override;

    const CardCollection& handleGetVisibleCards() const override;

    Suit suit;
    CardCollection cards;
};

/** \brief Output a SuitDeck to stream
 *
 * The suit is written followed by the cards, for example
 * “hearts [ace hearts, 2 hearts]”.
 *
 * \param os the output stream
 * \param deck the foundation to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const SuitDeck& deck);

}

#endif // SUITDECK_HH_

/** \file
 *
 * \brief Definition of Klondike::StockPile class
 */

#ifndef STOCKPILE_HH_
#define STOCKPILE_HH_

#include "klondike/Pile.hh"

namespace Klondike {

/** \brief The stock of undealt cards
 *
 * The stock holds the full deck before the deal and the cards left over after
 * it. Cards are drawn from its top one at a time. The stock never accepts
 * cards from the other piles, so verify() always returns false.
 */
class StockPile : public Pile {
public:

    /** \brief Create empty stock
     */
    StockPile();

    /** \brief Create stock holding given cards
     *
     * \param cards the cards, the top card last
     */
    explicit StockPile(CardCollection::Cards cards);

    /** \brief Turn the top card to the bottom of the stock
     *
     * The card below the top card becomes reachable. Does nothing if the stock
     * is empty.
     */
    void rotate();

private:

    bool handleVerify(const CardType& candidate) const override;

    TakeResult handleTake(int n) override;

    void handlePut(const CardCollection::Cards& cards) override;

    const CardCollection& handleGetVisibleCards() const override;

    CardCollection cards;
};

}

#endif // STOCKPILE_HH_

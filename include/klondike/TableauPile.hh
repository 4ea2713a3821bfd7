/** \file
 *
 * \brief Definition of Klondike::TableauPile class
 */

#ifndef TABLEAUPILE_HH_
#define TABLEAUPILE_HH_

#include "klondike/Pile.hh"

#include <iosfwd>

namespace Klondike {

/** \brief One of the seven playing columns of the table
 *
 * A tableau pile consists of face down (hidden) cards and face up (shown)
 * cards on top of them. Cards are only taken from and put to the shown cards.
 *
 * The pile maintains the following invariant: whenever the shown cards run
 * out and there are hidden cards left, the top hidden card is turned face
 * up. Taking cards reports in Pile::TakeResult::revealed whether this
 * happened.
 *
 * The pile accepts a card that is one rank lower than its top card and of
 * the opposite color. An empty pile accepts only a King.
 */
class TableauPile : public Pile {
public:

    /** \brief Create empty tableau pile
     */
    TableauPile();

    /** \brief Create tableau pile from dealt cards
     *
     * The cards are dealt face down in the order given, after which the last
     * card is turned face up.
     *
     * \tparam CardIterator an input iterator that returns CardType when
     * dereferenced
     *
     * \param first iterator to the first card dealt
     * \param last iterator one past the last card dealt
     */
    template<typename CardIterator>
    TableauPile(CardIterator first, CardIterator last);

    /** \brief Retrieve the face down cards
     *
     * \note The hidden cards are exposed for inspecting the state of the
     * engine. A player should only see their number.
     *
     * \return collection containing the face down cards, the top card last
     */
    const CardCollection& getHiddenCards() const;

    /** \brief Retrieve the face up cards
     *
     * \return collection containing the face up cards, the top card last
     */
    const CardCollection& getShownCards() const;

    /** \brief Determine the number of face down cards
     */
    int getNumberOfHiddenCards() const;

private:

    bool reveal();

    bool handleVerify(const CardType& candidate) const override;

    TakeResult handleTake(int n) override;

    void handlePut(const CardCollection::Cards& cards) override;

    const CardCollection& handleGetVisibleCards() const override;

    int handleGetNumberOfCards() const override;

    CardCollection hidden;
    CardCollection shown;
};

template<typename CardIterator>
TableauPile::TableauPile(CardIterator first, CardIterator last) :
    hidden(first, last),
    shown {}
{
    reveal();
}

/** \brief Output a TableauPile to stream
 *
 * The number of hidden cards is written followed by the shown cards, for
 * example “2 hidden, [queen hearts]”.
 *
 * \param os the output stream
 * \param pile the pile to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const TableauPile& pile);

}

#endif // TABLEAUPILE_HH_

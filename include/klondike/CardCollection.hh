/** \file
 *
 * \brief Definition of Klondike::CardCollection class
 */

#ifndef CARDCOLLECTION_HH_
#define CARDCOLLECTION_HH_

#include "klondike/CardType.hh"

#include <iosfwd>
#include <optional>
#include <vector>

namespace Klondike {

/** \brief Ordered sequence of cards
 *
 * CardCollection is the storage of every pile in the game. The last card of
 * the sequence is the top of the collection. Cards are only removed from and
 * added to the top.
 */
class CardCollection {
public:

    /** \brief Sequence of cards, the top card last
     */
    using Cards = std::vector<CardType>;

    /** \brief Create empty collection
     */
    CardCollection();

    /** \brief Create collection holding given cards
     *
     * \param cards the cards, the top card last
     */
    explicit CardCollection(Cards cards);

    /** \brief Create collection holding cards from the range given
     *
     * \tparam CardIterator an input iterator that returns CardType when
     * dereferenced
     *
     * \param first iterator to the bottom card
     * \param last iterator one past the top card
     */
    template<typename CardIterator>
    CardCollection(CardIterator first, CardIterator last);

    /** \brief Take cards from the top of the collection
     *
     * \param n the number of cards taken
     *
     * \return the \p n topmost cards in the order they were in the
     * collection, the previous top card last
     *
     * \throw EmptyError if \p n < 1 or \p n > getNumberOfCards(). The
     * collection is not changed.
     */
    Cards take(int n);

    /** \brief Take all cards from the collection
     *
     * \return all cards in the order they were in the collection. The return
     * value is empty if the collection was empty.
     */
    Cards takeAll();

    /** \brief Put a card to the top of the collection
     *
     * \param card the card
     */
    void put(const CardType& card);

    /** \brief Put cards to the top of the collection
     *
     * The relative order of \p cards is preserved so that the last card of \p
     * cards becomes the top card of the collection.
     *
     * \param cards the cards
     */
    void put(const Cards& cards);

    /** \brief Retrieve the top card
     *
     * \return the top card, or none if the collection is empty
     */
    std::optional<CardType> getTop() const;

    /** \brief Retrieve a card
     *
     * \param n the index of the card, counting from the bottom card
     *
     * \throw std::out_of_range if n < 0 or n >= getNumberOfCards()
     */
    const CardType& getCard(int n) const;

    /** \brief Retrieve all cards
     *
     * \return the cards in the collection, the top card last
     */
    const Cards& getCards() const;

    /** \brief Determine the number of cards in the collection
     */
    int getNumberOfCards() const;

    /** \brief Determine if the collection is empty
     */
    bool isEmpty() const;

    /** \brief Get iterator to the bottom card
     */
    auto begin() const { return cards.begin(); }

    /** \brief Get iterator one past the top card
     */
    auto end() const { return cards.end(); }

private:

    Cards cards;
};

template<typename CardIterator>
CardCollection::CardCollection(CardIterator first, CardIterator last) :
    cards(first, last)
{
}

/** \brief Output a CardCollection to stream
 *
 * The cards are written from the bottom to the top inside brackets, for
 * example “[king spades, queen hearts]”.
 *
 * \param os the output stream
 * \param collection the collection to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const CardCollection& collection);

}

#endif // CARDCOLLECTION_HH_

#include "klondike/SuitDeck.hh"

#include "klondike/Errors.hh"
#include "Logging.hh"

#include <ostream>

namespace Klondike {

SuitDeck::SuitDeck(const Suit suit) :
    suit {suit},
    cards {}
{
}

Suit SuitDeck::getSuit() const
{
    return suit;
}

bool SuitDeck::isComplete() const
{
    return cards.getNumberOfCards() == N_FACES;
}

// Rank 0 stands for the empty foundation, so only the Ace follows it
bool SuitDeck::follows(const CardType& card, const int rank) const
{
    return card.suit == suit && getRank(card) - rank == 1;
}

bool SuitDeck::handleVerify(const CardType& candidate) const
{
    const auto top = cards.getTop();
    return follows(candidate, top ? getRank(*top) : 0);
}

bool SuitDeck::handleCanTake(int) const
{
    return false;
}

Pile::TakeResult SuitDeck::handleTake(int)
{
    throw UnsupportedOperationError {"Cannot take cards from a foundation"};
}

void SuitDeck::handlePut(const CardCollection::Cards& cards)
{
    const auto top = this->cards.getTop();
    auto rank = top ? getRank(*top) : 0;
    for (const auto& card : cards) {
        if (!follows(card, rank)) {
            log(LogLevel::FATAL, "Card %s put to foundation %s out of order",
                card, *this);
            throw InvalidCardError {"Card does not follow the foundation"};
        }
        rank = getRank(card);
    }
    this->cards.put(cards);
}

const CardCollection& SuitDeck::handleGetVisibleCards() const
{
    return cards;
}

std::ostream& operator<<(std::ostream& os, const SuitDeck& deck)
{
    return os << deck.getSuit() << " " << deck.getVisibleCards();
}

}

#include "klondike/Pile.hh"

namespace Klondike {

Pile::~Pile() = default;

bool Pile::verify(const CardType& candidate) const
{
    return handleVerify(candidate);
}

bool Pile::canTake(const int n) const
{
    return n >= 1 && handleCanTake(n);
}

Pile::TakeResult Pile::take(const int n)
{
    return handleTake(n);
}

void Pile::put(const CardCollection::Cards& cards)
{
    handlePut(cards);
}

void Pile::put(const CardType& card)
{
    handlePut(CardCollection::Cards {card});
}

std::optional<CardType> Pile::peek(const int n) const
{
    const auto& cards = handleGetVisibleCards();
    const auto n_cards = cards.getNumberOfCards();
    if (n < 1 || n > n_cards) {
        return std::nullopt;
    }
    return cards.getCard(n_cards - n);
}

std::optional<CardType> Pile::getTop() const
{
    return peek(1);
}

const CardCollection& Pile::getVisibleCards() const
{
    return handleGetVisibleCards();
}

int Pile::getNumberOfCards() const
{
    return handleGetNumberOfCards();
}

bool Pile::isEmpty() const
{
    return getNumberOfCards() == 0;
}

bool Pile::handleCanTake(const int n) const
{
    return n <= handleGetVisibleCards().getNumberOfCards();
}

int Pile::handleGetNumberOfCards() const
{
    return handleGetVisibleCards().getNumberOfCards();
}

}

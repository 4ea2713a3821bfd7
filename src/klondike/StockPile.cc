#include "klondike/StockPile.hh"

#include <algorithm>
#include <utility>

namespace Klondike {

StockPile::StockPile() = default;

StockPile::StockPile(CardCollection::Cards cards) :
    cards {std::move(cards)}
{
}

void StockPile::rotate()
{
    auto all_cards = cards.takeAll();
    if (!all_cards.empty()) {
        std::rotate(all_cards.begin(), all_cards.end() - 1, all_cards.end());
    }
    cards.put(all_cards);
}

bool StockPile::handleVerify(const CardType&) const
{
    return false;
}

Pile::TakeResult StockPile::handleTake(const int n)
{
    return {cards.take(n), false};
}

void StockPile::handlePut(const CardCollection::Cards& cards)
{
    this->cards.put(cards);
}

const CardCollection& StockPile::handleGetVisibleCards() const
{
    return cards;
}

}

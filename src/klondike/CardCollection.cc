#include "klondike/CardCollection.hh"

#include "klondike/Errors.hh"
#include "Utility.hh"

#include <iterator>
#include <ostream>
#include <utility>

namespace Klondike {

CardCollection::CardCollection() = default;

CardCollection::CardCollection(Cards cards) :
    cards(std::move(cards))
{
}

CardCollection::Cards CardCollection::take(const int n)
{
    if (n < 1 || n > getNumberOfCards()) {
        throw EmptyError {"Not enough cards in the collection"};
    }
    const auto first = std::prev(cards.end(), n);
    auto ret = Cards(first, cards.end());
    cards.erase(first, cards.end());
    return ret;
}

CardCollection::Cards CardCollection::takeAll()
{
    auto ret = Cards {};
    ret.swap(cards);
    return ret;
}

void CardCollection::put(const CardType& card)
{
    cards.push_back(card);
}

void CardCollection::put(const Cards& cards)
{
    this->cards.insert(this->cards.end(), cards.begin(), cards.end());
}

std::optional<CardType> CardCollection::getTop() const
{
    if (cards.empty()) {
        return std::nullopt;
    }
    return cards.back();
}

const CardType& CardCollection::getCard(const int n) const
{
    return cards[checkIndex(n, getNumberOfCards())];
}

const CardCollection::Cards& CardCollection::getCards() const
{
    return cards;
}

int CardCollection::getNumberOfCards() const
{
    return static_cast<int>(cards.size());
}

bool CardCollection::isEmpty() const
{
    return cards.empty();
}

std::ostream& operator<<(std::ostream& os, const CardCollection& collection)
{
    os << "[";
    auto separator = "";
    for (const auto& card : collection) {
        os << separator << card;
        separator = ", ";
    }
    return os << "]";
}

}

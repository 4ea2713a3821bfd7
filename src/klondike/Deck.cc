#include "klondike/Deck.hh"

#include "klondike/CardTypeIterator.hh"
#include "klondike/KlondikeConstants.hh"

#include <algorithm>
#include <bitset>

namespace Klondike {

Rng& getRng()
{
    // Initialize with seed from OS random number source
    static Rng randomEngine {std::random_device()()};
    return randomEngine;
}

void seedRng(const Rng::result_type seed)
{
    getRng().seed(seed);
}

std::vector<CardType> generateOrderedDeck()
{
    return std::vector<CardType>(
        cardTypeIterator(0), cardTypeIterator(N_CARDS));
}

std::vector<CardType> generateShuffledDeck()
{
    auto cards = generateOrderedDeck();
    std::shuffle(cards.begin(), cards.end(), getRng());
    return cards;
}

bool isCompleteDeck(const std::vector<CardType>& cards)
{
    if (cards.size() != N_CARDS) {
        return false;
    }
    auto seen = std::bitset<N_CARDS> {};
    for (const auto& card : cards) {
        const auto n = cardTypeIndex(card);
        if (seen.test(n)) {
            return false;
        }
        seen.set(n);
    }
    return true;
}

}

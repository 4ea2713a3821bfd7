#include "klondike/CardTypeIterator.hh"

#include "klondike/KlondikeConstants.hh"

#include <stdexcept>

namespace Klondike {

int cardTypeIndex(const CardType& card)
{
    return suitOrder(card.suit) * N_FACES + getRank(card) - 1;
}

CardType enumerateCardType(const int n)
{
    if (n < 0 || n >= N_CARDS) {
        throw std::invalid_argument {"Invalid card number"};
    }
    return {FACES[n % N_FACES], SUITS[n / N_FACES]};
}

}

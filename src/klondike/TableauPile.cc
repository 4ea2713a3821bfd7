#include "klondike/TableauPile.hh"

#include <ostream>
#include <utility>

namespace Klondike {

TableauPile::TableauPile() = default;

const CardCollection& TableauPile::getHiddenCards() const
{
    return hidden;
}

const CardCollection& TableauPile::getShownCards() const
{
    return shown;
}

int TableauPile::getNumberOfHiddenCards() const
{
    return hidden.getNumberOfCards();
}

bool TableauPile::reveal()
{
    if (shown.isEmpty() && !hidden.isEmpty()) {
        shown.put(hidden.take(1));
        return true;
    }
    return false;
}

bool TableauPile::handleVerify(const CardType& candidate) const
{
    if (const auto top = shown.getTop()) {
        return getRank(*top) - getRank(candidate) == 1 &&
            getColor(*top) != getColor(candidate);
    }
    return candidate.face == Face::KING;
}

Pile::TakeResult TableauPile::handleTake(const int n)
{
    auto cards = shown.take(n);
    const auto revealed = reveal();
    return {std::move(cards), revealed};
}

void TableauPile::handlePut(const CardCollection::Cards& cards)
{
    shown.put(cards);
}

const CardCollection& TableauPile::handleGetVisibleCards() const
{
    return shown;
}

int TableauPile::handleGetNumberOfCards() const
{
    return hidden.getNumberOfCards() + shown.getNumberOfCards();
}

std::ostream& operator<<(std::ostream& os, const TableauPile& pile)
{
    return os << pile.getNumberOfHiddenCards() << " hidden, " <<
        pile.getShownCards();
}

}

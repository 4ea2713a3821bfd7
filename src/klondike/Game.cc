#include "klondike/Game.hh"

#include "klondike/Deck.hh"
#include "klondike/Errors.hh"
#include "Logging.hh"
#include "Utility.hh"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Klondike {

namespace {

const std::vector<CardType>& checkDeck(const std::vector<CardType>& deck)
{
    if (!isCompleteDeck(deck)) {
        throw std::invalid_argument {"Deck must contain each card exactly once"};
    }
    return deck;
}

[[noreturn]] void rejectMove(
    const std::string_view reason, const int count, const PileRef& source,
    const PileRef& dest)
{
    log(LogLevel::INFO, "Rejected move of %d card(s) from %s to %s: %s",
        count, source, dest, reason);
    throw IllegalMoveError {std::string {reason}};
}

class PileVisitor {
public:

    PileVisitor(
        const StockPile& stock,
        const std::array<TableauPile, N_TABLEAU_PILES>& tableaus,
        const std::array<SuitDeck, N_FOUNDATIONS>& foundations) :
        stock {stock},
        tableaus {tableaus},
        foundations {foundations}
    {
    }

    const Pile& operator()(StockRef) const
    {
        return stock;
    }

    const Pile& operator()(const TableauRef ref) const
    {
        return tableaus[checkIndex(ref.index, N_TABLEAU_PILES)];
    }

    const Pile& operator()(const FoundationRef ref) const
    {
        return foundations[checkIndex(ref.index, N_FOUNDATIONS)];
    }

private:

    const StockPile& stock;
    const std::array<TableauPile, N_TABLEAU_PILES>& tableaus;
    const std::array<SuitDeck, N_FOUNDATIONS>& foundations;
};

}

Game::Game() :
    Game(generateOrderedDeck())
{
}

Game::Game(const std::vector<CardType>& deck) :
    stock {checkDeck(deck)},
    tableaus {},
    foundations {
        SuitDeck {Suit::SPADES},
        SuitDeck {Suit::HEARTS},
        SuitDeck {Suit::DIAMONDS},
        SuitDeck {Suit::CLUBS}},
    hand {}
{
    for (const auto n : to(N_TABLEAU_PILES)) {
        auto dealt = CardCollection::Cards {};
        for ([[maybe_unused]] const auto m : to(n + 1)) {
            const auto result = stock.take(1);
            dealt.insert(dealt.end(), result.cards.begin(), result.cards.end());
        }
        tableaus[n] = TableauPile(dealt.begin(), dealt.end());
    }
    log(LogLevel::DEBUG, "Cards dealt\n%s", *this);
}

Game& Game::place(const int count, const PileRef& source, const PileRef& dest)
{
    if (source == dest) {
        rejectMove("cannot move cards onto the same pile", count, source, dest);
    }
    if (std::holds_alternative<StockRef>(dest)) {
        rejectMove("cannot place cards onto the stock", count, source, dest);
    }

    auto& source_pile = internalGetPile(source);
    auto& dest_pile = internalGetPile(dest);

    if (std::holds_alternative<StockRef>(source) && count != 1) {
        rejectMove(
            "can only take one card at a time from the stock", count, source,
            dest);
    }
    if (std::holds_alternative<FoundationRef>(dest) && count != 1) {
        rejectMove(
            "can only place one card at a time onto a foundation", count,
            source, dest);
    }
    if (std::holds_alternative<FoundationRef>(source)) {
        rejectMove(
            "cannot take cards from a foundation", count, source, dest);
    }
    if (!source_pile.canTake(count)) {
        rejectMove("not enough cards to move", count, source, dest);
    }

    // The bottom card of the moved run is the one placed on the destination
    const auto candidate = source_pile.peek(count);
    if (!candidate || !dest_pile.verify(*candidate)) {
        rejectMove("invalid move", count, source, dest);
    }

    const auto result = source_pile.take(count);
    hand.put(result.cards);
    dest_pile.put(hand.takeAll());

    log(LogLevel::DEBUG, "Moved %s from %s to %s",
        CardCollection {result.cards}, source, dest);
    if (result.revealed) {
        log(LogLevel::DEBUG, "Revealed %s in %s", source_pile.getTop(), source);
    }
    if (isFinished()) {
        log(LogLevel::INFO, "Game finished");
    }
    return *this;
}

Game& Game::place(const int count, const int sourceIndex, const int destIndex)
{
    if (sourceIndex == destIndex) {
        throw IllegalMoveError {"cannot move cards onto the same pile"};
    }
    if (destIndex == STOCK_INDEX) {
        throw IllegalMoveError {"cannot place cards onto the stock"};
    }
    const auto source = pileRefFromIndex(sourceIndex);
    const auto dest = pileRefFromIndex(destIndex);
    if (!source || !dest) {
        log(LogLevel::INFO, "Rejected move from %d to %d: no such pile",
            sourceIndex, destIndex);
        throw IllegalMoveError {"no such pile"};
    }
    return place(count, *source, *dest);
}

void Game::drawFromStock()
{
    stock.rotate();
    log(LogLevel::DEBUG, "Stock top is now %s", stock.getTop());
}

bool Game::isFinished() const
{
    return std::all_of(
        foundations.begin(), foundations.end(),
        [](const auto& foundation) { return foundation.isComplete(); });
}

const StockPile& Game::getStock() const
{
    return stock;
}

const TableauPile& Game::getTableau(const int n) const
{
    return tableaus[checkIndex(n, N_TABLEAU_PILES)];
}

const SuitDeck& Game::getFoundation(const int n) const
{
    return foundations[checkIndex(n, N_FOUNDATIONS)];
}

const SuitDeck& Game::getFoundation(const Suit suit) const
{
    return getFoundation(suitOrder(suit));
}

const Pile& Game::getPile(const PileRef& ref) const
{
    return std::visit(PileVisitor {stock, tableaus, foundations}, ref);
}

Pile& Game::internalGetPile(const PileRef& ref)
{
    return const_cast<Pile&>(std::as_const(*this).getPile(ref));
}

std::ostream& operator<<(std::ostream& os, const Game& game)
{
    os << "stock: " << game.getStock().getVisibleCards() << "\n";
    for (const auto n : to(N_TABLEAU_PILES)) {
        os << "tableau " << n << ": " << game.getTableau(n) << "\n";
    }
    for (const auto n : to(N_FOUNDATIONS)) {
        os << "foundation " << n << ": " << game.getFoundation(n) << "\n";
    }
    return os;
}

}

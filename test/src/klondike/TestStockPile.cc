#include "klondike/Errors.hh"
#include "klondike/StockPile.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using Klondike::CardCollection;
using Klondike::CardType;
using Klondike::Face;
using Klondike::Suit;

using testing::ElementsAre;

namespace {
constexpr auto ACE = CardType {Face::ACE, Suit::HEARTS};
constexpr auto FIVE = CardType {Face::FIVE, Suit::CLUBS};
constexpr auto KING = CardType {Face::KING, Suit::DIAMONDS};
}

class StockPileTest : public testing::Test {
protected:
    Klondike::StockPile stock {CardCollection::Cards {ACE, FIVE, KING}};
};

TEST_F(StockPileTest, testNeverAcceptsCards)
{
    EXPECT_FALSE(stock.verify(ACE));
    EXPECT_FALSE(Klondike::StockPile {}.verify(KING));
}

TEST_F(StockPileTest, testTop)
{
    EXPECT_EQ(KING, stock.getTop());
    EXPECT_EQ(3, stock.getNumberOfCards());
}

TEST_F(StockPileTest, testTakeTop)
{
    const auto result = stock.take(1);
    EXPECT_THAT(result.cards, ElementsAre(KING));
    EXPECT_FALSE(result.revealed);
    EXPECT_EQ(FIVE, stock.getTop());
}

TEST_F(StockPileTest, testTakeFromEmpty)
{
    auto empty = Klondike::StockPile {};
    EXPECT_FALSE(empty.canTake(1));
    EXPECT_THROW(empty.take(1), Klondike::EmptyError);
}

TEST_F(StockPileTest, testRotate)
{
    stock.rotate();
    EXPECT_THAT(stock.getVisibleCards().getCards(), ElementsAre(KING, ACE, FIVE));
    stock.rotate();
    stock.rotate();
    EXPECT_THAT(stock.getVisibleCards().getCards(), ElementsAre(ACE, FIVE, KING));
}

TEST_F(StockPileTest, testRotateEmpty)
{
    auto empty = Klondike::StockPile {};
    empty.rotate();
    EXPECT_TRUE(empty.isEmpty());
}

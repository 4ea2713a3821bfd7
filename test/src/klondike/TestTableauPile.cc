#include "klondike/Errors.hh"
#include "klondike/TableauPile.hh"
#include "TestUtility.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>

using Klondike::CardCollection;
using Klondike::CardType;
using Klondike::Face;
using Klondike::Suit;

using testing::ElementsAre;

namespace {
constexpr auto TWO_CLUBS = CardType {Face::TWO, Suit::CLUBS};
constexpr auto NINE_HEARTS = CardType {Face::NINE, Suit::HEARTS};
constexpr auto EIGHT_SPADES = CardType {Face::EIGHT, Suit::SPADES};
constexpr auto EIGHT_DIAMONDS = CardType {Face::EIGHT, Suit::DIAMONDS};
constexpr auto SEVEN_HEARTS = CardType {Face::SEVEN, Suit::HEARTS};
constexpr auto KING_CLUBS = CardType {Face::KING, Suit::CLUBS};
constexpr auto QUEEN_HEARTS = CardType {Face::QUEEN, Suit::HEARTS};
constexpr auto DEALT = std::array {TWO_CLUBS, NINE_HEARTS};
}

class TableauPileTest : public testing::Test {
protected:
    Klondike::TableauPile pile {DEALT.begin(), DEALT.end()};
};

TEST_F(TableauPileTest, testDealtCardIsShown)
{
    EXPECT_THAT(pile.getHiddenCards().getCards(), ElementsAre(TWO_CLUBS));
    EXPECT_THAT(pile.getShownCards().getCards(), ElementsAre(NINE_HEARTS));
    EXPECT_EQ(1, pile.getNumberOfHiddenCards());
    EXPECT_EQ(2, pile.getNumberOfCards());
    EXPECT_EQ(NINE_HEARTS, pile.getTop());
}

TEST_F(TableauPileTest, testVerifyLowerRankOfOppositeColor)
{
    EXPECT_TRUE(pile.verify(EIGHT_SPADES));
}

TEST_F(TableauPileTest, testVerifySameColor)
{
    EXPECT_FALSE(pile.verify(EIGHT_DIAMONDS));
}

TEST_F(TableauPileTest, testVerifyWrongRank)
{
    EXPECT_FALSE(pile.verify(SEVEN_HEARTS));
    EXPECT_FALSE(pile.verify(KING_CLUBS));
}

TEST_F(TableauPileTest, testVerifyEmptyPile)
{
    const auto empty = Klondike::TableauPile {};
    EXPECT_TRUE(empty.verify(KING_CLUBS));
    EXPECT_FALSE(empty.verify(QUEEN_HEARTS));
}

TEST_F(TableauPileTest, testPutAppendsToShown)
{
    pile.put(CardCollection::Cards {EIGHT_SPADES, SEVEN_HEARTS});
    EXPECT_THAT(
        pile.getShownCards().getCards(),
        ElementsAre(NINE_HEARTS, EIGHT_SPADES, SEVEN_HEARTS));
    EXPECT_EQ(1, pile.getNumberOfHiddenCards());
    EXPECT_EQ(SEVEN_HEARTS, pile.peek(1));
    EXPECT_EQ(NINE_HEARTS, pile.peek(3));
    EXPECT_FALSE(pile.peek(4));
}

TEST_F(TableauPileTest, testTakeWithoutReveal)
{
    pile.put(EIGHT_SPADES);
    const auto result = pile.take(1);
    EXPECT_THAT(result.cards, ElementsAre(EIGHT_SPADES));
    EXPECT_FALSE(result.revealed);
    EXPECT_EQ(1, pile.getNumberOfHiddenCards());
}

TEST_F(TableauPileTest, testTakeReveals)
{
    const auto result = pile.take(1);
    EXPECT_THAT(result.cards, ElementsAre(NINE_HEARTS));
    EXPECT_TRUE(result.revealed);
    EXPECT_TRUE(pile.getHiddenCards().isEmpty());
    EXPECT_THAT(pile.getShownCards().getCards(), ElementsAre(TWO_CLUBS));
}

TEST_F(TableauPileTest, testTakeLastCard)
{
    pile.take(1);
    const auto result = pile.take(1);
    EXPECT_FALSE(result.revealed);
    EXPECT_TRUE(pile.isEmpty());
}

TEST_F(TableauPileTest, testHiddenCardsCannotBeTaken)
{
    EXPECT_TRUE(pile.canTake(1));
    EXPECT_FALSE(pile.canTake(2));
    EXPECT_THROW(pile.take(2), Klondike::EmptyError);
    EXPECT_EQ(2, pile.getNumberOfCards());
    EXPECT_EQ(NINE_HEARTS, pile.getTop());
}

TEST_F(TableauPileTest, testOutput)
{
    EXPECT_EQ("1 hidden, [9 hearts]", Klondike::toString(pile));
}

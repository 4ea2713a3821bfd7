#include "klondike/CardType.hh"
#include "MockPile.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using Klondike::CardCollection;
using Klondike::CardType;
using Klondike::Face;
using Klondike::Suit;

using testing::_;
using testing::ElementsAre;
using testing::Return;
using testing::ReturnRef;

namespace {
constexpr auto JACK = CardType {Face::JACK, Suit::CLUBS};
constexpr auto QUEEN = CardType {Face::QUEEN, Suit::HEARTS};
constexpr auto KING = CardType {Face::KING, Suit::SPADES};
}

class PileTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        ON_CALL(pile, handleGetVisibleCards())
            .WillByDefault(ReturnRef(visible));
        ON_CALL(pile, handleGetNumberOfCards())
            .WillByDefault(Return(5));
    }

    CardCollection visible {CardCollection::Cards {KING, QUEEN, JACK}};
    testing::NiceMock<Klondike::MockPile> pile;
};

TEST_F(PileTest, testVerify)
{
    EXPECT_CALL(pile, handleVerify(KING)).WillOnce(Return(true));
    EXPECT_TRUE(pile.verify(KING));
}

TEST_F(PileTest, testCanTake)
{
    EXPECT_CALL(pile, handleCanTake(2)).WillOnce(Return(true));
    EXPECT_TRUE(pile.canTake(2));
}

TEST_F(PileTest, testCanTakeNothing)
{
    EXPECT_CALL(pile, handleCanTake(_)).Times(0);
    EXPECT_FALSE(pile.canTake(0));
    EXPECT_FALSE(pile.canTake(-1));
}

TEST_F(PileTest, testTake)
{
    const auto result = Klondike::Pile::TakeResult {{QUEEN, JACK}, true};
    EXPECT_CALL(pile, handleTake(2)).WillOnce(Return(result));
    const auto ret = pile.take(2);
    EXPECT_THAT(ret.cards, ElementsAre(QUEEN, JACK));
    EXPECT_TRUE(ret.revealed);
}

TEST_F(PileTest, testPutSequence)
{
    EXPECT_CALL(pile, handlePut(ElementsAre(QUEEN, JACK)));
    pile.put(CardCollection::Cards {QUEEN, JACK});
}

TEST_F(PileTest, testPutCard)
{
    EXPECT_CALL(pile, handlePut(ElementsAre(KING)));
    pile.put(KING);
}

TEST_F(PileTest, testPeek)
{
    EXPECT_EQ(JACK, pile.peek(1));
    EXPECT_EQ(QUEEN, pile.peek(2));
    EXPECT_EQ(KING, pile.peek(3));
}

TEST_F(PileTest, testPeekOutOfRange)
{
    EXPECT_FALSE(pile.peek(0));
    EXPECT_FALSE(pile.peek(4));
}

TEST_F(PileTest, testGetTop)
{
    EXPECT_EQ(JACK, pile.getTop());
}

TEST_F(PileTest, testGetTopWhenEmpty)
{
    const auto empty = CardCollection {};
    EXPECT_CALL(pile, handleGetVisibleCards()).WillOnce(ReturnRef(empty));
    EXPECT_FALSE(pile.getTop());
}

TEST_F(PileTest, testNumberOfCards)
{
    EXPECT_EQ(5, pile.getNumberOfCards());
    EXPECT_FALSE(pile.isEmpty());
}

TEST_F(PileTest, testIsEmpty)
{
    EXPECT_CALL(pile, handleGetNumberOfCards()).WillOnce(Return(0));
    EXPECT_TRUE(pile.isEmpty());
}

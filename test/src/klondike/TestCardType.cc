#include "klondike/CardType.hh"
#include "klondike/CardTypeIterator.hh"
#include "klondike/KlondikeConstants.hh"
#include "TestUtility.hh"
#include "Utility.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using Klondike::CardType;
using Klondike::Color;
using Klondike::Face;
using Klondike::Suit;

TEST(CardTypeTest, testCardTypeIndex)
{
    for (const auto n : Klondike::to(Klondike::N_CARDS)) {
        EXPECT_EQ(n, cardTypeIndex(Klondike::enumerateCardType(n)));
    }
}

TEST(CardTypeTest, testEnumerateCardTypeOutOfRange)
{
    EXPECT_THROW(Klondike::enumerateCardType(-1), std::invalid_argument);
    EXPECT_THROW(
        Klondike::enumerateCardType(Klondike::N_CARDS),
        std::invalid_argument);
}

TEST(CardTypeTest, testRank)
{
    EXPECT_EQ(1, getRank(Face::ACE));
    EXPECT_EQ(10, getRank(Face::TEN));
    EXPECT_EQ(13, getRank(CardType {Face::KING, Suit::CLUBS}));
}

TEST(CardTypeTest, testColor)
{
    EXPECT_EQ(Color::BLACK, getColor(Suit::SPADES));
    EXPECT_EQ(Color::RED, getColor(Suit::HEARTS));
    EXPECT_EQ(Color::RED, getColor(Suit::DIAMONDS));
    EXPECT_EQ(Color::BLACK, getColor(CardType {Face::TWO, Suit::CLUBS}));
}

TEST(CardTypeTest, testEquality)
{
    EXPECT_EQ(
        (CardType {Face::QUEEN, Suit::HEARTS}),
        (CardType {Face::QUEEN, Suit::HEARTS}));
    EXPECT_NE(
        (CardType {Face::QUEEN, Suit::HEARTS}),
        (CardType {Face::QUEEN, Suit::DIAMONDS}));
    EXPECT_NE(
        (CardType {Face::QUEEN, Suit::HEARTS}),
        (CardType {Face::KING, Suit::HEARTS}));
}

TEST(CardTypeTest, testOrderingBySuitThenRank)
{
    EXPECT_LT(
        (CardType {Face::ACE, Suit::SPADES}),
        (CardType {Face::TWO, Suit::SPADES}));
    EXPECT_LT(
        (CardType {Face::KING, Suit::SPADES}),
        (CardType {Face::ACE, Suit::HEARTS}));
    EXPECT_GT(
        (CardType {Face::ACE, Suit::CLUBS}),
        (CardType {Face::KING, Suit::DIAMONDS}));
}

TEST(CardTypeTest, testOutput)
{
    EXPECT_EQ(
        "queen hearts",
        Klondike::toString(CardType {Face::QUEEN, Suit::HEARTS}));
    EXPECT_EQ(
        "10 clubs", Klondike::toString(CardType {Face::TEN, Suit::CLUBS}));
    EXPECT_EQ("red", Klondike::toString(Color::RED));
}

TEST(CardTypeTest, testInput)
{
    auto in = std::istringstream {"ace spades 7 diamonds"};
    auto card1 = CardType {};
    auto card2 = CardType {};
    in >> card1 >> card2;
    ASSERT_FALSE(in.fail());
    EXPECT_EQ((CardType {Face::ACE, Suit::SPADES}), card1);
    EXPECT_EQ((CardType {Face::SEVEN, Suit::DIAMONDS}), card2);
}

TEST(CardTypeTest, testInputInvalidFace)
{
    auto in = std::istringstream {"one spades"};
    auto card = CardType {};
    in >> card;
    EXPECT_TRUE(in.fail());
}

TEST(CardTypeTest, testInputInvalidSuit)
{
    auto in = std::istringstream {"ace swords"};
    auto card = CardType {};
    in >> card;
    EXPECT_TRUE(in.fail());
}

#include "klondike/KlondikeConstants.hh"
#include "klondike/PileRef.hh"
#include "Utility.hh"
#include "TestUtility.hh"

#include <gtest/gtest.h>

#include <stdexcept>

using Klondike::FoundationRef;
using Klondike::PileRef;
using Klondike::StockRef;
using Klondike::TableauRef;

TEST(PileRefTest, testStockIndex)
{
    EXPECT_EQ(PileRef {StockRef {}}, Klondike::pileRefFromIndex(-1));
    EXPECT_EQ(-1, Klondike::pileIndex(StockRef {}));
}

TEST(PileRefTest, testTableauIndices)
{
    for (const auto n : Klondike::to(Klondike::N_TABLEAU_PILES)) {
        EXPECT_EQ(PileRef {TableauRef {n}}, Klondike::pileRefFromIndex(n));
        EXPECT_EQ(n, Klondike::pileIndex(TableauRef {n}));
    }
}

TEST(PileRefTest, testFoundationIndices)
{
    for (const auto n : Klondike::to(Klondike::N_FOUNDATIONS)) {
        EXPECT_EQ(
            PileRef {FoundationRef {n}}, Klondike::pileRefFromIndex(16 + n));
        EXPECT_EQ(16 + n, Klondike::pileIndex(FoundationRef {n}));
    }
}

TEST(PileRefTest, testInvalidIndices)
{
    for (const auto n : {-16, -2, 7, 15, 20, 31, 32, 48}) {
        EXPECT_FALSE(Klondike::pileRefFromIndex(n)) << n;
    }
}

TEST(PileRefTest, testInvalidRefs)
{
    EXPECT_THROW(Klondike::pileIndex(TableauRef {7}), std::invalid_argument);
    EXPECT_THROW(
        Klondike::pileIndex(FoundationRef {-1}), std::invalid_argument);
}

TEST(PileRefTest, testOutput)
{
    using Klondike::operator<<;
    EXPECT_EQ("stock", Klondike::toString(PileRef {StockRef {}}));
    EXPECT_EQ("tableau 3", Klondike::toString(PileRef {TableauRef {3}}));
    EXPECT_EQ(
        "foundation 2", Klondike::toString(PileRef {FoundationRef {2}}));
}

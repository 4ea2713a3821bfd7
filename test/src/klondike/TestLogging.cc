#include "klondike/CardType.hh"
#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(Klondike::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(Klondike::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(Klondike::LogLevel::INFO, stream);
    log(Klondike::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingBelowLevel)
{
    log(Klondike::LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(Klondike::LogLevel::NONE, stream);
    log(Klondike::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(Klondike::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(Klondike::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingOptionalCard)
{
    const auto card = std::optional {
        Klondike::CardType {Klondike::Face::ACE, Klondike::Suit::SPADES}};
    log(Klondike::LogLevel::WARNING, "%s and %s"sv, card,
        std::optional<Klondike::CardType> {});
    EXPECT_NE(std::string::npos, stream.str().find("ace spades and none"));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(Klondike::LogLevel::WARNING, Klondike::getLogLevel(0));
    EXPECT_EQ(Klondike::LogLevel::INFO, Klondike::getLogLevel(1));
    EXPECT_EQ(Klondike::LogLevel::DEBUG, Klondike::getLogLevel(2));
}

TEST_F(LoggingTest, testLevelFromString)
{
    EXPECT_EQ(Klondike::LogLevel::NONE, Klondike::logLevelFromString("none"));
    EXPECT_EQ(Klondike::LogLevel::DEBUG, Klondike::logLevelFromString("debug"));
    EXPECT_FALSE(Klondike::logLevelFromString("verbose"));
}

#include "klondike/CardType.hh"

#include <algorithm>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>

namespace Klondike {

using namespace std::string_view_literals;

namespace {

constexpr std::array<std::string_view, N_FACES> FACE_NAMES {
    "ace"sv, "2"sv, "3"sv, "4"sv, "5"sv, "6"sv, "7"sv, "8"sv, "9"sv, "10"sv,
    "jack"sv, "queen"sv, "king"sv,
};

constexpr std::array<std::string_view, N_SUITS> SUIT_NAMES {
    "spades"sv, "hearts"sv, "diamonds"sv, "clubs"sv,
};

}

bool operator==(const CardType& lhs, const CardType& rhs)
{
    return lhs.face == rhs.face && lhs.suit == rhs.suit;
}

bool operator<(const CardType& lhs, const CardType& rhs)
{
    return std::make_tuple(suitOrder(lhs.suit), getRank(lhs)) <
        std::make_tuple(suitOrder(rhs.suit), getRank(rhs));
}

std::ostream& operator<<(std::ostream& os, const Face face)
{
    return os << FACE_NAMES.at(getRank(face) - 1);
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << SUIT_NAMES.at(suitOrder(suit));
}

std::ostream& operator<<(std::ostream& os, const Color color)
{
    return os << (color == Color::RED ? "red" : "black");
}

std::ostream& operator<<(std::ostream& os, const CardType& cardType)
{
    return os << cardType.face << " " << cardType.suit;
}

std::istream& operator>>(std::istream& is, Face& face)
{
    auto word = std::string {};
    if (is >> word) {
        const auto iter =
            std::find(FACE_NAMES.begin(), FACE_NAMES.end(), word);
        if (iter == FACE_NAMES.end()) {
            is.setstate(std::ios::failbit);
        } else {
            face = FACES[iter - FACE_NAMES.begin()];
        }
    }
    return is;
}

std::istream& operator>>(std::istream& is, Suit& suit)
{
    auto word = std::string {};
    if (is >> word) {
        const auto iter =
            std::find(SUIT_NAMES.begin(), SUIT_NAMES.end(), word);
        if (iter == SUIT_NAMES.end()) {
            is.setstate(std::ios::failbit);
        } else {
            suit = SUITS[iter - SUIT_NAMES.begin()];
        }
    }
    return is;
}

std::istream& operator>>(std::istream& is, CardType& cardType)
{
    auto face = Face {};
    auto suit = Suit {};
    if (is >> face >> suit) {
        cardType = CardType {face, suit};
    }
    return is;
}

}

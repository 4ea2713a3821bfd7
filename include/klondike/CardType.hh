/** \file
 *
 * \brief Definition of Klondike::CardType struct and related concepts
 */

#ifndef CARDTYPE_HH_
#define CARDTYPE_HH_

#include "klondike/KlondikeConstants.hh"

#include <boost/operators.hpp>

#include <array>
#include <iosfwd>

namespace Klondike {

/** \brief Face of a playing card
 *
 * The underlying value of each face is its rank (Ace 1, King 13).
 */
enum class Face {
    ACE = 1,
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING,
};

/** \brief Suit of a playing card
 *
 * The suits are listed in the order of the foundations.
 */
enum class Suit {
    SPADES,
    HEARTS,
    DIAMONDS,
    CLUBS,
};

/** \brief Color of a playing card
 */
enum class Color {
    BLACK,
    RED,
};

/** \brief Array containing all faces from Ace to King
 */
constexpr std::array<Face, N_FACES> FACES {
    Face::ACE,
    Face::TWO,
    Face::THREE,
    Face::FOUR,
    Face::FIVE,
    Face::SIX,
    Face::SEVEN,
    Face::EIGHT,
    Face::NINE,
    Face::TEN,
    Face::JACK,
    Face::QUEEN,
    Face::KING,
};

/** \brief Array containing all suits in foundation order
 */
constexpr std::array<Suit, N_SUITS> SUITS {
    Suit::SPADES,
    Suit::HEARTS,
    Suit::DIAMONDS,
    Suit::CLUBS,
};

/** \brief Playing card type
 *
 * The domain has exactly one physical card per combination of face and suit,
 * so a CardType also identifies a card. CardType objects compare equal when
 * both face and suit are equal. They are ordered first by suit and then by
 * rank.
 *
 * \note Boost operators library is used to generate the rest of the
 * comparison operators from operator== and operator<.
 */
struct CardType : private boost::totally_ordered<CardType> {
    Face face;  ///< \brief Face of the card
    Suit suit;  ///< \brief Suit of the card

    CardType() = default;

    /** \brief Create new card type
     *
     * \param face the face of the card
     * \param suit the suit of the card
     */
    constexpr CardType(Face face, Suit suit) :
        face {face},
        suit {suit}
    {
    }
};

/** \brief Equality operator for card types
 *
 * \sa CardType
 */
bool operator==(const CardType&, const CardType&);

/** \brief Less than operator for card types
 *
 * \sa CardType
 */
bool operator<(const CardType&, const CardType&);

/** \brief Determine rank of a face
 *
 * \return the rank of \p face (Ace 1, King 13)
 */
constexpr int getRank(Face face)
{
    return static_cast<int>(face);
}

/** \brief Determine rank of a card
 *
 * \return the rank of the face of \p card
 */
constexpr int getRank(const CardType& card)
{
    return getRank(card.face);
}

/** \brief Determine color of a suit
 *
 * \return Color::BLACK for spades and clubs, Color::RED for hearts and
 * diamonds
 */
constexpr Color getColor(Suit suit)
{
    return (suit == Suit::HEARTS || suit == Suit::DIAMONDS) ?
        Color::RED : Color::BLACK;
}

/** \brief Determine color of a card
 *
 * \return the color of the suit of \p card
 */
constexpr Color getColor(const CardType& card)
{
    return getColor(card.suit);
}

/** \brief Determine the order of a suit
 *
 * \return the position of \p suit in \ref SUITS (0..3), which is also the
 * index of the foundation of the suit
 */
constexpr int suitOrder(Suit suit)
{
    return static_cast<int>(suit);
}

/** \brief Output a Face to stream
 *
 * Faces are written as “ace”, “2”, …, “10”, “jack”, “queen”, “king”.
 *
 * \param os the output stream
 * \param face the face to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Face face);

/** \brief Output a Suit to stream
 *
 * Suits are written as “spades”, “hearts”, “diamonds”, “clubs”.
 *
 * \param os the output stream
 * \param suit the suit to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

/** \brief Output a Color to stream
 *
 * \param os the output stream
 * \param color the color to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Color color);

/** \brief Output a CardType to stream
 *
 * A card is written as its face and suit separated by space, for example
 * “queen hearts”.
 *
 * \param os the output stream
 * \param cardType the card type to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const CardType& cardType);

/** \brief Input a Face from stream
 *
 * The face is read in the format written by operator<<(std::ostream&, Face).
 * If the input is not a face, the failbit of \p is is set.
 *
 * \param is the input stream
 * \param face the face to input
 *
 * \return parameter \p is
 */
std::istream& operator>>(std::istream& is, Face& face);

/** \brief Input a Suit from stream
 *
 * The suit is read in the format written by operator<<(std::ostream&, Suit).
 * If the input is not a suit, the failbit of \p is is set.
 *
 * \param is the input stream
 * \param suit the suit to input
 *
 * \return parameter \p is
 */
std::istream& operator>>(std::istream& is, Suit& suit);

/** \brief Input a CardType from stream
 *
 * \param is the input stream
 * \param cardType the card type to input
 *
 * \return parameter \p is
 */
std::istream& operator>>(std::istream& is, CardType& cardType);

}

#endif // CARDTYPE_HH_

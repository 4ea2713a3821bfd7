/** \file
 *
 * \brief Utilities for generating and checking decks
 *
 * The game engine deals from any complete deck given to it. Shuffling is left
 * to the front end, which uses the random number generator declared here.
 */

#ifndef DECK_HH_
#define DECK_HH_

#include <random>
#include <vector>

namespace Klondike {

struct CardType;

/** \brief The preferred random number generator for the Klondike project
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number generator
 *
 * Unless seeded with seedRng(), the generator is seeded from the random
 * number source of the operating system.
 *
 * \return Reference to the global random number generator
 */
Rng& getRng();

/** \brief Seed the global random number generator
 *
 * Seeding makes the decks shuffled afterwards reproducible.
 *
 * \param seed the seed
 */
void seedRng(Rng::result_type seed);

/** \brief Generate an ordered deck
 *
 * \return Vector containing all 52 distinct CardType values in the order of
 * enumerateCardType()
 */
std::vector<CardType> generateOrderedDeck();

/** \brief Generate a deck of randomly shuffled cards
 *
 * The cards are shuffled with the generator returned by getRng().
 *
 * \return Vector containing all 52 distinct CardType values in random order
 */
std::vector<CardType> generateShuffledDeck();

/** \brief Determine if a sequence is a complete deck
 *
 * \param cards the sequence to check
 *
 * \return true if \p cards contains each of the 52 card types exactly once,
 * false otherwise
 */
bool isCompleteDeck(const std::vector<CardType>& cards);

}

#endif // DECK_HH_

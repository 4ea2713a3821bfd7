/** \file
 *
 * \brief Definition of fundamental Klondike constants needed by several classes
 */

#ifndef KLONDIKECONSTANTS_HH_
#define KLONDIKECONSTANTS_HH_

/** \brief Top level namespace of the Klondike rule engine
 *
 * The Klondike namespace directly contains the cards, the piles and the game
 * enforcing the rules of Klondike solitaire. The command line front end lives
 * in the Main subnamespace.
 */
namespace Klondike {

/** \brief Number of suits in playing card deck
 */
constexpr auto N_SUITS = 4;

/** \brief Number of faces in each suit (Ace to King)
 */
constexpr auto N_FACES = 13;

/** \brief Number of cards in playing card deck
 */
constexpr auto N_CARDS = N_SUITS * N_FACES; // 52

/** \brief Number of tableau piles
 */
constexpr auto N_TABLEAU_PILES = 7;

/** \brief Number of foundations, one for each suit
 */
constexpr auto N_FOUNDATIONS = N_SUITS;

/** \brief Number of cards dealt to the tableau piles
 *
 * Tableau pile n receives n + 1 cards, for a total of 28
 */
constexpr auto N_CARDS_IN_TABLEAU_DEAL =
    N_TABLEAU_PILES * (N_TABLEAU_PILES + 1) / 2;

}

#endif // KLONDIKECONSTANTS_HH_

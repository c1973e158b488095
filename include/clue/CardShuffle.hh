/** \file
 *
 * \brief Utilities for drawing the case file and dealing the cards
 */

#ifndef CARDSHUFFLE_HH_
#define CARDSHUFFLE_HH_

#include "clue/CaseFile.hh"
#include "clue/Random.hh"

#include <vector>

namespace Clue {

/** \brief The outcome of dealing the cards
 */
struct DealtCards {
    CaseFile caseFile;                    ///< \brief The hidden solution
    std::vector<std::vector<Card>> hands; ///< \brief Hands in turn order
};

/** \brief Draw a random case file
 *
 * Each of the suspect, weapon and room is drawn uniformly at random.
 *
 * \param rng the random number generator
 */
CaseFile drawCaseFile(Rng& rng);

/** \brief Draw the case file and deal the remaining cards
 *
 * After the case file is drawn, the remaining cards are shuffled and dealt
 * one by one, starting from the first player and wrapping around, until the
 * deck is empty. Hand sizes therefore differ by at most one and the earlier
 * players in turn order receive the extra cards.
 *
 * \param nPlayers the number of players
 * \param rng the random number generator
 *
 * \return the case file and one hand per player
 *
 * \throw std::invalid_argument if \p nPlayers is not positive
 */
DealtCards dealCards(int nPlayers, Rng& rng);

}

#endif // CARDSHUFFLE_HH_

/** \file
 *
 * \brief Definition of the accusation operation
 */

#ifndef ENGINE_ACCUSATIONRESOLVER_HH_
#define ENGINE_ACCUSATIONRESOLVER_HH_

#include "clue/CaseFile.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

namespace Clue {
namespace Engine {

/** \brief Make an accusation
 *
 * A correct accusation ends the game and the accuser wins. An incorrect
 * accusation eliminates the accuser and the turn advances to the next player
 * not eliminated. If nobody remains, the game ends in a tie.
 *
 * \param state the session state
 * \param player the identity of the accuser
 * \param accusation the suspect, weapon and room accused
 *
 * \return the outcome, or one of the errors of checkActionPreconditions(),
 * SessionError::ELIMINATED or SessionError::NOT_YOUR_TURN
 */
Result<AccusationOutcome> accuse(
    SessionState& state, const Uuid& player, const CaseFile& accusation);

}
}

#endif // ENGINE_ACCUSATIONRESOLVER_HH_

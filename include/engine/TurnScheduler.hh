/** \file
 *
 * \brief Definition of the turn operations
 */

#ifndef ENGINE_TURNSCHEDULER_HH_
#define ENGINE_TURNSCHEDULER_HH_

#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

#include <cstddef>
#include <optional>

namespace Clue {
namespace Engine {

/** \brief Determine the player receiving the turn after \p index
 *
 * Eliminated players are skipped and the search wraps around. If every other
 * player is eliminated, the turn stays with \p index.
 *
 * \return index of the next player not eliminated, or none if every player
 * is eliminated
 */
std::optional<std::size_t> getNextTurnHolder(
    const SessionState& state, std::size_t index);

/** \brief Give the turn to the next player not eliminated
 *
 * \throw SessionAbortedException if every player is eliminated
 */
void advanceTurn(SessionState& state);

/** \brief End the turn of a player
 *
 * \param state the session state
 * \param player the identity of the player
 *
 * \return nothing, or one of the errors of checkActionPreconditions(),
 * SessionError::NOT_YOUR_TURN or SessionError::ELIMINATED
 */
Result<> endTurn(SessionState& state, const Uuid& player);

}
}

#endif // ENGINE_TURNSCHEDULER_HH_

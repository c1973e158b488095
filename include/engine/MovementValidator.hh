/** \file
 *
 * \brief Definition of the move operation
 */

#ifndef ENGINE_MOVEMENTVALIDATOR_HH_
#define ENGINE_MOVEMENTVALIDATOR_HH_

#include "clue/Board.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

#include <cstddef>
#include <optional>

namespace Clue {
namespace Engine {

/** \brief Check the board rules of moving a player
 *
 * The rules are checked in order:
 *
 * 1. \p target differs from the current location (SessionError::SAME_LOCATION)
 * 2. \p target is adjacent to the current location, secret passages
 *    included (SessionError::INVALID_MOVE)
 * 3. \p target is not a hallway with the token of another connected player
 *    (SessionError::HALLWAY_OCCUPIED)
 *
 * \param state the session state
 * \param index the index of the player moving
 * \param target the location the player moves to
 *
 * \return the first rule violated, or none if the move is legal
 */
std::optional<SessionError> checkBoardRules(
    const SessionState& state, std::size_t index, const Location& target);

/** \brief Move a player
 *
 * Moving does not end the turn.
 *
 * \param state the session state
 * \param player the identity of the player
 * \param target the location the player moves to
 * \param freeMovementInLobby if true, the players may move freely, without
 * any turn restrictions, before the game starts
 *
 * \return nothing, or one of the errors of checkActionPreconditions(),
 * SessionError::ELIMINATED, SessionError::NOT_YOUR_TURN or one of the errors
 * of checkBoardRules()
 */
Result<> move(
    SessionState& state, const Uuid& player, const Location& target,
    bool freeMovementInLobby = false);

}
}

#endif // ENGINE_MOVEMENTVALIDATOR_HH_

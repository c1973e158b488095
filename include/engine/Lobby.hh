/** \file
 *
 * \brief Definition of the lobby operations: joining, leaving and starting
 */

#ifndef ENGINE_LOBBY_HH_
#define ENGINE_LOBBY_HH_

#include "clue/Card.hh"
#include "clue/Random.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

#include <cstddef>
#include <optional>

namespace Clue {
namespace Engine {

/** \brief Join a player to a session
 *
 * A player that has already joined reconnects. Their participation becomes
 * connected again and nothing else changes. Reconnecting is possible in every
 * status of the session.
 *
 * A new player is appended to the end of the turn order. The player gets \p
 * preferred as their character if given, otherwise a random character nobody
 * has taken. The first player to join becomes the host.
 *
 * \param state the session state
 * \param player the identity of the player
 * \param preferred the character requested by the player
 * \param rng the random number generator used to pick the character
 *
 * \return the index of the player, or
 * - SessionError::GAME_OVER if the game has ended and the player is new
 * - SessionError::ALREADY_STARTED if the game is in progress and the player
 *   is new
 * - SessionError::CAPACITY_EXCEEDED if the session is full
 * - SessionError::CHARACTER_TAKEN if \p preferred has been assigned to
 *   someone else
 */
Result<std::size_t> join(
    SessionState& state, const Uuid& player,
    const std::optional<Suspect>& preferred, Rng& rng);

/** \brief Disconnect a player from a session
 *
 * The player keeps their place in the turn order, their hand and their
 * token. If the host leaves before the game starts, the next connected player
 * in turn order becomes the host.
 *
 * \param state the session state
 * \param player the identity of the player
 *
 * \return nothing, or SessionError::UNKNOWN_PLAYER
 */
Result<> leave(SessionState& state, const Uuid& player);

/** \brief Start the game
 *
 * Draws the case file, deals the remaining cards to the players round-robin
 * starting from the first player, and gives the turn to the first player.
 *
 * \param state the session state
 * \param requester the identity of the requester
 * \param rng the random number generator used to draw and deal the cards
 *
 * \return nothing, or
 * - SessionError::GAME_OVER if the game has ended
 * - SessionError::ALREADY_STARTED if the game is in progress
 * - SessionError::UNKNOWN_PLAYER if \p requester has not joined
 * - SessionError::NOT_HOST if \p requester is not the host
 * - SessionError::INSUFFICIENT_PLAYERS if fewer than three players have joined
 *
 * \throw SessionAbortedException if the deal violates card conservation
 */
Result<> start(SessionState& state, const Uuid& requester, Rng& rng);

}
}

#endif // ENGINE_LOBBY_HH_

/** \file
 *
 * \brief Definition of the suggestion and disprove operations
 *
 * A suggestion names a suspect and a weapon, and the room the suggester is
 * in. The players after the suggester are asked in turn order whether they
 * can disprove it, and the first player holding any of the three cards shows
 * one of them to the suggester.
 *
 * When the disprover holds more than one of the cards, they must choose which
 * one to show. The choice is modeled as a PendingDisprove in the session
 * state. While it exists, no other game action is accepted.
 */

#ifndef ENGINE_SUGGESTIONRESOLVER_HH_
#define ENGINE_SUGGESTIONRESOLVER_HH_

#include "clue/CaseFile.hh"
#include "clue/Player.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Clue {
namespace Engine {

/** \brief Get the cards in a hand that disprove a suggestion
 *
 * \return the matching cards in the order suspect, weapon, room
 */
std::vector<Card> getMatchingCards(
    const Player& player, const CaseFile& suggestion);

/** \brief Find the player disproving a suggestion
 *
 * The players are visited in turn order starting from the player after \p
 * suggester and wrapping around. The suggester is not visited. Eliminated
 * and disconnected players are visited like everyone else.
 *
 * \return index of the first player holding one of the cards of \p
 * suggestion, or none if nobody holds any
 */
std::optional<std::size_t> findDisprover(
    const SessionState& state, std::size_t suggester,
    const CaseFile& suggestion);

/** \brief Make a suggestion
 *
 * The token of \p suspect is moved to the room of the suggester. Then the
 * disprover is searched with findDisprover(). If the disprover has exactly
 * one matching card, it is revealed immediately. If the disprover has more
 * than one, a disprove request expiring at \p deadline is created.
 *
 * \param state the session state
 * \param player the identity of the suggester
 * \param suspect the suspect named
 * \param weapon the weapon named
 * \param deadline the time the disprover must choose the card by
 *
 * \return the outcome visible to the suggester, or one of the errors of
 * checkActionPreconditions(), SessionError::ELIMINATED,
 * SessionError::NOT_YOUR_TURN or SessionError::NOT_IN_ROOM
 */
Result<SuggestionOutcome> suggest(
    SessionState& state, const Uuid& player, Suspect suspect, Weapon weapon,
    SessionClock::time_point deadline);

/** \brief Choose the card revealed to the suggester
 *
 * \param state the session state
 * \param player the identity of the disprover
 * \param card the card to reveal
 *
 * \return the outcome visible to the suggester, or
 * - SessionError::GAME_OVER if the game has ended
 * - SessionError::UNKNOWN_PLAYER if \p player has not joined
 * - SessionError::NO_PENDING_DISPROVE if no choice is pending
 * - SessionError::NOT_DISPROVER if \p player is not the disprover
 * - SessionError::INVALID_CARD if \p card is not a matching card
 */
Result<SuggestionOutcome> disprove(
    SessionState& state, const Uuid& player, const Card& card);

/** \brief Resolve a disprove request with the default choice
 *
 * The first matching card is revealed.
 *
 * \param state the session state
 * \param requestId the identifier of the request
 *
 * \return the outcome visible to the suggester, or
 * SessionError::NO_PENDING_DISPROVE if the request \p requestId is no longer
 * pending
 */
Result<SuggestionOutcome> expireDisprove(
    SessionState& state, std::uint64_t requestId);

/** \brief Resolve the pending disprove request if its deadline has passed
 *
 * \return the outcome visible to the suggester if a request was resolved,
 * none otherwise
 */
std::optional<SuggestionOutcome> expireOverdueDisprove(
    SessionState& state, SessionClock::time_point now);

}
}

#endif // ENGINE_SUGGESTIONRESOLVER_HH_

/** \file
 *
 * \brief Definition of Clue::Engine::SessionState and related types
 */

#ifndef ENGINE_SESSIONSTATE_HH_
#define ENGINE_SESSIONSTATE_HH_

#include "clue/Board.hh"
#include "clue/CaseFile.hh"
#include "clue/ClueConstants.hh"
#include "clue/Player.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"

#include <boost/bimap/bimap.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Clue {
namespace Engine {

/** \brief Status of a session
 */
enum class SessionStatus {
    LOBBY,        ///< Players are joining
    IN_PROGRESS,  ///< The game is being played
    ENDED,        ///< The game has a winner or ended in a tie
};

/** \brief Type of \ref SESSION_STATUS_TO_STRING_MAP
 */
using SessionStatusToStringMap =
    boost::bimaps::bimap<SessionStatus, std::string>;

/** \brief Two-way map between SessionStatus enumerations and their string
 * representation
 */
extern const SessionStatusToStringMap SESSION_STATUS_TO_STRING_MAP;

/** \brief The clock used for disprove deadlines
 */
using SessionClock = std::chrono::steady_clock;

/** \brief Outcome of a suggestion disproved by revealing a card
 */
struct CardRevealed {
    Uuid disprover;  ///< \brief The player that revealed the card
    Card card;       ///< \brief The card revealed to the suggester
};

/** \brief Outcome of a suggestion nobody could disprove
 */
struct NoRefute {};

/** \brief Outcome of a suggestion waiting for the disprover to choose
 */
struct AwaitingDisprove {
    Uuid disprover;           ///< \brief The player that must choose a card
    std::uint64_t requestId;  ///< \brief Identifier of the pending request
};

/** \brief The private outcome of a suggestion
 *
 * The outcome is only ever shown to the suggester.
 */
using SuggestionOutcome =
    std::variant<CardRevealed, NoRefute, AwaitingDisprove>;

/** \brief Outcome of an accusation
 */
enum class AccusationOutcome {
    WIN,         ///< The accusation was correct and the accuser won
    ELIMINATED,  ///< The accusation was incorrect and the accuser is out
    TIE,         ///< The accusation eliminated the last player in the game
};

/** \brief Type of \ref ACCUSATION_OUTCOME_TO_STRING_MAP
 */
using AccusationOutcomeToStringMap =
    boost::bimaps::bimap<AccusationOutcome, std::string>;

/** \brief Two-way map between AccusationOutcome enumerations and their string
 * representation
 */
extern const AccusationOutcomeToStringMap ACCUSATION_OUTCOME_TO_STRING_MAP;

/** \brief A disprove choice waiting for the disprover
 *
 * If the disprover does not choose before \ref deadline, the first of the
 * \ref matchingCards is revealed.
 */
struct PendingDisprove {
    std::uint64_t id;                 ///< \brief Identifier of the request
    std::size_t suggester;            ///< \brief Index of the suggester
    std::size_t disprover;            ///< \brief Index of the disprover
    CaseFile suggestion;              ///< \brief The suggested cards
    std::vector<Card> matchingCards;  ///< \brief Cards the disprover may show
    SessionClock::time_point deadline;  ///< \brief Time of the default choice
};

/** \brief The authoritative state of one game
 *
 * Players are stored in join order, which is also the turn order. Indices to
 * \ref players identify players within the state.
 *
 * The state is a plain record. The operations in Lobby.hh,
 * MovementValidator.hh, SuggestionResolver.hh, AccusationResolver.hh and
 * TurnScheduler.hh are the only functions that mutate it.
 */
struct SessionState {

    /** \brief Create the state of a new session in the lobby
     *
     * Every character token is placed to its starting hallway.
     *
     * \param uuid the identifier of the session
     */
    explicit SessionState(const Uuid& uuid = {});

    /** \brief The identifier of the session
     */
    Uuid uuid;

    /** \brief The players in turn order
     */
    std::vector<Player> players;

    /** \brief The location of the token of each character, indexed by Suspect
     */
    std::array<Location, N_SUSPECTS> tokens;

    /** \brief The hidden solution, none before the game starts
     */
    std::optional<CaseFile> caseFile;

    /** \brief The status of the session
     */
    SessionStatus status {SessionStatus::LOBBY};

    /** \brief Index of the winner, none unless the game was won
     */
    std::optional<std::size_t> winner;

    /** \brief Index of the player having the turn
     *
     * Only meaningful while the status is SessionStatus::IN_PROGRESS.
     */
    std::size_t turnIndex {};

    /** \brief Index of the host, none before the first join
     */
    std::optional<std::size_t> hostIndex;

    /** \brief The disprove choice waiting to be resolved, if any
     */
    std::optional<PendingDisprove> pendingDisprove;

    /** \brief The latest suggestion outcome of each suggester
     */
    std::map<Uuid, SuggestionOutcome> lastOutcomes;

    /** \brief The identifier given to the next disprove request
     */
    std::uint64_t nextRequestId {1};
};

/** \brief Find the index of a player
 *
 * \return the index of the player identified by \p uuid, or none if the player
 * has not joined
 */
std::optional<std::size_t> findPlayer(
    const SessionState& state, const Uuid& uuid);

/** \brief Get the location of the token of \p character
 */
const Location& getTokenLocation(const SessionState& state, Suspect character);

/** \brief Get the location of the player at \p index
 */
const Location& getPlayerLocation(const SessionState& state, std::size_t index);

/** \brief Get the index of the player having the turn
 *
 * \return the turn index while the game is in progress, none otherwise
 */
std::optional<std::size_t> getTurnHolder(const SessionState& state);

/** \brief Determine if the player at \p index has the turn
 */
bool isTurnHolder(const SessionState& state, std::size_t index);

/** \brief Determine if the player at \p index is the host
 */
bool isHost(const SessionState& state, std::size_t index);

/** \brief Count the players not eliminated
 */
int countNonEliminated(const SessionState& state);

/** \brief Check the preconditions shared by the game actions
 *
 * The preconditions are checked in order:
 *
 * 1. The game has not ended (SessionError::GAME_OVER)
 * 2. The requester has joined (SessionError::UNKNOWN_PLAYER)
 * 3. The game has started, unless \p allowInLobby (SessionError::NOT_STARTED)
 * 4. No disprove choice is pending (SessionError::DISPROVE_PENDING)
 *
 * \param state the session state
 * \param player the requester
 * \param allowInLobby whether the action is allowed before the game starts
 *
 * \return the index of the requester
 */
Result<std::size_t> checkActionPreconditions(
    const SessionState& state, const Uuid& player, bool allowInLobby = false);

/** \brief Verify that the case file and the hands partition the cards
 *
 * Does nothing before the game has started.
 *
 * \throw SessionAbortedException if a card is missing or appears twice
 */
void verifyCardConservation(const SessionState& state);

/// \brief Equality operator for CardRevealed
bool operator==(const CardRevealed&, const CardRevealed&);

/// \brief Equality operator for NoRefute
bool operator==(const NoRefute&, const NoRefute&);

/// \brief Equality operator for AwaitingDisprove
bool operator==(const AwaitingDisprove&, const AwaitingDisprove&);

/** \brief Output a SessionStatus to stream
 */
std::ostream& operator<<(std::ostream& os, SessionStatus status);

/** \brief Output an AccusationOutcome to stream
 */
std::ostream& operator<<(std::ostream& os, AccusationOutcome outcome);

/** \brief Output a CardRevealed to stream
 */
std::ostream& operator<<(std::ostream& os, const CardRevealed& outcome);

/** \brief Output a NoRefute to stream
 */
std::ostream& operator<<(std::ostream& os, const NoRefute& outcome);

/** \brief Output an AwaitingDisprove to stream
 */
std::ostream& operator<<(std::ostream& os, const AwaitingDisprove& outcome);

}
}

#endif // ENGINE_SESSIONSTATE_HH_

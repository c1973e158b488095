/** \file
 *
 * \brief Definition of Clue::Engine::GameSession class
 */

#ifndef ENGINE_GAMESESSION_HH_
#define ENGINE_GAMESESSION_HH_

#include "clue/Board.hh"
#include "clue/CaseFile.hh"
#include "clue/Player.hh"
#include "clue/Uuid.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"
#include "Observer.hh"

#include <boost/core/noncopyable.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace Clue {

/** \brief The session engine
 *
 * Namespace Engine contains the rules of the game, and the session actor that
 * applies them to the state of one game.
 */
namespace Engine {

/** \brief The actor owning the state of a single game
 *
 * GameSession serializes the operations on one SessionState. Every operation
 * locks the session, checks the rules, mutates the state and notifies the
 * observers before releasing the lock. Thus observers see the events of a
 * session in the order the mutations happened, and each event is emitted
 * before the next mutation begins. Different sessions are independent and
 * may be operated from different threads.
 *
 * Each event carries a reference to the session state. The reference is
 * valid only during the notification, and observers must not call back to
 * the session while handling it.
 *
 * If an operation detects that an invariant of the session is broken, the
 * session is aborted. The failure is logged, the observers of SessionAborted
 * are notified and all subsequent operations fail with
 * SessionError::SESSION_ABORTED.
 */
class GameSession : private boost::noncopyable {
public:

    /** \brief Configuration of a session
     */
    struct Options {

        /** \brief The time the disprover has to choose a card
         *
         * If the disprover does not choose in time, the first matching card
         * is revealed.
         */
        std::chrono::milliseconds disproveTimeout {30000};

        /** \brief Allow free movement before the game starts
         *
         * This is a compatibility mode for old clients, and disabled by
         * default.
         */
        bool freeMovementInLobby {false};
    };

    /** \brief Event for announcing that a player joined or reconnected
     */
    struct PlayerJoined {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The player
        Suspect character;          ///< \brief The character of the player
        bool reconnected;           ///< \brief Whether the player was known
    };

    /** \brief Event for announcing that a player disconnected
     */
    struct PlayerLeft {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The player
    };

    /** \brief Event for announcing that the host role was transferred
     */
    struct HostChanged {
        const SessionState& state;  ///< \brief The session state
        Uuid host;                  ///< \brief The new host
    };

    /** \brief Event for announcing that the game started
     */
    struct GameStarted {
        const SessionState& state;  ///< \brief The session state
    };

    /** \brief Event for announcing that a player has the turn
     */
    struct TurnStarted {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The player having the turn
    };

    /** \brief Event for announcing that a player moved
     */
    struct PlayerMoved {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The player
        Location location;          ///< \brief The new location
    };

    /** \brief Event for announcing that a suggestion was made
     *
     * The token of the suspect has already been moved to the room when the
     * event is emitted.
     */
    struct SuggestionMade {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The suggester
        CaseFile suggestion;        ///< \brief The suggested cards
    };

    /** \brief Event for announcing that a disprover must choose a card
     */
    struct DisproveRequested {
        const SessionState& state;       ///< \brief The session state
        Uuid suggester;                  ///< \brief The suggester
        Uuid disprover;                  ///< \brief The disprover
        std::uint64_t requestId;         ///< \brief The request identifier
        std::chrono::milliseconds timeout;  ///< \brief Time to choose
    };

    /** \brief Event for announcing that a suggestion was resolved
     *
     * \note The outcome is private to the suggester. Observers publishing
     * events to all players must not publish it.
     */
    struct SuggestionResolved {
        const SessionState& state;  ///< \brief The session state
        Uuid suggester;             ///< \brief The suggester
        SuggestionOutcome outcome;  ///< \brief The private outcome
    };

    /** \brief Event for announcing an accusation
     *
     * The accused cards are not part of the event.
     */
    struct AccusationMade {
        const SessionState& state;  ///< \brief The session state
        Uuid player;                ///< \brief The accuser
        AccusationOutcome outcome;  ///< \brief The outcome
    };

    /** \brief Event for announcing that the game ended
     */
    struct GameEnded {
        const SessionState& state;  ///< \brief The session state
        std::optional<Uuid> winner; ///< \brief The winner, none for a tie
    };

    /** \brief Event emitted after every successful mutation
     *
     * The event follows the more specific events of the mutation.
     */
    struct StateUpdated {
        const SessionState& state;  ///< \brief The session state
    };

    /** \brief Event for announcing that the session was aborted
     */
    struct SessionAborted {
        const SessionState& state;  ///< \brief The session state
        std::string reason;         ///< \brief Description of the defect
    };

    /** \brief Create new session in the lobby
     *
     * \param uuid the identifier of the session
     * \param options the configuration of the session
     */
    GameSession(const Uuid& uuid, Options options);

    ~GameSession();

    /** \brief Subscribe to notifications about players joining
     */
    void subscribeToPlayerJoined(
        std::weak_ptr<Observer<PlayerJoined>> observer);

    /** \brief Subscribe to notifications about players leaving
     */
    void subscribeToPlayerLeft(std::weak_ptr<Observer<PlayerLeft>> observer);

    /** \brief Subscribe to notifications about host transfers
     */
    void subscribeToHostChanged(std::weak_ptr<Observer<HostChanged>> observer);

    /** \brief Subscribe to notifications about the game starting
     */
    void subscribeToGameStarted(std::weak_ptr<Observer<GameStarted>> observer);

    /** \brief Subscribe to notifications about turns starting
     */
    void subscribeToTurnStarted(std::weak_ptr<Observer<TurnStarted>> observer);

    /** \brief Subscribe to notifications about moves
     */
    void subscribeToPlayerMoved(std::weak_ptr<Observer<PlayerMoved>> observer);

    /** \brief Subscribe to notifications about suggestions
     */
    void subscribeToSuggestionMade(
        std::weak_ptr<Observer<SuggestionMade>> observer);

    /** \brief Subscribe to notifications about pending disprove choices
     */
    void subscribeToDisproveRequested(
        std::weak_ptr<Observer<DisproveRequested>> observer);

    /** \brief Subscribe to notifications about resolved suggestions
     */
    void subscribeToSuggestionResolved(
        std::weak_ptr<Observer<SuggestionResolved>> observer);

    /** \brief Subscribe to notifications about accusations
     */
    void subscribeToAccusationMade(
        std::weak_ptr<Observer<AccusationMade>> observer);

    /** \brief Subscribe to notifications about the game ending
     */
    void subscribeToGameEnded(std::weak_ptr<Observer<GameEnded>> observer);

    /** \brief Subscribe to notifications about any change in the state
     */
    void subscribeToStateUpdated(
        std::weak_ptr<Observer<StateUpdated>> observer);

    /** \brief Subscribe to notifications about the session being aborted
     */
    void subscribeToSessionAborted(
        std::weak_ptr<Observer<SessionAborted>> observer);

    /** \brief Join or reconnect a player
     *
     * \param player the identity of the player
     * \param character the character requested by the player, if any
     *
     * \return copy of the player record
     *
     * \sa Engine::join()
     */
    Result<Player> join(
        const Uuid& player, const std::optional<Suspect>& character = {});

    /** \brief Disconnect a player
     *
     * \sa Engine::leave()
     */
    Result<> leave(const Uuid& player);

    /** \brief Start the game
     *
     * \sa Engine::start()
     */
    Result<> startGame(const Uuid& player);

    /** \brief Move a player
     *
     * \sa Engine::move()
     */
    Result<> move(const Uuid& player, const Location& target);

    /** \brief Make a suggestion
     *
     * \sa Engine::suggest()
     */
    Result<SuggestionOutcome> suggest(
        const Uuid& player, Suspect suspect, Weapon weapon);

    /** \brief Choose the card revealed to the suggester
     *
     * \sa Engine::disprove()
     */
    Result<SuggestionOutcome> disprove(const Uuid& player, const Card& card);

    /** \brief Resolve a disprove request with the default choice
     *
     * \sa Engine::expireDisprove()
     */
    Result<SuggestionOutcome> expireDisprove(std::uint64_t requestId);

    /** \brief Make an accusation
     *
     * \sa Engine::accuse()
     */
    Result<AccusationOutcome> accuse(
        const Uuid& player, const CaseFile& accusation);

    /** \brief End the turn
     *
     * \sa Engine::endTurn()
     */
    Result<> endTurn(const Uuid& player);

    /** \brief Visit the state of the session
     *
     * \p visitor is called while the session is locked. It must not call any
     * other method of the session.
     *
     * \param visitor the function called with the state
     */
    void inspect(const std::function<void(const SessionState&)>& visitor) const;

    /** \brief Get a copy of the state of the session
     */
    SessionState getSnapshot() const;

    /** \brief Get the identifier of the session
     */
    const Uuid& getUuid() const;

    /** \brief Determine if the session has been aborted
     */
    bool isAborted() const;

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // ENGINE_GAMESESSION_HH_

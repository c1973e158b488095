/** \file
 *
 * \brief Definition of Clue::Main::ClueGame
 */

#ifndef MAIN_CLUEGAME_HH_
#define MAIN_CLUEGAME_HH_

#include "clue/Uuid.hh"
#include "main/GameStateHelper.hh"
#include "messaging/Sockets.hh"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Clue {

namespace Engine {
class GameSession;
}

namespace Messaging {
class CallbackScheduler;
}

namespace Main {

/** \brief Single hosted Clue game
 *
 * ClueGame connects a session to the outside world. It observes the events
 * of the session and publishes them through the event socket, maintaining
 * the running counter and the public history of the game. It also schedules
 * the default resolution of pending disprove choices.
 *
 * ClueGame expects that the session is only operated from the thread running
 * the message loop that owns the event socket and the callback scheduler.
 *
 * \sa \ref clueprotocol
 */
class ClueGame {
public:

    /** \brief Type of the running counter
     */
    using Counter = std::uint64_t;

    /** \brief Create new Clue game
     *
     * \param session the session hosted
     * \param eventSocket the socket events are published to
     * \param callbackScheduler the callback scheduler used to schedule disprove
     * timeouts
     */
    ClueGame(
        std::shared_ptr<Engine::GameSession> session,
        Messaging::SharedSocket eventSocket,
        std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler);

    /** \brief Move constructor
     */
    ClueGame(ClueGame&&) = default;

    /** \brief Move assignment
     */
    ClueGame& operator=(ClueGame&&) = default;

    /** \brief Get the UUID of the game
     */
    const Uuid& getUuid() const;

    /** \brief Get the session hosted
     */
    Engine::GameSession& getSession();

    /** \brief Get current state of the game
     *
     * \param player the player whose viewpoint is applied
     * \param keys the keys to retrieve, or none for all keys
     *
     * \return JSON object containing the requested keys
     *
     * \sa \ref clueprotocolcontrolget
     */
    GameState getState(
        const Uuid& player,
        const std::optional<std::vector<std::string>>& keys) const;

    /** \brief Get the value of the running counter
     */
    Counter getCounter() const;

private:

    class Impl;
    std::shared_ptr<Impl> impl;
};

}
}

#endif // MAIN_CLUEGAME_HH_

/** \file
 *
 * \brief Definition of Clue::Main::PlayerControl
 */

#ifndef MAIN_PLAYERCONTROL_HH_
#define MAIN_PLAYERCONTROL_HH_

#include "clue/Uuid.hh"
#include "messaging/Identity.hh"

#include <boost/core/noncopyable.hpp>

#include <memory>

namespace Clue {
namespace Main {

/** \brief Utility class for access control of clients and players
 *
 * Each client in the Clue protocol is allowed to act for one or more
 * players. A client gains the control of a player by joining a game as that
 * player, and keeps it from then on.
 *
 * A client authenticated by a ZAP handler is recognized by its user ID, so
 * it regains the control of its players after reconnecting. A client without
 * user ID is recognized by its routing ID. It can reconnect by setting the
 * same routing ID on its new connection.
 */
class PlayerControl : private boost::noncopyable {
public:

    /** \brief Create new player control object
     */
    PlayerControl();

    ~PlayerControl();

    /** \brief Determine if a client may claim a player
     *
     * \param client the identity of the client
     * \param player the UUID of the player
     *
     * \return true if \p player is not controlled by any client, or is
     * controlled by \p client
     */
    bool isAvailable(
        const Messaging::Identity& client, const Uuid& player) const;

    /** \brief Claim a player for a client
     *
     * If \p player is not controlled by any client, it becomes controlled by
     * \p client.
     *
     * \param client the identity of the client
     * \param player the UUID of the player
     *
     * \return true if \p player is now controlled by \p client, false if it
     * is controlled by another client
     */
    bool claimPlayer(const Messaging::Identity& client, const Uuid& player);

    /** \brief Determine if a client controls a player
     *
     * \param client the identity of the client
     * \param player the UUID of the player
     *
     * \return true if \p player has been claimed by \p client, false
     * otherwise
     */
    bool isControlledBy(
        const Messaging::Identity& client, const Uuid& player) const;

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_PLAYERCONTROL_HH_

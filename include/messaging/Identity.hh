/** \file
 *
 * \brief Definition of Clue::Messaging::Identity
 */

#ifndef MESSAGING_IDENTITY_HH_
#define MESSAGING_IDENTITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <iosfwd>
#include <string>

namespace Clue {
namespace Messaging {

/** \brief User ID type
 *
 * \sa Identity
 */
using UserId = std::string;

/** \brief Routing ID type
 *
 * \sa Identity
 */
using RoutingId = Blob;

/** \brief Identity of a client
 *
 * The identity has two parts:
 *
 * 1. The user ID is the User-Id metadata property of the ZeroMQ connection,
 *    set by a ZAP handler if one is in use. Without authentication it is
 *    empty.
 * 2. The routing ID is attached to the connection by the client or by the
 *    ROUTER socket. It identifies the connection for the lifetime of the
 *    connection, and is used as the address of replies.
 */
struct Identity {
    UserId userId;        ///< User ID
    RoutingId routingId;  ///< Routing ID

    /** \brief Compare identities
     */
    auto operator<=>(const Identity&) const = default;
};

/** \brief Retrieve the identity of the sender of a message
 *
 * \param message a payload frame of the message, used to retrieve the
 * User-Id metadata
 * \param routerIdentityFrame the routing id frame received from a ROUTER
 * socket, or nullptr if there is none
 *
 * \return the identity of the connection \p message was received from
 */
Identity identityFromMessage(
    Message& message, const Message* routerIdentityFrame);

/** \brief Output an identity to stream
 *
 * The routing ID is printed in hexadecimal.
 */
std::ostream& operator<<(std::ostream& os, const Identity& identity);

}
}

#endif // MESSAGING_IDENTITY_HH_

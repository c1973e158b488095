/** \file
 *
 * \brief Definition of Clue::Messaging::MessageQueue class
 */

#ifndef MESSAGING_MESSAGEQUEUE_HH_
#define MESSAGING_MESSAGEQUEUE_HH_

#include "messaging/MessageHandler.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"
#include "BlobMap.hh"

#include <boost/core/noncopyable.hpp>

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

namespace Clue {

/** \brief The messaging framework
 *
 * Namespace Messaging contains the utilities for exchanging messages between
 * the server and its clients.
 */
namespace Messaging {

/** \brief Message queue dispatching commands to their handlers
 *
 * MessageQueue receives a command from a socket, dispatches it to the
 * handler registered for the command and sends the reply back through the
 * same socket. The MessageQueue object does not own the socket. It is
 * intended to be registered as a callback of a MessageLoop.
 *
 * A command message consists of the following frames:
 *
 * - the routing id and an empty delimiter frame if the socket is a ROUTER
 * - the tag, an arbitrary frame echoed in the reply
 * - the command
 * - the arguments of the command
 *
 * The reply consists of the routing id and delimiter frames, the tag, the
 * status set by the handler and the frames added by the handler. A command
 * with no handler is replied with REPLY_FAILURE. A message too short to
 * contain a tag and a command is dropped without reply.
 *
 * Commands are matched by binary comparison.
 */
class MessageQueue : private boost::noncopyable {
public:

    /** \brief Create message queue with no handlers
     */
    MessageQueue();

    /** \brief Create message queue
     *
     * \param handlers initial handlers
     */
    MessageQueue(
        std::initializer_list<
            std::pair<ByteSpan, std::shared_ptr<MessageHandler>>> handlers);

    ~MessageQueue();

    /** \brief Try to set handler for a command
     *
     * \param command the command
     * \param handler the handler
     *
     * \return true if \p handler was registered, false if there already is a
     * handler for \p command
     */
    bool trySetHandler(
        ByteSpan command, std::shared_ptr<MessageHandler> handler);

    /** \brief Receive and reply the next message
     *
     * \param socket the socket the message is received from and the reply
     * is sent to
     */
    void operator()(Socket& socket);

private:

    using MessageVector = std::vector<Message>;

    class BasicResponse;

    BlobMap<std::shared_ptr<MessageHandler>> handlers;
};

}
}

#endif // MESSAGING_MESSAGEQUEUE_HH_

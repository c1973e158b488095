/** \file
 *
 * \brief Definition of Clue::Messaging::MessageLoop class
 */

#ifndef MESSAGING_MESSAGELOOP_HH_
#define MESSAGING_MESSAGELOOP_HH_

#include "messaging/Sockets.hh"

#include <boost/core/noncopyable.hpp>

#include <functional>
#include <memory>

namespace Clue {
namespace Messaging {

/** \brief Event loop polling ZeroMQ sockets
 *
 * The sockets and their callbacks are registered with addPollable(). Polling
 * starts when run() is called, and continues until the
 * process receives SIGINT or SIGTERM, or terminate() is called.
 *
 * The message loop blocks SIGINT and SIGTERM in the thread constructing it,
 * and restores the signal mask when destructed. Threads created after the
 * message loop inherit the mask.
 */
class MessageLoop : private boost::noncopyable {
public:

    /** \brief Socket polled by the message loop
     */
    using PollableSocket = SharedSocket;

    /** \brief Callback invoked when a socket is ready for reading
     */
    using SocketCallback = std::function<void(Socket&)>;

    /** \brief Create new message loop without sockets
     *
     * \throw std::system_error if the signal mask cannot be set
     */
    MessageLoop();

    ~MessageLoop();

    /** \brief Register a socket to the message loop
     *
     * \param socket the socket
     * \param callback the callback invoked with the socket when it has
     * messages to read
     *
     * \throw std::invalid_argument if \p socket or \p callback is empty, or
     * if the socket is already registered
     */
    void addPollable(PollableSocket socket, SocketCallback callback);

    /** \brief Deregister a socket from the message loop
     *
     * It is not an error to remove a socket that was not registered.
     */
    void removePollable(Socket& socket);

    /** \brief Run the message loop
     *
     * An exception thrown by a callback is logged, and polling continues.
     *
     * \throw std::system_error if the signals cannot be polled
     */
    void run();

    /** \brief Make run() return after the callback currently executing
     *
     * This method must be called from a callback of the loop.
     */
    void terminate();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MESSAGING_MESSAGELOOP_HH_

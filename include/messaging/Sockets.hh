/** \file
 *
 * \brief Socket definitions of the messaging framework
 *
 * The messaging framework uses cppzmq (https://github.com/zeromq/cppzmq) as
 * the C++ interface to ZeroMQ. The aliases and helpers in this file are the
 * only direct contact the rest of the project has with the library.
 */

#ifndef MESSAGING_SOCKETS_HH_
#define MESSAGING_SOCKETS_HH_

#include "Blob.hh"

#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Clue {
namespace Messaging {

/// \brief ZeroMQ context type
using MessageContext = zmq::context_t;

/// \brief ZeroMQ socket type
using Socket = zmq::socket_t;

/// \brief Enumeration of ZeroMQ socket types
using SocketType = zmq::socket_type;

/// \brief Socket with shared ownership
using SharedSocket = std::shared_ptr<Socket>;

/// \brief ZeroMQ message type
using Message = zmq::message_t;

/// \brief Flags of a send operation
using SendFlags = zmq::send_flags;

/// \brief Flags of a receive operation
using RecvFlags = zmq::recv_flags;

/// \brief Exception thrown by ZeroMQ
using SocketError = zmq::error_t;

/// \brief Item polled by pollSockets()
using Pollitem = zmq::pollitem_t;

/** \brief Make a ZeroMQ buffer over \p bytes
 */
inline auto messageBuffer(ByteSpan bytes)
{
    return zmq::const_buffer(bytes.data(), bytes.size());
}

/** \brief Make a socket with shared ownership
 *
 * \param args the arguments forwarded to the constructor of Socket
 */
template<typename... Args>
SharedSocket makeSharedSocket(Args&&... args)
{
    return std::make_shared<Socket>(std::forward<Args>(args)...);
}

/** \brief Bind \p socket to \p endpoint
 */
inline void bindSocket(Socket& socket, std::string_view endpoint)
{
    socket.bind(std::string {endpoint});
}

/** \brief Connect \p socket to \p endpoint
 */
inline void connectSocket(Socket& socket, std::string_view endpoint)
{
    socket.connect(std::string {endpoint});
}

/** \brief Get the type of \p socket
 */
inline SocketType getSocketType(const Socket& socket)
{
    return static_cast<SocketType>(socket.get(zmq::sockopt::type));
}

/** \brief Poll sockets
 *
 * \param pollitems contiguous range of Pollitem objects
 * \param timeout the timeout, or negative to wait indefinitely
 *
 * \return the number of items with events
 */
template<std::ranges::contiguous_range Pollitems>
auto pollSockets(
    Pollitems& pollitems,
    std::chrono::milliseconds timeout = std::chrono::milliseconds {-1})
{
    return zmq::poll(
        std::ranges::data(pollitems), std::ranges::size(pollitems), timeout);
}

/** \brief Send a message frame with a blocking send
 *
 * \param socket the socket
 * \param message Message object or buffer
 * \param more whether more frames of the same message follow
 *
 * \throw std::runtime_error if the send fails with EAGAIN
 */
template<typename MessageLike>
void sendMessage(Socket& socket, MessageLike&& message, bool more = false)
{
    const auto flags = more ? SendFlags::sndmore : SendFlags::none;
    if (!socket.send(std::forward<MessageLike>(message), flags)) {
        throw std::runtime_error {"Blocking send failed with EAGAIN"};
    }
}

/** \brief Receive a message frame with a blocking receive
 *
 * \param socket the socket
 * \param message Message object or buffer
 *
 * \return the number of bytes received
 *
 * \throw std::runtime_error if the receive fails with EAGAIN
 */
template<typename MessageLike>
auto recvMessage(Socket& socket, MessageLike&& message)
{
    const auto result = socket.recv(
        std::forward<MessageLike>(message), RecvFlags::none);
    if (!result) {
        throw std::runtime_error {"Blocking receive failed with EAGAIN"};
    }
    return *result;
}

}
}

#endif // MESSAGING_SOCKETS_HH_

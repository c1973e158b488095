/** \file
 *
 * \brief Definition of multipart messaging utilities
 *
 * The helpers in this file build on Sockets.hh and deal with whole multipart
 * messages and the envelope frames of router and dealer sockets.
 */

#ifndef MESSAGING_MESSAGEUTILITY_HH_
#define MESSAGING_MESSAGEUTILITY_HH_

#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <iterator>
#include <limits>
#include <utility>

namespace Clue {
namespace Messaging {

/** \brief Send an empty frame
 *
 * \param socket the socket
 * \param more whether more frames of the same message follow
 */
inline void sendEmptyMessage(Socket& socket, bool more = false)
{
    sendMessage(socket, zmq::const_buffer {}, more);
}

/** \brief Determine if \p socket needs an empty delimiter frame
 *
 * Router and dealer sockets exchange messages with an empty frame between
 * the envelope and the payload.
 */
inline bool needsEmptyFrame(const Socket& socket)
{
    const auto type = getSocketType(socket);
    return type == SocketType::router || type == SocketType::dealer;
}

/** \brief Send the empty delimiter frame if \p socket needs one
 *
 * A router socket also needs the routing id frame, which this function does
 * not send.
 */
inline void sendEmptyFrameIfNecessary(Socket& socket)
{
    if (needsEmptyFrame(socket)) {
        sendEmptyMessage(socket, true);
    }
}

/** \brief Receive and discard the empty delimiter frame if \p socket has one
 *
 * \return true if the message has more frames, false otherwise
 */
inline bool recvEmptyFrameIfNecessary(Socket& socket)
{
    if (needsEmptyFrame(socket)) {
        auto empty_frame = Message {};
        recvMessage(socket, empty_frame);
        return empty_frame.more();
    }
    return true;
}

/** \brief Send a range of Message objects as one multipart message
 *
 * \param socket the socket
 * \param first iterator to the first frame
 * \param last iterator one past the last frame
 * \param more whether the last frame is followed by more frames
 */
template<typename MessageIterator>
void sendMultipart(
    Socket& socket, MessageIterator first, MessageIterator last,
    bool more = false)
{
    while (first != last) {
        const auto next = std::next(first);
        sendMessage(socket, std::move(*first), more || next != last);
        first = next;
    }
}

/** \brief Receive and discard the rest of the current message
 *
 * At least one frame is received.
 *
 * \param socket the socket
 *
 * \return the number of frames discarded
 */
inline int discardMessage(Socket& socket)
{
    auto n_parts = 0;
    auto more = true;
    while (more) {
        auto frame = Message {};
        recvMessage(socket, frame);
        more = frame.more();
        ++n_parts;
    }
    return n_parts;
}

/** \brief Receive a multipart message
 *
 * Frames exceeding \p maximumParts are discarded.
 *
 * \param socket the socket
 * \param out output iterator the Message objects are written to
 * \param maximumParts the maximum number of frames written to \p out
 *
 * \return pair containing \p out after writing, and the total number of
 * frames received
 */
template<typename MessageIterator>
std::pair<MessageIterator, int> recvMultipart(
    Socket& socket, MessageIterator out,
    int maximumParts = std::numeric_limits<int>::max())
{
    auto n_parts = 0;
    auto more = true;
    while (more && n_parts < maximumParts) {
        auto frame = Message {};
        recvMessage(socket, frame);
        more = frame.more();
        *out++ = std::move(frame);
        ++n_parts;
    }
    if (more) {
        n_parts += discardMessage(socket);
    }
    return {out, n_parts};
}

/** \brief View the bytes of \p message
 */
inline ByteSpan messageView(const Message& message)
{
    return ByteSpan(
        message.data<ByteSpan::value_type>(),
        static_cast<ByteSpan::size_type>(message.size()));
}

}
}

#endif // MESSAGING_MESSAGEUTILITY_HH_

/** \file
 *
 * \brief Definition of command and event utilities
 *
 * Commands and events are multipart messages with a fixed header followed by
 * key–value frames. The values are serialized with a serialization policy.
 */

#ifndef MESSAGING_COMMANDUTILITY_HH_
#define MESSAGING_COMMANDUTILITY_HH_

#include "messaging/MessageUtility.hh"
#include "Blob.hh"

#include <iterator>
#include <utility>
#include <vector>

namespace Clue {
namespace Messaging {

/** \brief Make ZeroMQ message from the bytes of a container
 *
 * \param container a string, blob or other contiguous container of bytes
 */
template<typename Container>
Message messageFromContainer(const Container& container)
{
    const auto bytes = asBytes(container);
    return Message(bytes.data(), bytes.size());
}

/** \brief Build key–value parameter frames
 *
 * \param out the output iterator the frames are written to
 * \param serializer the serialization policy, see \ref serializationpolicy
 * \param params pairs of keys and values
 *
 * \return \p out
 */
template<
    typename OutputIterator, typename SerializationPolicy, typename... Params>
OutputIterator makeCommandParameters(
    OutputIterator out, SerializationPolicy&& serializer, Params&&... params)
{
    ( ... , (
        *out++ = messageFromContainer(params.first),
        *out++ = messageFromContainer(serializer.serialize(params.second))) );
    return out;
}

/** \brief Build command message
 *
 * The message consists of the tag frame, the command frame and the
 * key–value frames of the parameters.
 *
 * \code{.cc}
 * auto frames = std::vector<Messaging::Message> {};
 * makeCommandMessage(
 *     std::back_inserter(frames), JsonSerializer {},
 *     "tag"s, "move"s, std::pair {"location"s, "hall"s});
 * \endcode
 *
 * \param out the output iterator the frames are written to
 * \param serializer the serialization policy, see \ref serializationpolicy
 * \param tag the content of the tag frame
 * \param command the content of the command frame
 * \param params pairs of keys and values
 *
 * \return \p out
 */
template<
    typename OutputIterator, typename SerializationPolicy, typename String,
    typename... Params>
OutputIterator makeCommandMessage(
    OutputIterator out, SerializationPolicy&& serializer, const String& tag,
    const String& command, Params&&... params)
{
    *out++ = messageFromContainer(tag);
    *out++ = messageFromContainer(command);
    return makeCommandParameters(
        std::move(out), std::forward<SerializationPolicy>(serializer),
        std::forward<Params>(params)...);
}

/** \brief Send command message
 *
 * The message is built as in makeCommandMessage(), and prefixed with the
 * empty delimiter frame if \p socket is a dealer or a router.
 */
template<typename SerializationPolicy, typename String, typename... Params>
void sendCommandMessage(
    Socket& socket, SerializationPolicy&& serializer, const String& tag,
    const String& command, Params&&... params)
{
    auto frames = std::vector<Message> {};
    makeCommandMessage(
        std::back_inserter(frames),
        std::forward<SerializationPolicy>(serializer), tag, command,
        std::forward<Params>(params)...);
    sendEmptyFrameIfNecessary(socket);
    sendMultipart(socket, frames.begin(), frames.end());
}

/** \brief Build event message
 *
 * The message consists of the event frame and the key–value frames of the
 * parameters.
 *
 * \param out the output iterator the frames are written to
 * \param serializer the serialization policy, see \ref serializationpolicy
 * \param event the content of the event frame
 * \param params pairs of keys and values
 *
 * \return \p out
 */
template<
    typename OutputIterator, typename SerializationPolicy, typename String,
    typename... Params>
OutputIterator makeEventMessage(
    OutputIterator out, SerializationPolicy&& serializer, const String& event,
    Params&&... params)
{
    *out++ = messageFromContainer(event);
    return makeCommandParameters(
        std::move(out), std::forward<SerializationPolicy>(serializer),
        std::forward<Params>(params)...);
}

/** \brief Send event message
 *
 * The message is built as in makeEventMessage().
 */
template<typename SerializationPolicy, typename String, typename... Params>
void sendEventMessage(
    Socket& socket, SerializationPolicy&& serializer, const String& event,
    Params&&... params)
{
    auto frames = std::vector<Message> {};
    makeEventMessage(
        std::back_inserter(frames),
        std::forward<SerializationPolicy>(serializer), event,
        std::forward<Params>(params)...);
    sendEmptyFrameIfNecessary(socket);
    sendMultipart(socket, frames.begin(), frames.end());
}

}
}

#endif // MESSAGING_COMMANDUTILITY_HH_

/** \file
 *
 * \brief Definition of Clue::Messaging::MessageHandler interface
 */

#ifndef MESSAGING_MESSAGEHANDLER_HH_
#define MESSAGING_MESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "Blob.hh"

#include <boost/iterator/transform_iterator.hpp>

#include <vector>

namespace Clue {
namespace Messaging {

/** \brief MessageHandler response collector
 *
 * Response is the interface a MessageHandler uses to communicate the reply to
 * its driver. A reply consists of a status frame and zero or more additional
 * frames.
 */
class Response {
public:

    virtual ~Response();

    /** \brief Set the status of the response
     *
     * \param status the status
     */
    void setStatus(ByteSpan status);

    /** \brief Add another frame to the response
     *
     * \param frame the next frame
     */
    void addFrame(ByteSpan frame);

private:

    /** \brief Handle for setStatus()
     */
    virtual void handleSetStatus(ByteSpan status) = 0;

    /** \brief Handle for addFrame()
     */
    virtual void handleAddFrame(ByteSpan frame) = 0;
};

/** \brief Interface for handling messages
 *
 * MessageHandler is the interface a driver (MessageQueue object) uses to
 * handle a command sent by a client. The driver provides the identity of the
 * sender and the argument frames of the command, and the handler uses the
 * Response object to reply.
 */
class MessageHandler {
public:

    virtual ~MessageHandler();

    /** \brief Handle message
     *
     * \tparam ParameterIterator input iterator to the arguments of the
     * message. Each argument is a contiguous sequence of bytes.
     *
     * \param identity the identity of the sender of the message
     * \param first iterator to the first argument
     * \param last iterator one past the last argument
     * \param response the response object used to reply
     */
    template<typename ParameterIterator>
    void handle(
        const Identity& identity, ParameterIterator first,
        ParameterIterator last, Response& response);

protected:

    /** \brief Input parameter to doHandle()
     */
    using ParameterVector = std::vector<ByteSpan>;

private:

    /** \brief Handle action of this handler
     *
     * \param identity the identity of the sender of the message
     * \param params the arguments of the message
     * \param response the response object
     *
     * \sa handle()
     */
    virtual void doHandle(
        const Identity& identity, const ParameterVector& params,
        Response& response) = 0;
};

template<typename ParameterIterator>
void MessageHandler::handle(
    const Identity& identity, ParameterIterator first,
    ParameterIterator last, Response& response)
{
    const auto to_bytes = [](const auto& p) { return asBytes(p); };
    doHandle(
        identity,
        ParameterVector(
            boost::make_transform_iterator(first, to_bytes),
            boost::make_transform_iterator(last, to_bytes)),
        response);
}

}
}

#endif // MESSAGING_MESSAGEHANDLER_HH_

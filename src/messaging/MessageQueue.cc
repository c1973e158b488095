#include "messaging/MessageQueue.hh"

#include "messaging/Identity.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/Replies.hh"
#include "Logging.hh"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace Clue {
namespace Messaging {

class MessageQueue::BasicResponse : public Response {
public:
    BasicResponse(MessageVector& inputFrames, std::ptrdiff_t nPrefix);
    void sendResponse(Socket& socket);
private:
    void handleSetStatus(ByteSpan status) override;
    void handleAddFrame(ByteSpan frame) override;
    std::ptrdiff_t nStatusFrame;
    MessageVector frames;
};

MessageQueue::BasicResponse::BasicResponse(
    MessageVector& inputFrames, const std::ptrdiff_t nPrefix) :
    // the status frame follows the prefix echoed back to the sender
    nStatusFrame {nPrefix},
    frames(static_cast<std::size_t>(nPrefix + 1))
{
    for (auto n = std::ptrdiff_t {}; n < nPrefix; ++n) {
        frames[n].move(inputFrames[n]);
    }
    frames[nStatusFrame].rebuild(
        REPLY_FAILURE.data(), REPLY_FAILURE.size());
}

void MessageQueue::BasicResponse::sendResponse(Socket& socket)
{
    sendMultipart(socket, frames.begin(), frames.end());
}

void MessageQueue::BasicResponse::handleSetStatus(ByteSpan status)
{
    frames[nStatusFrame].rebuild(status.data(), status.size());
}

void MessageQueue::BasicResponse::handleAddFrame(ByteSpan frame)
{
    frames.emplace_back(frame.data(), frame.size());
}

MessageQueue::MessageQueue() = default;

MessageQueue::MessageQueue(
    std::initializer_list<
        std::pair<ByteSpan, std::shared_ptr<MessageHandler>>> handlers)
{
    for (auto&& [command, handler] : handlers) {
        trySetHandler(command, handler);
    }
}

MessageQueue::~MessageQueue() = default;

bool MessageQueue::trySetHandler(
    const ByteSpan command, std::shared_ptr<MessageHandler> handler)
{
    return handlers.emplace(
        Blob(command.begin(), command.end()), std::move(handler)).second;
}

void MessageQueue::operator()(Socket& socket)
{
    auto input_frames = MessageVector {};
    recvMultipart(socket, std::back_inserter(input_frames));

    auto* identity_msg = static_cast<Message*>(nullptr);
    auto payload_frame_iter = input_frames.begin();
    if (getSocketType(socket) == SocketType::router) {
        payload_frame_iter = std::find_if(
            payload_frame_iter, input_frames.end(),
            [](const auto& message) { return message.size() == 0u; });
        // drop messages without routing id or delimiter
        if (payload_frame_iter == input_frames.begin() ||
            payload_frame_iter == input_frames.end()) {
            log(LogLevel::WARNING, "Dropping message without envelope");
            return;
        }
        identity_msg = &payload_frame_iter[-1];
        ++payload_frame_iter;
    }

    // tag and command
    if (input_frames.end() - payload_frame_iter < 2) {
        log(LogLevel::WARNING, "Dropping message without tag or command");
        return;
    }

    const auto identity = identityFromMessage(
        payload_frame_iter[1], identity_msg);
    const auto command = messageView(payload_frame_iter[1]);
    const auto n_prefix = payload_frame_iter - input_frames.begin() + 1;
    const auto first_arg = payload_frame_iter + 2;
    auto response = BasicResponse(input_frames, n_prefix);
    const auto handler_iter = handlers.find(command);
    if (handler_iter != handlers.end()) {
        log(LogLevel::DEBUG, "Handling command %s from %s",
            blobToString(command), identity);
        try {
            handler_iter->second->handle(
                identity, first_arg, input_frames.end(), response);
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, "Error while handling command %s: %s",
                blobToString(command), e.what());
            response.setStatus(REPLY_FAILURE);
        }
    } else {
        log(LogLevel::DEBUG, "Unrecognized command %s from %s",
            blobToString(command), identity);
    }
    response.sendResponse(socket);
}

}
}

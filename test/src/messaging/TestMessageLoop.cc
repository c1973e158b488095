#include "messaging/MessageLoop.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/Sockets.hh"
#include "Blob.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <csignal>
#include <cstddef>
#include <stdexcept>
#include <string_view>

using namespace Clue::BlobLiterals;
using namespace Clue::Messaging;
using namespace std::string_view_literals;

using testing::_;
using testing::Invoke;
using testing::Ref;

namespace {

constexpr auto N_SOCKETS = std::size_t {2};
const auto DEFAULT_MSG = "default"_BS;
const auto OTHER_MSG = "other"_BS;
constexpr auto ENDPOINTS = std::array {
    "inproc://endpoint1"sv,
    "inproc://endpoint2"sv,
};

class MockSocketCallback {
public:
    MOCK_METHOD1(call, void(Socket&));
};

}

class MessageLoopTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        for (auto n = std::size_t {}; n < N_SOCKETS; ++n) {
            ON_CALL(callbacks[n], call(_)).WillByDefault(
                Invoke(
                    [](auto& socket)
                    {
                        auto msg = Message {};
                        recvMessage(socket, msg);
                        EXPECT_EQ(DEFAULT_MSG, messageView(msg));
                        EXPECT_FALSE(msg.more());
                        std::raise(SIGTERM);
                    }));
            bindSocket(*backSockets[n], ENDPOINTS[n]);
            connectSocket(frontSockets[n], ENDPOINTS[n]);
            loop.addPollable(
                backSockets[n],
                [&callback = callbacks[n]](auto& socket)
                {
                    callback.call(socket);
                });
        }
    }

    MessageContext context;
    std::array<Socket, N_SOCKETS> frontSockets {
        Socket {context, SocketType::dealer},
        Socket {context, SocketType::dealer},
    };
    std::array<SharedSocket, N_SOCKETS> backSockets {
        makeSharedSocket(context, SocketType::dealer),
        makeSharedSocket(context, SocketType::dealer),
    };
    std::array<testing::StrictMock<MockSocketCallback>, N_SOCKETS> callbacks;
    MessageLoop loop;
};

TEST_F(MessageLoopTest, testSingleMessage)
{
    EXPECT_CALL(callbacks[0], call(Ref(*backSockets[0])));
    sendMessage(frontSockets[0], messageBuffer(DEFAULT_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testMultipleMessages)
{
    EXPECT_CALL(callbacks[0], call(Ref(*backSockets[0])))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    auto msg = Message {};
                    recvMessage(socket, msg);
                    EXPECT_EQ(OTHER_MSG, messageView(msg));
                    sendMessage(frontSockets[1], messageBuffer(DEFAULT_MSG));
                }));
    EXPECT_CALL(callbacks[1], call(Ref(*backSockets[1])));
    sendMessage(frontSockets[0], messageBuffer(OTHER_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testTerminateFromCallback)
{
    EXPECT_CALL(callbacks[0], call(Ref(*backSockets[0])))
        .WillOnce(
            Invoke(
                [this](auto& socket)
                {
                    auto msg = Message {};
                    recvMessage(socket, msg);
                    loop.terminate();
                }));
    sendMessage(frontSockets[0], messageBuffer(DEFAULT_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testExceptionInCallbackDoesNotStopLoop)
{
    {
        testing::InSequence guard;
        EXPECT_CALL(callbacks[0], call(Ref(*backSockets[0])))
            .WillOnce(
                Invoke(
                    [this](auto& socket)
                    {
                        auto msg = Message {};
                        recvMessage(socket, msg);
                        sendMessage(
                            frontSockets[1], messageBuffer(DEFAULT_MSG));
                        throw std::runtime_error {"callback failed"};
                    }));
        EXPECT_CALL(callbacks[1], call(Ref(*backSockets[1])));
    }
    sendMessage(frontSockets[0], messageBuffer(OTHER_MSG));
    loop.run();
}

TEST_F(MessageLoopTest, testRemove)
{
    loop.removePollable(*backSockets[0]);
    sendMessage(frontSockets[0], messageBuffer(DEFAULT_MSG));
    sendMessage(frontSockets[1], messageBuffer(DEFAULT_MSG));
    EXPECT_CALL(callbacks[0], call(_)).Times(0);
    EXPECT_CALL(callbacks[1], call(Ref(*backSockets[1])));
    loop.run();
}

TEST_F(MessageLoopTest, testAddPollableTwice)
{
    EXPECT_THROW(
        loop.addPollable(backSockets[0], [](auto&) {}),
        std::invalid_argument);
}

TEST_F(MessageLoopTest, testAddNullSocket)
{
    EXPECT_THROW(
        loop.addPollable(nullptr, [](auto&) {}), std::invalid_argument);
}

TEST_F(MessageLoopTest, testAddNullCallback)
{
    auto socket = makeSharedSocket(context, SocketType::pair);
    EXPECT_THROW(loop.addPollable(socket, nullptr), std::invalid_argument);
}

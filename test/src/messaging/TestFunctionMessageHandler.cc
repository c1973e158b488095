#include "messaging/CardJsonSerializer.hh"
#include "messaging/FunctionMessageHandler.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/LocationJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"
#include "MockMessageHandler.hh"

#include <boost/uuid/string_generator.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

using Clue::Location;
using Clue::Room;
using Clue::Suspect;
using Clue::Uuid;
using namespace Clue::Messaging;

using testing::Bool;
using testing::Return;

namespace Clue {
namespace Messaging {

std::ostream& operator<<(std::ostream& os, const ReplyFailure&)
{
    return os << "reply failure";
}

template<typename... Ts>
std::ostream& operator<<(std::ostream& os, const ReplySuccess<Ts...>&)
{
    return os << "reply success";
}

}
}

namespace {

using namespace std::string_literals;
using namespace Clue::BlobLiterals;
const auto CLIENT = Identity { "alice"s, "alice-connection"_B };
const auto GAME_UUID = boost::uuids::string_generator {}(
    "9c3fc66b-ab10-4006-8c15-3b4f7eb04846");
const auto GAME = R"("9c3fc66b-ab10-4006-8c15-3b4f7eb04846")"s;
const auto GAME_KEY = "game"s;
const auto LOCATION_KEY = "location"s;
const auto CHARACTER_KEY = "character"s;
const auto HOST_KEY = "host"s;

Reply<> makeReply(const bool successful)
{
    if (successful) {
        return success();
    }
    return failure();
}

Reply<Suspect> replyCharacter(const Identity&)
{
    return success(Suspect::MR_GREEN);
}

Reply<Uuid, Suspect> replyGameAndCharacter(const Identity&)
{
    return success(GAME_UUID, Suspect::MRS_WHITE);
}

Reply<std::optional<Uuid>> replyNoHost(const Identity&)
{
    return success(std::optional<Uuid> {});
}

Reply<> replyUnknownGame(const Identity&)
{
    return failure(":UNK"_B);
}

class MockCommands {
public:
    MOCK_METHOD1(hello, Reply<>(Identity));
    MOCK_METHOD2(inspect, Reply<>(Identity, Uuid));
    MOCK_METHOD3(move, Reply<>(Identity, Uuid, Location));
    MOCK_METHOD3(join, Reply<>(Identity, Uuid, std::optional<Suspect>));
};

}

class FunctionMessageHandlerTest : public testing::TestWithParam<bool> {
protected:
    void testHelper(
        MessageHandler& handler,
        const std::vector<std::string> params,
        const Clue::ByteSpan expectedStatus,
        const std::vector<std::string> expectedOutput = {})
    {
        EXPECT_CALL(response, handleSetStatus(expectedStatus));
        {
            testing::InSequence guard;
            for (const auto& output : expectedOutput) {
                EXPECT_CALL(response, handleAddFrame(Clue::asBytes(output)));
            }
        }
        handler.handle(CLIENT, params.begin(), params.end(), response);
    }

    auto makeMoveHandler()
    {
        return makeMessageHandler<Uuid, Location>(
            [this](const auto& identity, Uuid game, Location location)
            {
                return commands.move(identity, game, location);
            }, JsonSerializer {}, std::tuple {GAME_KEY, LOCATION_KEY});
    }

    auto makeJoinHandler()
    {
        return makeMessageHandler<Uuid, std::optional<Suspect>>(
            [this](
                const auto& identity, Uuid game,
                std::optional<Suspect> character)
            {
                return commands.join(identity, game, character);
            }, JsonSerializer {}, std::tuple {GAME_KEY, CHARACTER_KEY});
    }

    testing::StrictMock<MockResponse> response;
    testing::StrictMock<MockCommands> commands;
};

TEST_P(FunctionMessageHandlerTest, testCommandWithoutArguments)
{
    const auto success = GetParam();
    auto handler = makeMessageHandler(
        [this](const auto& identity)
        {
            return commands.hello(identity);
        }, JsonSerializer {});
    EXPECT_CALL(commands, hello(CLIENT)).WillOnce(Return(makeReply(success)));
    testHelper(*handler, {}, success ? REPLY_SUCCESS : REPLY_FAILURE);
}

TEST_P(FunctionMessageHandlerTest, testCommandWithGame)
{
    const auto success = GetParam();
    auto handler = makeMessageHandler<Uuid>(
        [this](const auto& identity, Uuid game)
        {
            return commands.inspect(identity, game);
        }, JsonSerializer {}, std::tuple {GAME_KEY});
    EXPECT_CALL(commands, inspect(CLIENT, GAME_UUID))
        .WillOnce(Return(makeReply(success)));
    testHelper(
        *handler, {GAME_KEY, GAME}, success ? REPLY_SUCCESS : REPLY_FAILURE);
}

TEST_P(FunctionMessageHandlerTest, testMoveArgumentsInAnyOrder)
{
    const auto success = GetParam();
    auto handler = makeMoveHandler();
    EXPECT_CALL(
        commands, move(CLIENT, GAME_UUID, Location {Clue::Hallway::HALLWAY1}))
        .WillOnce(Return(makeReply(success)));
    testHelper(
        *handler, {LOCATION_KEY, R"("hallway1")", GAME_KEY, GAME},
        success ? REPLY_SUCCESS : REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testUnknownLocation)
{
    auto handler = makeMoveHandler();
    testHelper(
        *handler, {GAME_KEY, GAME, LOCATION_KEY, R"("attic")"},
        REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testMalformedGame)
{
    auto handler = makeMoveHandler();
    testHelper(
        *handler, {GAME_KEY, "9c3fc66b", LOCATION_KEY, R"("study")"},
        REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testMissingLocation)
{
    auto handler = makeMoveHandler();
    testHelper(*handler, {GAME_KEY, GAME}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testUnrelatedArgumentsAreIgnored)
{
    auto handler = makeMoveHandler();
    EXPECT_CALL(commands, move(CLIENT, GAME_UUID, Location {Room::STUDY}))
        .WillOnce(Return(makeReply(true)));
    testHelper(
        *handler,
        {GAME_KEY, GAME, CHARACTER_KEY, R"("mr_green")",
         LOCATION_KEY, R"("study")"},
        REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testArgumentWithoutValue)
{
    auto handler = makeMoveHandler();
    testHelper(*handler, {GAME_KEY, GAME, LOCATION_KEY}, REPLY_FAILURE);
}

TEST_F(FunctionMessageHandlerTest, testJoinWithCharacter)
{
    auto handler = makeJoinHandler();
    EXPECT_CALL(
        commands,
        join(CLIENT, GAME_UUID, std::make_optional(Suspect::MRS_PEACOCK)))
        .WillOnce(Return(makeReply(true)));
    testHelper(
        *handler, {GAME_KEY, GAME, CHARACTER_KEY, R"("mrs_peacock")"},
        REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testJoinWithoutCharacter)
{
    auto handler = makeJoinHandler();
    EXPECT_CALL(commands, join(CLIENT, GAME_UUID, std::optional<Suspect> {}))
        .WillOnce(Return(makeReply(true)));
    testHelper(*handler, {GAME_KEY, GAME}, REPLY_SUCCESS);
}

TEST_F(FunctionMessageHandlerTest, testReplyWithCharacter)
{
    auto handler = makeMessageHandler(
        &replyCharacter, JsonSerializer {},
        std::tuple {}, std::tuple {CHARACTER_KEY});
    testHelper(
        *handler, {}, REPLY_SUCCESS, {CHARACTER_KEY, R"("mr_green")"});
}

TEST_F(FunctionMessageHandlerTest, testReplyWithGameAndCharacter)
{
    auto handler = makeMessageHandler(
        &replyGameAndCharacter, JsonSerializer {},
        std::tuple {}, std::tuple {GAME_KEY, CHARACTER_KEY});
    testHelper(
        *handler, {}, REPLY_SUCCESS,
        {GAME_KEY, GAME, CHARACTER_KEY, R"("mrs_white")"});
}

TEST_F(FunctionMessageHandlerTest, testReplyWithoutHost)
{
    auto handler = makeMessageHandler(
        &replyNoHost, JsonSerializer {}, std::tuple {}, std::tuple {HOST_KEY});
    testHelper(*handler, {}, REPLY_SUCCESS, {});
}

TEST_F(FunctionMessageHandlerTest, testFailureWithSuffix)
{
    auto handler = makeMessageHandler(&replyUnknownGame, JsonSerializer {});
    testHelper(*handler, {}, "ERR:UNK"_BS);
}

INSTANTIATE_TEST_SUITE_P(
    SuccessFailure, FunctionMessageHandlerTest, Bool());

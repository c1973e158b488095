#include "engine/GameSession.hh"
#include "engine/SessionStateHelper.hh"
#include "main/ClueGame.hh"
#include "main/Commands.hh"
#include "messaging/MessageHelper.hh"
#include "messaging/MessageUtility.hh"
#include "messaging/PollingCallbackScheduler.hh"
#include "messaging/Sockets.hh"

#include <boost/uuid/uuid_io.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using Clue::Engine::GameSession;
using Clue::Engine::PLAYERS;
using Clue::Messaging::PollingCallbackScheduler;
using Clue::Messaging::Socket;
using Clue::Suspect;

using testing::_;

using namespace std::chrono_literals;
using namespace std::string_literals;
using namespace Clue::Main;

namespace {

const auto GAME_UUID = Clue::Engine::OUTSIDER;
const auto ENDPOINT = "inproc://testing-cluegame"s;

std::string quoted(const Clue::Uuid& uuid)
{
    return '"' + boost::uuids::to_string(uuid) + '"';
}

std::string eventFrame(const std::string& command)
{
    return boost::uuids::to_string(GAME_UUID) + ':' + command;
}

}

class ClueGameTest : public testing::Test {
protected:
    ClueGameTest(const GameSession::Options& options = {}) :
        session {std::make_shared<GameSession>(GAME_UUID, options)}
    {
        subscriber.set(zmq::sockopt::rcvtimeo, 1000);
        callbackScheduler->getSocket()->set(zmq::sockopt::rcvtimeo, 1000);
    }

    // Block until the next scheduled callback is due, then execute it
    void runNextCallback()
    {
        auto socket = callbackScheduler->getSocket();
        (*callbackScheduler)(*socket);
    }

    std::vector<std::string> recvEvent()
    {
        auto frames = std::vector<Clue::Messaging::Message> {};
        Clue::Messaging::recvMultipart(
            subscriber, std::back_inserter(frames));
        auto ret = std::vector<std::string> {};
        for (const auto& frame : frames) {
            ret.push_back(frame.to_string());
        }
        return ret;
    }

    std::vector<std::string> recvUntil(const std::string& command)
    {
        const auto expected = eventFrame(command);
        while (true) {
            auto frames = recvEvent();
            if (!frames.empty() && frames.front() == expected) {
                return frames;
            }
        }
    }

    void startGame()
    {
        for (const auto n : { 0, 1, 2 }) {
            ASSERT_TRUE(session->join(PLAYERS[n], Clue::SUSPECTS[n]));
        }
        ASSERT_TRUE(session->startGame(PLAYERS[0]));
    }

    void makeContestedSuggestion()
    {
        const auto suggestion = Clue::Engine::findContestedSuggestion(
            session->getSnapshot());
        for (const auto& location :
                 Clue::Engine::ROUTES.at(suggestion.room)) {
            ASSERT_TRUE(session->move(PLAYERS[0], location));
        }
        ASSERT_TRUE(
            session->suggest(
                PLAYERS[0], suggestion.suspect, suggestion.weapon));
    }

    Clue::Messaging::MessageContext context;
    std::pair<Socket, Socket> sockets {
        Clue::Messaging::createSocketPair(context, ENDPOINT)};
    Clue::Messaging::SharedSocket eventSocket {
        std::make_shared<Socket>(std::move(sockets.first))};
    Socket& subscriber {sockets.second};
    std::shared_ptr<PollingCallbackScheduler> callbackScheduler {
        std::make_shared<PollingCallbackScheduler>(context)};
    std::shared_ptr<GameSession> session;
    ClueGame game {session, eventSocket, callbackScheduler};
};

TEST_F(ClueGameTest, testUuid)
{
    EXPECT_EQ(GAME_UUID, game.getUuid());
    EXPECT_EQ(session.get(), &game.getSession());
}

TEST_F(ClueGameTest, testJoinIsPublished)
{
    ASSERT_TRUE(session->join(PLAYERS[0], Suspect::MR_GREEN));
    EXPECT_THAT(
        recvEvent(),
        testing::ElementsAre(
            eventFrame(JOIN_COMMAND), PLAYER_COMMAND, quoted(PLAYERS[0]),
            CHARACTER_COMMAND, "\"mr_green\"", COUNTER_COMMAND, "1"));
    const auto update = recvEvent();
    ASSERT_EQ(5u, update.size());
    EXPECT_EQ(eventFrame(UPDATE_COMMAND), update[0]);
    EXPECT_EQ(PUBSTATE_COMMAND, update[1]);
    EXPECT_EQ(COUNTER_COMMAND, update[3]);
    EXPECT_EQ("2", update[4]);
    EXPECT_EQ(2u, game.getCounter());
}

TEST_F(ClueGameTest, testHistoryExcludesUpdates)
{
    for (const auto n : { 0, 1 }) {
        ASSERT_TRUE(session->join(PLAYERS[n], Clue::SUSPECTS[n]));
    }
    const auto state = game.getState(
        PLAYERS[0], std::vector {HISTORY_COMMAND});
    const auto& history = state.at(HISTORY_COMMAND);
    ASSERT_EQ(2u, history.size());
    EXPECT_EQ(JOIN_COMMAND, history[0].at(EVENT_COMMAND));
    EXPECT_EQ(1, history[0].at(COUNTER_COMMAND));
    EXPECT_EQ(
        boost::uuids::to_string(PLAYERS[1]), history[1].at(PLAYER_COMMAND));
    EXPECT_EQ(3, history[1].at(COUNTER_COMMAND));
}

TEST_F(ClueGameTest, testGetStateAllKeys)
{
    ASSERT_TRUE(session->join(PLAYERS[0], Suspect::MR_GREEN));
    const auto state = game.getState(PLAYERS[0], std::nullopt);
    EXPECT_TRUE(state.contains(PUBSTATE_COMMAND));
    EXPECT_TRUE(state.contains(PRIVSTATE_COMMAND));
    EXPECT_TRUE(state.contains(SELF_COMMAND));
    EXPECT_TRUE(state.contains(HISTORY_COMMAND));
}

TEST_F(ClueGameTest, testGetStateSelectedKeys)
{
    const auto state = game.getState(
        PLAYERS[0], std::vector {SELF_COMMAND, "unknown"s});
    EXPECT_EQ(1u, state.size());
    EXPECT_TRUE(state.contains(SELF_COMMAND));
}

TEST_F(ClueGameTest, testStartIsPublished)
{
    startGame();
    const auto start = recvUntil(START_COMMAND);
    ASSERT_EQ(5u, start.size());
    EXPECT_EQ(PLAYERS_COMMAND, start[1]);
    const auto turn = recvUntil(TURN_COMMAND);
    ASSERT_EQ(5u, turn.size());
    EXPECT_EQ(quoted(PLAYERS[0]), turn[2]);
}

TEST_F(ClueGameTest, testWinPublishesCaseFile)
{
    startGame();
    const auto case_file = *session->getSnapshot().caseFile;
    ASSERT_TRUE(session->accuse(PLAYERS[0], case_file));
    const auto accuse = recvUntil(ACCUSE_COMMAND);
    ASSERT_EQ(7u, accuse.size());
    EXPECT_EQ("\"win\"", accuse[4]);
    const auto end = recvUntil(END_COMMAND);
    ASSERT_EQ(11u, end.size());
    EXPECT_EQ(quoted(PLAYERS[0]), end[2]);
    EXPECT_EQ(SUSPECT_COMMAND, end[3]);
    EXPECT_EQ(WEAPON_COMMAND, end[5]);
    EXPECT_EQ(ROOM_COMMAND, end[7]);
}

class ClueGameWithTimeoutTest : public ClueGameTest {
protected:
    ClueGameWithTimeoutTest() :
        ClueGameTest {GameSession::Options {200ms, false}}
    {
    }
};

TEST_F(ClueGameWithTimeoutTest, testDisproveRequestExpires)
{
    startGame();
    const auto tick = std::chrono::steady_clock::now();
    makeContestedSuggestion();
    const auto disprove = recvUntil(DISPROVE_COMMAND);
    ASSERT_EQ(7u, disprove.size());
    EXPECT_EQ(quoted(PLAYERS[0]), disprove[2]);
    EXPECT_EQ(DISPROVER_COMMAND, disprove[3]);

    runNextCallback();
    EXPECT_GE(std::chrono::steady_clock::now() - tick, 200ms);
    // The revealed card is never published
    EXPECT_THAT(
        recvUntil(SUGGESTION_END_COMMAND),
        testing::ElementsAre(
            eventFrame(SUGGESTION_END_COMMAND), PLAYER_COMMAND,
            quoted(PLAYERS[0]), COUNTER_COMMAND, _));
    const auto state = session->getSnapshot();
    EXPECT_FALSE(state.pendingDisprove);
    EXPECT_TRUE(
        std::holds_alternative<Clue::Engine::CardRevealed>(
            state.lastOutcomes.at(PLAYERS[0])));
}

TEST_F(ClueGameWithTimeoutTest, testExpiringAnsweredRequestIsHarmless)
{
    startGame();
    makeContestedSuggestion();
    const auto pending = *session->getSnapshot().pendingDisprove;
    ASSERT_TRUE(
        session->disprove(
            PLAYERS[pending.disprover], pending.matchingCards.back()));
    recvUntil(SUGGESTION_END_COMMAND);

    runNextCallback();
    const auto expected = Clue::Engine::SuggestionOutcome {
        Clue::Engine::CardRevealed {
            PLAYERS[pending.disprover], pending.matchingCards.back()}};
    EXPECT_EQ(expected, session->getSnapshot().lastOutcomes.at(PLAYERS[0]));

    // Nothing is published between the answer and the next turn
    ASSERT_TRUE(session->endTurn(PLAYERS[0]));
    EXPECT_EQ(eventFrame(UPDATE_COMMAND), recvEvent().front());
    EXPECT_EQ(eventFrame(TURN_COMMAND), recvEvent().front());
}

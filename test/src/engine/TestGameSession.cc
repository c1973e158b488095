#include "engine/GameSession.hh"
#include "engine/SessionStateHelper.hh"
#include "engine/MockSessionObserver.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

using Clue::Engine::AccusationOutcome;
using Clue::Engine::AwaitingDisprove;
using Clue::Engine::CardRevealed;
using Clue::Engine::GameSession;
using Clue::Engine::MockSessionObserver;
using Clue::Engine::NoRefute;
using Clue::Engine::PLAYERS;
using Clue::Engine::SessionError;
using Clue::Engine::SessionState;
using Clue::Engine::SessionStatus;
using Clue::Engine::SuggestionOutcome;
using Clue::CaseFile;
using Clue::Location;
using Clue::Room;
using Clue::Suspect;

using testing::_;
using testing::Field;
using testing::NiceMock;

using namespace std::chrono_literals;

namespace {
const auto SESSION_UUID = Clue::Engine::OUTSIDER;
}

class GameSessionTest : public testing::Test {
protected:
    GameSessionTest(const GameSession::Options& options = {}) :
        session {SESSION_UUID, options}
    {
        subscribeToAll(session, observer);
    }

    void joinPlayers()
    {
        for (const auto n : { 0, 1, 2 }) {
            ASSERT_TRUE(session.join(PLAYERS[n], Clue::SUSPECTS[n]));
        }
    }

    void startGame()
    {
        joinPlayers();
        ASSERT_TRUE(session.startGame(PLAYERS[0]));
    }

    void walkTo(const Room room)
    {
        for (const auto& location : Clue::Engine::ROUTES.at(room)) {
            ASSERT_TRUE(session.move(PLAYERS[0], location));
        }
    }

    std::shared_ptr<NiceMock<MockSessionObserver>> observer {
        std::make_shared<NiceMock<MockSessionObserver>>()};
    GameSession session;
};

TEST_F(GameSessionTest, testUuid)
{
    EXPECT_EQ(SESSION_UUID, session.getUuid());
    EXPECT_EQ(SESSION_UUID, session.getSnapshot().uuid);
    EXPECT_FALSE(session.isAborted());
}

TEST_F(GameSessionTest, testJoin)
{
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handlePlayerJoined(
            testing::AllOf(
                Field(&GameSession::PlayerJoined::player, PLAYERS[0]),
                Field(
                    &GameSession::PlayerJoined::character,
                    Suspect::MR_GREEN),
                Field(&GameSession::PlayerJoined::reconnected, false))));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    const auto result = session.join(PLAYERS[0], Suspect::MR_GREEN);
    ASSERT_TRUE(result);
    EXPECT_EQ(PLAYERS[0], result->uuid);
    EXPECT_EQ(Suspect::MR_GREEN, result->character);
}

TEST_F(GameSessionTest, testFailedJoinDoesNotNotify)
{
    ASSERT_TRUE(session.join(PLAYERS[0], Suspect::MR_GREEN));
    EXPECT_CALL(*observer, handlePlayerJoined(_)).Times(0);
    EXPECT_CALL(*observer, handleStateUpdated(_)).Times(0);
    const auto result = session.join(PLAYERS[1], Suspect::MR_GREEN);
    EXPECT_EQ(SessionError::CHARACTER_TAKEN, result.getError());
}

TEST_F(GameSessionTest, testObserversAreNotifiedInSubscriptionOrder)
{
    const auto secondObserver =
        std::make_shared<NiceMock<MockSessionObserver>>();
    session.subscribeToPlayerJoined(secondObserver);
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handlePlayerJoined(
            Field(&GameSession::PlayerJoined::player, PLAYERS[0])));
    EXPECT_CALL(
        *secondObserver,
        handlePlayerJoined(
            Field(&GameSession::PlayerJoined::player, PLAYERS[0])));
    EXPECT_TRUE(session.join(PLAYERS[0], Suspect::MISS_SCARLET));
}

TEST_F(GameSessionTest, testExpiredObserverIsSkipped)
{
    auto secondObserver = std::make_shared<NiceMock<MockSessionObserver>>();
    subscribeToAll(session, secondObserver);
    secondObserver.reset();
    EXPECT_CALL(*observer, handlePlayerJoined(_)).Times(3);
    EXPECT_CALL(*observer, handleGameStarted(_));
    joinPlayers();
    EXPECT_TRUE(session.startGame(PLAYERS[0]));
}

TEST_F(GameSessionTest, testReconnect)
{
    joinPlayers();
    ASSERT_TRUE(session.leave(PLAYERS[1]));
    EXPECT_CALL(
        *observer,
        handlePlayerJoined(
            testing::AllOf(
                Field(&GameSession::PlayerJoined::player, PLAYERS[1]),
                Field(&GameSession::PlayerJoined::reconnected, true))));
    EXPECT_TRUE(session.join(PLAYERS[1]));
}

TEST_F(GameSessionTest, testHostLeaving)
{
    joinPlayers();
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handlePlayerLeft(Field(&GameSession::PlayerLeft::player, PLAYERS[0])));
    EXPECT_CALL(
        *observer,
        handleHostChanged(Field(&GameSession::HostChanged::host, PLAYERS[1])));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    EXPECT_TRUE(session.leave(PLAYERS[0]));
}

TEST_F(GameSessionTest, testStartGame)
{
    joinPlayers();
    testing::InSequence seq;
    EXPECT_CALL(*observer, handleGameStarted(_));
    EXPECT_CALL(
        *observer,
        handleTurnStarted(
            Field(&GameSession::TurnStarted::player, PLAYERS[0])));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    ASSERT_TRUE(session.startGame(PLAYERS[0]));
    EXPECT_EQ(SessionStatus::IN_PROGRESS, session.getSnapshot().status);
}

TEST_F(GameSessionTest, testMove)
{
    startGame();
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handlePlayerMoved(
            testing::AllOf(
                Field(&GameSession::PlayerMoved::player, PLAYERS[0]),
                Field(
                    &GameSession::PlayerMoved::location,
                    Location {Room::LOUNGE}))));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    EXPECT_TRUE(session.move(PLAYERS[0], Room::LOUNGE));
}

TEST_F(GameSessionTest, testMoveInLobbyIsRejectedByDefault)
{
    joinPlayers();
    const auto result = session.move(PLAYERS[0], Room::LOUNGE);
    EXPECT_EQ(SessionError::NOT_STARTED, result.getError());
}

TEST_F(GameSessionTest, testSuggestionNobodyCanDisprove)
{
    startGame();
    const auto case_file = *session.getSnapshot().caseFile;
    walkTo(case_file.room);
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handleSuggestionMade(
            testing::AllOf(
                Field(&GameSession::SuggestionMade::player, PLAYERS[0]),
                Field(&GameSession::SuggestionMade::suggestion, case_file))));
    EXPECT_CALL(*observer, handleDisproveRequested(_)).Times(0);
    EXPECT_CALL(
        *observer,
        handleSuggestionResolved(
            testing::AllOf(
                Field(&GameSession::SuggestionResolved::suggester, PLAYERS[0]),
                Field(
                    &GameSession::SuggestionResolved::outcome,
                    SuggestionOutcome {NoRefute {}}))));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    const auto result = session.suggest(
        PLAYERS[0], case_file.suspect, case_file.weapon);
    ASSERT_TRUE(result);
    EXPECT_EQ(SuggestionOutcome {NoRefute {}}, *result);
    EXPECT_EQ(
        Location {case_file.room},
        Clue::Engine::getTokenLocation(
            session.getSnapshot(), case_file.suspect));
}

TEST_F(GameSessionTest, testDisprove)
{
    startGame();
    const auto suggestion =
        Clue::Engine::findContestedSuggestion(session.getSnapshot());
    walkTo(suggestion.room);
    EXPECT_CALL(*observer, handleSuggestionResolved(_)).Times(0);
    EXPECT_CALL(
        *observer,
        handleDisproveRequested(
            testing::AllOf(
                Field(
                    &GameSession::DisproveRequested::suggester, PLAYERS[0]),
                Field(&GameSession::DisproveRequested::timeout, 30000ms))));
    const auto result = session.suggest(
        PLAYERS[0], suggestion.suspect, suggestion.weapon);
    ASSERT_TRUE(result);
    const auto* awaiting = std::get_if<AwaitingDisprove>(&*result);
    ASSERT_TRUE(awaiting);
    testing::Mock::VerifyAndClearExpectations(observer.get());

    const auto state = session.getSnapshot();
    ASSERT_TRUE(state.pendingDisprove);
    const auto card = state.pendingDisprove->matchingCards.back();
    const auto expected = SuggestionOutcome {
        CardRevealed {awaiting->disprover, card}};
    EXPECT_EQ(
        SessionError::DISPROVE_PENDING, session.endTurn(PLAYERS[0]).getError());
    EXPECT_CALL(
        *observer,
        handleSuggestionResolved(
            Field(&GameSession::SuggestionResolved::outcome, expected)));
    const auto disprove_result = session.disprove(awaiting->disprover, card);
    ASSERT_TRUE(disprove_result);
    EXPECT_EQ(expected, *disprove_result);
    EXPECT_TRUE(session.endTurn(PLAYERS[0]));
}

TEST_F(GameSessionTest, testExpireDisprove)
{
    startGame();
    const auto suggestion =
        Clue::Engine::findContestedSuggestion(session.getSnapshot());
    walkTo(suggestion.room);
    const auto result = session.suggest(
        PLAYERS[0], suggestion.suspect, suggestion.weapon);
    ASSERT_TRUE(result);
    const auto& awaiting = std::get<AwaitingDisprove>(*result);
    const auto card =
        session.getSnapshot().pendingDisprove->matchingCards.front();
    const auto expected = SuggestionOutcome {
        CardRevealed {awaiting.disprover, card}};
    EXPECT_CALL(
        *observer,
        handleSuggestionResolved(
            Field(&GameSession::SuggestionResolved::outcome, expected)));
    const auto expire_result = session.expireDisprove(awaiting.requestId);
    ASSERT_TRUE(expire_result);
    EXPECT_EQ(expected, *expire_result);
    EXPECT_EQ(
        SessionError::NO_PENDING_DISPROVE,
        session.expireDisprove(awaiting.requestId).getError());
}

TEST_F(GameSessionTest, testCorrectAccusation)
{
    startGame();
    const auto case_file = *session.getSnapshot().caseFile;
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handleAccusationMade(
            Field(
                &GameSession::AccusationMade::outcome,
                AccusationOutcome::WIN)));
    EXPECT_CALL(
        *observer,
        handleGameEnded(
            Field(
                &GameSession::GameEnded::winner,
                std::optional<Clue::Uuid> {PLAYERS[0]})));
    EXPECT_CALL(*observer, handleStateUpdated(_));
    const auto result = session.accuse(PLAYERS[0], case_file);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::WIN, *result);
    EXPECT_EQ(
        SessionError::GAME_OVER,
        session.move(PLAYERS[1], Room::STUDY).getError());
}

TEST_F(GameSessionTest, testIncorrectAccusation)
{
    startGame();
    const auto case_file = *session.getSnapshot().caseFile;
    const auto accusation = CaseFile {
        case_file.suspect, case_file.weapon,
        case_file.room == Room::HALL ? Room::LOUNGE : Room::HALL};
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handleAccusationMade(
            Field(
                &GameSession::AccusationMade::outcome,
                AccusationOutcome::ELIMINATED)));
    EXPECT_CALL(
        *observer,
        handleTurnStarted(
            Field(&GameSession::TurnStarted::player, PLAYERS[1])));
    EXPECT_CALL(*observer, handleGameEnded(_)).Times(0);
    EXPECT_CALL(*observer, handleStateUpdated(_));
    const auto result = session.accuse(PLAYERS[0], accusation);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::ELIMINATED, *result);
}

TEST_F(GameSessionTest, testEveryoneAccusingWronglyEndsInTie)
{
    startGame();
    const auto case_file = *session.getSnapshot().caseFile;
    const auto accusation = CaseFile {
        case_file.suspect, case_file.weapon,
        case_file.room == Room::HALL ? Room::LOUNGE : Room::HALL};
    EXPECT_CALL(
        *observer,
        handleGameEnded(
            Field(
                &GameSession::GameEnded::winner,
                std::optional<Clue::Uuid> {})));
    for (const auto n : { 0, 1 }) {
        const auto result = session.accuse(PLAYERS[n], accusation);
        ASSERT_TRUE(result);
        EXPECT_EQ(AccusationOutcome::ELIMINATED, *result);
    }
    const auto result = session.accuse(PLAYERS[2], accusation);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::TIE, *result);

    const auto state = session.getSnapshot();
    EXPECT_EQ(SessionStatus::ENDED, state.status);
    EXPECT_FALSE(state.winner);
    for (const auto& player : state.players) {
        EXPECT_TRUE(player.isEliminated());
    }

    const auto game_over = SessionError::GAME_OVER;
    EXPECT_EQ(game_over, session.move(PLAYERS[2], Room::STUDY).getError());
    EXPECT_EQ(
        game_over,
        session.suggest(
            PLAYERS[2], Suspect::MR_GREEN, Clue::Weapon::ROPE).getError());
    EXPECT_EQ(
        game_over,
        session.disprove(PLAYERS[1], Suspect::MR_GREEN).getError());
    EXPECT_EQ(game_over, session.accuse(PLAYERS[2], case_file).getError());
    EXPECT_EQ(game_over, session.endTurn(PLAYERS[2]).getError());
    EXPECT_EQ(game_over, session.startGame(PLAYERS[0]).getError());
    EXPECT_EQ(game_over, session.join(PLAYERS[3]).getError());
    EXPECT_EQ(SessionStatus::ENDED, session.getSnapshot().status);
}

TEST_F(GameSessionTest, testEndTurn)
{
    startGame();
    EXPECT_CALL(
        *observer,
        handleTurnStarted(
            Field(&GameSession::TurnStarted::player, PLAYERS[1])));
    EXPECT_TRUE(session.endTurn(PLAYERS[0]));
    EXPECT_EQ(
        SessionError::NOT_YOUR_TURN, session.endTurn(PLAYERS[0]).getError());
}

TEST_F(GameSessionTest, testInspect)
{
    joinPlayers();
    auto n_players = std::size_t {};
    session.inspect(
        [&n_players](const auto& state) { n_players = state.players.size(); });
    EXPECT_EQ(3u, n_players);
}

class GameSessionWithTimeoutTest : public GameSessionTest {
protected:
    GameSessionWithTimeoutTest() :
        GameSessionTest {GameSession::Options {0ms, false}}
    {
    }
};

TEST_F(GameSessionWithTimeoutTest, testOverdueDisproveIsResolvedFirst)
{
    startGame();
    const auto suggestion =
        Clue::Engine::findContestedSuggestion(session.getSnapshot());
    walkTo(suggestion.room);
    const auto result = session.suggest(
        PLAYERS[0], suggestion.suspect, suggestion.weapon);
    ASSERT_TRUE(result);
    const auto& awaiting = std::get<AwaitingDisprove>(*result);
    const auto card =
        session.getSnapshot().pendingDisprove->matchingCards.front();
    testing::InSequence seq;
    EXPECT_CALL(
        *observer,
        handleSuggestionResolved(
            Field(
                &GameSession::SuggestionResolved::outcome,
                SuggestionOutcome {
                    CardRevealed {awaiting.disprover, card}})));
    EXPECT_CALL(
        *observer,
        handleTurnStarted(
            Field(&GameSession::TurnStarted::player, PLAYERS[1])));
    EXPECT_TRUE(session.endTurn(PLAYERS[0]));
}

class GameSessionWithFreeMovementTest : public GameSessionTest {
protected:
    GameSessionWithFreeMovementTest() :
        GameSessionTest {GameSession::Options {30000ms, true}}
    {
    }
};

TEST_F(GameSessionWithFreeMovementTest, testMoveInLobby)
{
    joinPlayers();
    EXPECT_TRUE(session.move(PLAYERS[1], Room::STUDY));
    EXPECT_TRUE(session.move(PLAYERS[0], Room::HALL));
}

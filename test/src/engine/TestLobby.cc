#include "engine/Lobby.hh"
#include "engine/SessionStateHelper.hh"
#include "Utility.hh"

#include <gtest/gtest.h>

#include <optional>

using Clue::Engine::PLAYERS;
using Clue::Engine::OUTSIDER;
using Clue::Engine::SessionError;
using Clue::Engine::SessionStatus;
using Clue::Participation;
using Clue::Suspect;

class LobbyTest : public testing::Test {
protected:
    void joinPlayers(const int n)
    {
        for (const auto i : Clue::to(n)) {
            const auto result = Clue::Engine::join(
                state, PLAYERS[i], Clue::SUSPECTS[i], rng);
            ASSERT_TRUE(result);
        }
    }

    Clue::Engine::SessionState state;
    Clue::Rng rng {42};
};

TEST_F(LobbyTest, testInitialState)
{
    EXPECT_EQ(SessionStatus::LOBBY, state.status);
    EXPECT_TRUE(state.players.empty());
    EXPECT_FALSE(state.hostIndex);
    for (const auto character : Clue::SUSPECTS) {
        EXPECT_EQ(
            Clue::Location {Clue::getStartingHallway(character)},
            Clue::Engine::getTokenLocation(state, character));
    }
}

TEST_F(LobbyTest, testFirstJoinerBecomesHost)
{
    const auto result = Clue::Engine::join(
        state, PLAYERS[0], Suspect::MRS_PEACOCK, rng);
    ASSERT_TRUE(result);
    EXPECT_EQ(0u, *result);
    ASSERT_EQ(1u, state.players.size());
    EXPECT_EQ(Suspect::MRS_PEACOCK, state.players[0].character);
    EXPECT_EQ(Participation::ACTIVE, state.players[0].participation);
    EXPECT_TRUE(Clue::Engine::isHost(state, 0));
}

TEST_F(LobbyTest, testJoinWithoutPreferenceGetsFreeCharacter)
{
    joinPlayers(5);
    const auto result = Clue::Engine::join(
        state, PLAYERS[5], std::nullopt, rng);
    ASSERT_TRUE(result);
    EXPECT_EQ(
        Suspect::COLONEL_MUSTARD, state.players.at(*result).character);
}

TEST_F(LobbyTest, testJoinWithTakenCharacter)
{
    joinPlayers(1);
    const auto result = Clue::Engine::join(
        state, PLAYERS[1], Clue::SUSPECTS[0], rng);
    EXPECT_EQ(SessionError::CHARACTER_TAKEN, result.getError());
    EXPECT_EQ(1u, state.players.size());
}

TEST_F(LobbyTest, testJoinFullSession)
{
    joinPlayers(Clue::MAX_PLAYERS);
    const auto result = Clue::Engine::join(state, OUTSIDER, std::nullopt, rng);
    EXPECT_EQ(SessionError::CAPACITY_EXCEEDED, result.getError());
}

TEST_F(LobbyTest, testJoinStartedGame)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    const auto result = Clue::Engine::join(state, OUTSIDER, std::nullopt, rng);
    EXPECT_EQ(SessionError::ALREADY_STARTED, result.getError());
}

TEST_F(LobbyTest, testJoinEndedGame)
{
    joinPlayers(3);
    state.status = SessionStatus::ENDED;
    const auto result = Clue::Engine::join(state, OUTSIDER, std::nullopt, rng);
    EXPECT_EQ(SessionError::GAME_OVER, result.getError());
}

TEST_F(LobbyTest, testReconnect)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    ASSERT_TRUE(Clue::Engine::leave(state, PLAYERS[1]));
    EXPECT_EQ(Participation::DISCONNECTED, state.players[1].participation);
    const auto hand = state.players[1].hand;
    const auto result = Clue::Engine::join(
        state, PLAYERS[1], Suspect::MRS_WHITE, rng);
    ASSERT_TRUE(result);
    EXPECT_EQ(1u, *result);
    EXPECT_EQ(Participation::ACTIVE, state.players[1].participation);
    EXPECT_EQ(Clue::SUSPECTS[1], state.players[1].character);
    EXPECT_EQ(hand, state.players[1].hand);
}

TEST_F(LobbyTest, testLeaveUnknownPlayer)
{
    joinPlayers(1);
    const auto result = Clue::Engine::leave(state, OUTSIDER);
    EXPECT_EQ(SessionError::UNKNOWN_PLAYER, result.getError());
}

TEST_F(LobbyTest, testHostLeavingTransfersHost)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::leave(state, PLAYERS[1]));
    ASSERT_TRUE(Clue::Engine::leave(state, PLAYERS[0]));
    EXPECT_TRUE(Clue::Engine::isHost(state, 2));
}

TEST_F(LobbyTest, testHostLeavingStartedGameKeepsHost)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    ASSERT_TRUE(Clue::Engine::leave(state, PLAYERS[0]));
    EXPECT_TRUE(Clue::Engine::isHost(state, 0));
}

TEST_F(LobbyTest, testStart)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    EXPECT_EQ(SessionStatus::IN_PROGRESS, state.status);
    EXPECT_EQ(std::optional<std::size_t> {0},
              Clue::Engine::getTurnHolder(state));
    ASSERT_TRUE(state.caseFile);
    for (const auto& player : state.players) {
        EXPECT_EQ(6u, player.hand.size());
        for (const auto& card : state.caseFile->getCards()) {
            EXPECT_FALSE(player.hasCard(card));
        }
    }
    EXPECT_NO_THROW(Clue::Engine::verifyCardConservation(state));
}

TEST_F(LobbyTest, testStartWithFourPlayersDealsExtraCardsFirst)
{
    joinPlayers(4);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    EXPECT_EQ(5u, state.players[0].hand.size());
    EXPECT_EQ(5u, state.players[1].hand.size());
    EXPECT_EQ(4u, state.players[2].hand.size());
    EXPECT_EQ(4u, state.players[3].hand.size());
}

TEST_F(LobbyTest, testStartByNonHost)
{
    joinPlayers(3);
    const auto result = Clue::Engine::start(state, PLAYERS[1], rng);
    EXPECT_EQ(SessionError::NOT_HOST, result.getError());
    EXPECT_EQ(SessionStatus::LOBBY, state.status);
}

TEST_F(LobbyTest, testStartByUnknownPlayer)
{
    joinPlayers(3);
    const auto result = Clue::Engine::start(state, OUTSIDER, rng);
    EXPECT_EQ(SessionError::UNKNOWN_PLAYER, result.getError());
}

TEST_F(LobbyTest, testStartWithTooFewPlayers)
{
    joinPlayers(2);
    const auto result = Clue::Engine::start(state, PLAYERS[0], rng);
    EXPECT_EQ(SessionError::INSUFFICIENT_PLAYERS, result.getError());
    EXPECT_FALSE(state.caseFile);
}

TEST_F(LobbyTest, testStartTwice)
{
    joinPlayers(3);
    ASSERT_TRUE(Clue::Engine::start(state, PLAYERS[0], rng));
    const auto result = Clue::Engine::start(state, PLAYERS[0], rng);
    EXPECT_EQ(SessionError::ALREADY_STARTED, result.getError());
}

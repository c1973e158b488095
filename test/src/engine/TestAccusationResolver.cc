#include "engine/AccusationResolver.hh"
#include "engine/SessionStateHelper.hh"

#include <gtest/gtest.h>

using Clue::Engine::AccusationOutcome;
using Clue::Engine::CASE_FILE;
using Clue::Engine::PLAYERS;
using Clue::Engine::SessionError;
using Clue::Engine::SessionStatus;
using Clue::CaseFile;
using Clue::Participation;
using Clue::Room;
using Clue::Suspect;
using Clue::Weapon;

namespace {
const auto WRONG_ACCUSATION = CaseFile {
    Suspect::COLONEL_MUSTARD, Weapon::REVOLVER, Room::STUDY};
}

class AccusationResolverTest : public testing::Test {
protected:
    Clue::Engine::SessionState state {Clue::Engine::makeGameInProgress()};
};

TEST_F(AccusationResolverTest, testCorrectAccusationWins)
{
    const auto result = Clue::Engine::accuse(state, PLAYERS[0], CASE_FILE);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::WIN, *result);
    EXPECT_EQ(SessionStatus::ENDED, state.status);
    EXPECT_EQ(std::optional<std::size_t> {0}, state.winner);
}

TEST_F(AccusationResolverTest, testAccusationIsAllowedOutsideRooms)
{
    Clue::Engine::placeToken(
        state, Suspect::MISS_SCARLET, Clue::Hallway::HALLWAY1);
    const auto result = Clue::Engine::accuse(state, PLAYERS[0], CASE_FILE);
    EXPECT_TRUE(result);
}

TEST_F(AccusationResolverTest, testIncorrectAccusationEliminates)
{
    const auto result = Clue::Engine::accuse(
        state, PLAYERS[0], WRONG_ACCUSATION);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::ELIMINATED, *result);
    EXPECT_EQ(Participation::ELIMINATED, state.players[0].participation);
    EXPECT_EQ(SessionStatus::IN_PROGRESS, state.status);
    EXPECT_TRUE(Clue::Engine::isTurnHolder(state, 1));
    EXPECT_FALSE(state.winner);
}

TEST_F(AccusationResolverTest, testEliminatedPlayerKeepsCards)
{
    const auto hand = state.players[0].hand;
    ASSERT_TRUE(Clue::Engine::accuse(state, PLAYERS[0], WRONG_ACCUSATION));
    EXPECT_EQ(hand, state.players[0].hand);
}

TEST_F(AccusationResolverTest, testLastPlayerEliminatedEndsInTie)
{
    state.players[1].participation = Participation::ELIMINATED;
    state.players[2].participation = Participation::DISCONNECTED_ELIMINATED;
    const auto result = Clue::Engine::accuse(
        state, PLAYERS[0], WRONG_ACCUSATION);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::TIE, *result);
    EXPECT_EQ(SessionStatus::ENDED, state.status);
    EXPECT_FALSE(state.winner);
}

TEST_F(AccusationResolverTest, testAccusationsInTurnOrderEndInTie)
{
    for (const auto n : { 0, 1 }) {
        ASSERT_TRUE(Clue::Engine::isTurnHolder(state, n));
        const auto result = Clue::Engine::accuse(
            state, PLAYERS[n], WRONG_ACCUSATION);
        ASSERT_TRUE(result);
        EXPECT_EQ(AccusationOutcome::ELIMINATED, *result);
    }
    ASSERT_TRUE(Clue::Engine::isTurnHolder(state, 2));
    const auto result = Clue::Engine::accuse(
        state, PLAYERS[2], WRONG_ACCUSATION);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::TIE, *result);
    EXPECT_EQ(SessionStatus::ENDED, state.status);
    EXPECT_FALSE(state.winner);
    EXPECT_EQ(
        SessionError::GAME_OVER,
        Clue::Engine::accuse(state, PLAYERS[2], CASE_FILE).getError());
}

TEST_F(AccusationResolverTest, testLonePlayerKeepsPlaying)
{
    state.players[1].participation = Participation::ELIMINATED;
    const auto result = Clue::Engine::accuse(
        state, PLAYERS[0], WRONG_ACCUSATION);
    ASSERT_TRUE(result);
    EXPECT_EQ(AccusationOutcome::ELIMINATED, *result);
    EXPECT_TRUE(Clue::Engine::isTurnHolder(state, 2));
    EXPECT_EQ(SessionStatus::IN_PROGRESS, state.status);
}

TEST_F(AccusationResolverTest, testAccuseOutOfTurn)
{
    const auto result = Clue::Engine::accuse(state, PLAYERS[1], CASE_FILE);
    EXPECT_EQ(SessionError::NOT_YOUR_TURN, result.getError());
    EXPECT_EQ(SessionStatus::IN_PROGRESS, state.status);
}

TEST_F(AccusationResolverTest, testAccuseWhenEliminated)
{
    ASSERT_TRUE(Clue::Engine::accuse(state, PLAYERS[0], WRONG_ACCUSATION));
    const auto result = Clue::Engine::accuse(state, PLAYERS[0], CASE_FILE);
    EXPECT_EQ(SessionError::ELIMINATED, result.getError());
}

TEST_F(AccusationResolverTest, testAccuseAfterGameOver)
{
    ASSERT_TRUE(Clue::Engine::accuse(state, PLAYERS[0], CASE_FILE));
    const auto result = Clue::Engine::accuse(state, PLAYERS[1], CASE_FILE);
    EXPECT_EQ(SessionError::GAME_OVER, result.getError());
}

TEST_F(AccusationResolverTest, testAccuseInLobby)
{
    state.status = SessionStatus::LOBBY;
    const auto result = Clue::Engine::accuse(state, PLAYERS[0], CASE_FILE);
    EXPECT_EQ(SessionError::NOT_STARTED, result.getError());
}

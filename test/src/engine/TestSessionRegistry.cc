#include "engine/SessionRegistry.hh"
#include "engine/SessionStateHelper.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using Clue::Engine::OUTSIDER;
using Clue::Engine::SessionError;

class SessionRegistryTest : public testing::Test {
protected:
    Clue::Engine::SessionRegistry registry;
};

TEST_F(SessionRegistryTest, testCreateSessionWithUuid)
{
    const auto session = registry.createSession(OUTSIDER);
    ASSERT_TRUE(session);
    EXPECT_EQ(OUTSIDER, session->getUuid());
    const auto result = registry.getSession(OUTSIDER);
    ASSERT_TRUE(result);
    EXPECT_EQ(session, *result);
}

TEST_F(SessionRegistryTest, testCreateSessionWithGeneratedUuid)
{
    const auto session1 = registry.createSession();
    const auto session2 = registry.createSession();
    ASSERT_TRUE(session1);
    ASSERT_TRUE(session2);
    EXPECT_NE(session1->getUuid(), session2->getUuid());
    EXPECT_EQ(2u, registry.getNumberOfSessions());
    EXPECT_THAT(
        registry.getSessionUuids(),
        testing::UnorderedElementsAre(
            session1->getUuid(), session2->getUuid()));
}

TEST_F(SessionRegistryTest, testCreateDuplicateSession)
{
    ASSERT_TRUE(registry.createSession(OUTSIDER));
    EXPECT_FALSE(registry.createSession(OUTSIDER));
    EXPECT_EQ(1u, registry.getNumberOfSessions());
}

TEST_F(SessionRegistryTest, testSessionNotFound)
{
    const auto result = registry.getSession(OUTSIDER);
    EXPECT_EQ(SessionError::SESSION_NOT_FOUND, result.getError());
}

TEST_F(SessionRegistryTest, testRemoveSession)
{
    ASSERT_TRUE(registry.createSession(OUTSIDER));
    EXPECT_TRUE(registry.removeSession(OUTSIDER));
    EXPECT_FALSE(registry.removeSession(OUTSIDER));
    EXPECT_EQ(
        SessionError::SESSION_NOT_FOUND,
        registry.getSession(OUTSIDER).getError());
}

TEST_F(SessionRegistryTest, testSessionsAreIndependent)
{
    const auto session1 = registry.createSession();
    const auto session2 = registry.createSession();
    ASSERT_TRUE(session1->join(Clue::Engine::PLAYERS[0]));
    EXPECT_EQ(1u, session1->getSnapshot().players.size());
    EXPECT_TRUE(session2->getSnapshot().players.empty());
}

#ifndef ENGINE_MOCKSESSIONOBSERVER_HH_
#define ENGINE_MOCKSESSIONOBSERVER_HH_

#include "engine/GameSession.hh"
#include "Observer.hh"

#include <gmock/gmock.h>

#include <memory>

namespace Clue {
namespace Engine {

// Observes every event of a game session, each through its own mock method
class MockSessionObserver :
    public Observer<GameSession::PlayerJoined>,
    public Observer<GameSession::PlayerLeft>,
    public Observer<GameSession::HostChanged>,
    public Observer<GameSession::GameStarted>,
    public Observer<GameSession::TurnStarted>,
    public Observer<GameSession::PlayerMoved>,
    public Observer<GameSession::SuggestionMade>,
    public Observer<GameSession::DisproveRequested>,
    public Observer<GameSession::SuggestionResolved>,
    public Observer<GameSession::AccusationMade>,
    public Observer<GameSession::GameEnded>,
    public Observer<GameSession::StateUpdated>,
    public Observer<GameSession::SessionAborted> {
public:
    MOCK_METHOD1(handlePlayerJoined, void(const GameSession::PlayerJoined&));
    MOCK_METHOD1(handlePlayerLeft, void(const GameSession::PlayerLeft&));
    MOCK_METHOD1(handleHostChanged, void(const GameSession::HostChanged&));
    MOCK_METHOD1(handleGameStarted, void(const GameSession::GameStarted&));
    MOCK_METHOD1(handleTurnStarted, void(const GameSession::TurnStarted&));
    MOCK_METHOD1(handlePlayerMoved, void(const GameSession::PlayerMoved&));
    MOCK_METHOD1(
        handleSuggestionMade, void(const GameSession::SuggestionMade&));
    MOCK_METHOD1(
        handleDisproveRequested, void(const GameSession::DisproveRequested&));
    MOCK_METHOD1(
        handleSuggestionResolved,
        void(const GameSession::SuggestionResolved&));
    MOCK_METHOD1(
        handleAccusationMade, void(const GameSession::AccusationMade&));
    MOCK_METHOD1(handleGameEnded, void(const GameSession::GameEnded&));
    MOCK_METHOD1(handleStateUpdated, void(const GameSession::StateUpdated&));
    MOCK_METHOD1(
        handleSessionAborted, void(const GameSession::SessionAborted&));

private:

    void handleNotify(const GameSession::PlayerJoined& e) override
    {
        handlePlayerJoined(e);
    }

    void handleNotify(const GameSession::PlayerLeft& e) override
    {
        handlePlayerLeft(e);
    }

    void handleNotify(const GameSession::HostChanged& e) override
    {
        handleHostChanged(e);
    }

    void handleNotify(const GameSession::GameStarted& e) override
    {
        handleGameStarted(e);
    }

    void handleNotify(const GameSession::TurnStarted& e) override
    {
        handleTurnStarted(e);
    }

    void handleNotify(const GameSession::PlayerMoved& e) override
    {
        handlePlayerMoved(e);
    }

    void handleNotify(const GameSession::SuggestionMade& e) override
    {
        handleSuggestionMade(e);
    }

    void handleNotify(const GameSession::DisproveRequested& e) override
    {
        handleDisproveRequested(e);
    }

    void handleNotify(const GameSession::SuggestionResolved& e) override
    {
        handleSuggestionResolved(e);
    }

    void handleNotify(const GameSession::AccusationMade& e) override
    {
        handleAccusationMade(e);
    }

    void handleNotify(const GameSession::GameEnded& e) override
    {
        handleGameEnded(e);
    }

    void handleNotify(const GameSession::StateUpdated& e) override
    {
        handleStateUpdated(e);
    }

    void handleNotify(const GameSession::SessionAborted& e) override
    {
        handleSessionAborted(e);
    }
};

// Subscribe observer to every event of session
template<typename SessionObserver>
void subscribeToAll(
    GameSession& session, const std::shared_ptr<SessionObserver>& observer)
{
    session.subscribeToPlayerJoined(observer);
    session.subscribeToPlayerLeft(observer);
    session.subscribeToHostChanged(observer);
    session.subscribeToGameStarted(observer);
    session.subscribeToTurnStarted(observer);
    session.subscribeToPlayerMoved(observer);
    session.subscribeToSuggestionMade(observer);
    session.subscribeToDisproveRequested(observer);
    session.subscribeToSuggestionResolved(observer);
    session.subscribeToAccusationMade(observer);
    session.subscribeToGameEnded(observer);
    session.subscribeToStateUpdated(observer);
    session.subscribeToSessionAborted(observer);
}

}
}

#endif // ENGINE_MOCKSESSIONOBSERVER_HH_

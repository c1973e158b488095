#include "main/ClueGame.hh"

#include "engine/GameSession.hh"
#include "main/Commands.hh"
#include "messaging/CallbackScheduler.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/CommandUtility.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/LocationJsonSerializer.hh"
#include "messaging/SessionJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"
#include "Logging.hh"
#include "Observer.hh"
#include "Utility.hh"

#include <boost/uuid/uuid_io.hpp>

#include <cassert>
#include <sstream>
#include <utility>

namespace Clue {
namespace Main {

using Engine::GameSession;
using Messaging::JsonSerializer;

class ClueGame::Impl :
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

    Impl(
        std::shared_ptr<GameSession> session,
        Messaging::SharedSocket eventSocket,
        std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler);

    GameSession& getSession();

    GameState getState(
        const Uuid& player,
        const std::optional<std::vector<std::string>>& keys) const;

    Counter getCounter() const;

private:

    template<typename... Args>
    void publish(const std::string& command, Args&&... args);

    void handleNotify(const GameSession::PlayerJoined&) override;
    void handleNotify(const GameSession::PlayerLeft&) override;
    void handleNotify(const GameSession::HostChanged&) override;
    void handleNotify(const GameSession::GameStarted&) override;
    void handleNotify(const GameSession::TurnStarted&) override;
    void handleNotify(const GameSession::PlayerMoved&) override;
    void handleNotify(const GameSession::SuggestionMade&) override;
    void handleNotify(const GameSession::DisproveRequested&) override;
    void handleNotify(const GameSession::SuggestionResolved&) override;
    void handleNotify(const GameSession::AccusationMade&) override;
    void handleNotify(const GameSession::GameEnded&) override;
    void handleNotify(const GameSession::StateUpdated&) override;
    void handleNotify(const GameSession::SessionAborted&) override;

    const std::shared_ptr<GameSession> session;
    Messaging::SharedSocket eventSocket;
    std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler;
    nlohmann::json history;
    Counter counter;
};

ClueGame::Impl::Impl(
    std::shared_ptr<GameSession> session,
    Messaging::SharedSocket eventSocket,
    std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler) :
    session {std::move(session)},
    eventSocket {std::move(eventSocket)},
    callbackScheduler {std::move(callbackScheduler)},
    history(nlohmann::json::array()),
    counter {}
{
}

template<typename... Args>
void ClueGame::Impl::publish(const std::string& command, Args&&... args)
{
    std::ostringstream os;
    os << dereference(session).getUuid() << ':' << command;
    log(LogLevel::DEBUG, "Publishing event: %s", os.str());
    ++counter;
    if (command != UPDATE_COMMAND) {
        auto entry = nlohmann::json {
            { EVENT_COMMAND, command },
            { COUNTER_COMMAND, counter },
        };
        ((entry[args.first] = nlohmann::json(args.second)), ...);
        history.push_back(std::move(entry));
    }
    sendEventMessage(
        dereference(eventSocket), JsonSerializer {}, os.str(),
        std::forward<Args>(args)...,
        std::pair {COUNTER_COMMAND, counter});
}

GameSession& ClueGame::Impl::getSession()
{
    return dereference(session);
}

GameState ClueGame::Impl::getState(
    const Uuid& player,
    const std::optional<std::vector<std::string>>& keys) const
{
    const auto all_keys = std::vector {
        PUBSTATE_COMMAND, PRIVSTATE_COMMAND, SELF_COMMAND, HISTORY_COMMAND };
    auto game_state = nlohmann::json::object();
    dereference(session).inspect(
        [&](const Engine::SessionState& state)
        {
            for (const auto& key : keys ? *keys : all_keys) {
                if (key == PUBSTATE_COMMAND) {
                    emplacePubstate(state, game_state);
                } else if (key == PRIVSTATE_COMMAND) {
                    emplacePrivstate(state, player, game_state);
                } else if (key == SELF_COMMAND) {
                    emplaceSelf(state, player, game_state);
                } else if (key == HISTORY_COMMAND) {
                    game_state.emplace(HISTORY_COMMAND, history);
                }
            }
        });
    return game_state;
}

ClueGame::Counter ClueGame::Impl::getCounter() const
{
    return counter;
}

void ClueGame::Impl::handleNotify(const GameSession::PlayerJoined& event)
{
    log(LogLevel::DEBUG, "Player %s %s as %s", event.player,
        event.reconnected ? "reconnected" : "joined", event.character);
    publish(
        JOIN_COMMAND,
        std::pair {PLAYER_COMMAND, event.player},
        std::pair {CHARACTER_COMMAND, event.character});
}

void ClueGame::Impl::handleNotify(const GameSession::PlayerLeft& event)
{
    log(LogLevel::DEBUG, "Player %s left", event.player);
    publish(LEAVE_COMMAND, std::pair {PLAYER_COMMAND, event.player});
}

void ClueGame::Impl::handleNotify(const GameSession::HostChanged& event)
{
    log(LogLevel::DEBUG, "Host changed to %s", event.host);
    publish(HOST_COMMAND, std::pair {PLAYER_COMMAND, event.host});
}

void ClueGame::Impl::handleNotify(const GameSession::GameStarted& event)
{
    log(LogLevel::INFO, "Game %s started with %d players", event.state.uuid,
        event.state.players.size());
    auto players = std::vector<Uuid> {};
    for (const auto& player : event.state.players) {
        players.push_back(player.uuid);
    }
    publish(START_COMMAND, std::pair {PLAYERS_COMMAND, std::move(players)});
}

void ClueGame::Impl::handleNotify(const GameSession::TurnStarted& event)
{
    log(LogLevel::DEBUG, "Turn started. Player: %s", event.player);
    publish(TURN_COMMAND, std::pair {PLAYER_COMMAND, event.player});
}

void ClueGame::Impl::handleNotify(const GameSession::PlayerMoved& event)
{
    log(LogLevel::DEBUG, "Player %s moved", event.player);
    publish(
        MOVE_COMMAND,
        std::pair {PLAYER_COMMAND, event.player},
        std::pair {LOCATION_COMMAND, event.location});
}

void ClueGame::Impl::handleNotify(const GameSession::SuggestionMade& event)
{
    log(LogLevel::DEBUG, "Suggestion made. Player: %s. Suggestion: %s",
        event.player, event.suggestion);
    publish(
        SUGGEST_COMMAND,
        std::pair {PLAYER_COMMAND, event.player},
        std::pair {SUSPECT_COMMAND, event.suggestion.suspect},
        std::pair {WEAPON_COMMAND, event.suggestion.weapon},
        std::pair {ROOM_COMMAND, event.suggestion.room});
}

void ClueGame::Impl::handleNotify(const GameSession::DisproveRequested& event)
{
    log(LogLevel::DEBUG, "Disprove requested. Disprover: %s. Request: %d",
        event.disprover, event.requestId);
    publish(
        DISPROVE_COMMAND,
        std::pair {PLAYER_COMMAND, event.suggester},
        std::pair {DISPROVER_COMMAND, event.disprover});
    // The session is locked here, the expiry runs from the message loop
    dereference(callbackScheduler).callLater(
        event.timeout,
        [](const std::weak_ptr<GameSession>& weak_session,
           const std::uint64_t requestId)
        {
            if (const auto session = weak_session.lock()) {
                const auto result = session->expireDisprove(requestId);
                if (!result) {
                    log(LogLevel::DEBUG,
                        "Disprove request %d not expired: %s", requestId,
                        *result.getError());
                }
            }
        },
        std::weak_ptr {session}, event.requestId);
}

void ClueGame::Impl::handleNotify(const GameSession::SuggestionResolved& event)
{
    log(LogLevel::DEBUG, "Suggestion resolved. Suggester: %s",
        event.suggester);
    publish(
        SUGGESTION_END_COMMAND, std::pair {PLAYER_COMMAND, event.suggester});
}

void ClueGame::Impl::handleNotify(const GameSession::AccusationMade& event)
{
    log(LogLevel::DEBUG, "Accusation made. Player: %s. Outcome: %s",
        event.player, event.outcome);
    publish(
        ACCUSE_COMMAND,
        std::pair {PLAYER_COMMAND, event.player},
        std::pair {OUTCOME_COMMAND, event.outcome});
}

void ClueGame::Impl::handleNotify(const GameSession::GameEnded& event)
{
    const auto& case_file = event.state.caseFile;
    if (event.winner && case_file) {
        log(LogLevel::INFO, "Game %s won by %s", event.state.uuid,
            *event.winner);
        publish(
            END_COMMAND,
            std::pair {PLAYER_COMMAND, event.winner},
            std::pair {SUSPECT_COMMAND, case_file->suspect},
            std::pair {WEAPON_COMMAND, case_file->weapon},
            std::pair {ROOM_COMMAND, case_file->room});
    } else {
        log(LogLevel::INFO, "Game %s ended in a tie", event.state.uuid);
        publish(
            END_COMMAND, std::pair {PLAYER_COMMAND, std::optional<Uuid> {}});
    }
}

void ClueGame::Impl::handleNotify(const GameSession::StateUpdated& event)
{
    publish(
        UPDATE_COMMAND, std::pair {PUBSTATE_COMMAND, getPubstate(event.state)});
}

void ClueGame::Impl::handleNotify(const GameSession::SessionAborted& event)
{
    log(LogLevel::WARNING, "Game %s aborted: %s", event.state.uuid,
        event.reason);
}

ClueGame::ClueGame(
    std::shared_ptr<GameSession> session,
    Messaging::SharedSocket eventSocket,
    std::shared_ptr<Messaging::CallbackScheduler> callbackScheduler) :
    impl {
        std::make_shared<Impl>(
            session, std::move(eventSocket), std::move(callbackScheduler))}
{
    auto& s = dereference(session);
    s.subscribeToPlayerJoined(impl);
    s.subscribeToPlayerLeft(impl);
    s.subscribeToHostChanged(impl);
    s.subscribeToGameStarted(impl);
    s.subscribeToTurnStarted(impl);
    s.subscribeToPlayerMoved(impl);
    s.subscribeToSuggestionMade(impl);
    s.subscribeToDisproveRequested(impl);
    s.subscribeToSuggestionResolved(impl);
    s.subscribeToAccusationMade(impl);
    s.subscribeToGameEnded(impl);
    s.subscribeToStateUpdated(impl);
    s.subscribeToSessionAborted(impl);
}

const Uuid& ClueGame::getUuid() const
{
    assert(impl);
    return impl->getSession().getUuid();
}

GameSession& ClueGame::getSession()
{
    assert(impl);
    return impl->getSession();
}

GameState ClueGame::getState(
    const Uuid& player,
    const std::optional<std::vector<std::string>>& keys) const
{
    assert(impl);
    return impl->getState(player, keys);
}

ClueGame::Counter ClueGame::getCounter() const
{
    assert(impl);
    return impl->getCounter();
}

}
}

#include "engine/GameSession.hh"

#include "clue/Random.hh"
#include "engine/AccusationResolver.hh"
#include "engine/Lobby.hh"
#include "engine/MovementValidator.hh"
#include "engine/SuggestionResolver.hh"
#include "engine/TurnScheduler.hh"
#include "Logging.hh"

#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <utility>

namespace Clue {
namespace Engine {

////////////////////////////////////////////////////////////////////////////////
// GameSession::Impl
////////////////////////////////////////////////////////////////////////////////

class GameSession::Impl {
public:

    Impl(const Uuid& uuid, Options options);

    template<typename Operation>
    auto execute(const char* name, Operation&& operation)
        -> decltype(operation());

    void notifyTurnStarted();
    void notifyResolved(
        const Uuid& suggester, const SuggestionOutcome& outcome);
    void notifyEndedIfNeeded();

    SessionState state;
    const Options options;
    bool aborted {false};
    mutable std::mutex mutex;

    Observable<PlayerJoined> playerJoinedNotifier;
    Observable<PlayerLeft> playerLeftNotifier;
    Observable<HostChanged> hostChangedNotifier;
    Observable<GameStarted> gameStartedNotifier;
    Observable<TurnStarted> turnStartedNotifier;
    Observable<PlayerMoved> playerMovedNotifier;
    Observable<SuggestionMade> suggestionMadeNotifier;
    Observable<DisproveRequested> disproveRequestedNotifier;
    Observable<SuggestionResolved> suggestionResolvedNotifier;
    Observable<AccusationMade> accusationMadeNotifier;
    Observable<GameEnded> gameEndedNotifier;
    Observable<StateUpdated> stateUpdatedNotifier;
    Observable<SessionAborted> sessionAbortedNotifier;

private:

    void resolveOverdueDisprove();
};

GameSession::Impl::Impl(const Uuid& uuid, Options options) :
    state {uuid},
    options {std::move(options)}
{
}

template<typename Operation>
auto GameSession::Impl::execute(const char* name, Operation&& operation)
    -> decltype(operation())
{
    const auto lock = std::lock_guard {mutex};
    if (aborted) {
        return SessionError::SESSION_ABORTED;
    }
    try {
        resolveOverdueDisprove();
        auto result = operation();
        if (!result) {
            log(LogLevel::DEBUG, "Session %s: %s failed: %s", state.uuid, name,
                *result.getError());
        }
        return result;
    } catch (const SessionAbortedException& e) {
        log(LogLevel::ERROR, "Session %s aborted during %s: %s", state.uuid,
            name, e.what());
        aborted = true;
        sessionAbortedNotifier.notifyAll(SessionAborted {state, e.what()});
        return SessionError::SESSION_ABORTED;
    }
}

void GameSession::Impl::notifyTurnStarted()
{
    if (const auto index = getTurnHolder(state)) {
        const auto& player = state.players.at(*index);
        log(LogLevel::DEBUG, "Session %s: turn of %s", state.uuid, player.uuid);
        turnStartedNotifier.notifyAll(TurnStarted {state, player.uuid});
    }
}

void GameSession::Impl::notifyResolved(
    const Uuid& suggester, const SuggestionOutcome& outcome)
{
    suggestionResolvedNotifier.notifyAll(
        SuggestionResolved {state, suggester, outcome});
}

void GameSession::Impl::notifyEndedIfNeeded()
{
    if (state.status != SessionStatus::ENDED) {
        return;
    }
    auto winner = std::optional<Uuid> {};
    if (state.winner) {
        winner = state.players.at(*state.winner).uuid;
    }
    log(LogLevel::INFO, "Session %s ended. Winner: %s", state.uuid, winner);
    gameEndedNotifier.notifyAll(GameEnded {state, winner});
}

void GameSession::Impl::resolveOverdueDisprove()
{
    if (!state.pendingDisprove) {
        return;
    }
    const auto& suggester =
        state.players.at(state.pendingDisprove->suggester).uuid;
    if (const auto outcome =
        expireOverdueDisprove(state, SessionClock::now())) {
        log(LogLevel::DEBUG, "Session %s: disprove choice timed out",
            state.uuid);
        notifyResolved(suggester, *outcome);
        stateUpdatedNotifier.notifyAll(StateUpdated {state});
    }
}

////////////////////////////////////////////////////////////////////////////////
// GameSession
////////////////////////////////////////////////////////////////////////////////

GameSession::GameSession(const Uuid& uuid, Options options) :
    impl {std::make_unique<Impl>(uuid, std::move(options))}
{
}

GameSession::~GameSession() = default;

void GameSession::subscribeToPlayerJoined(
    std::weak_ptr<Observer<PlayerJoined>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->playerJoinedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToPlayerLeft(
    std::weak_ptr<Observer<PlayerLeft>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->playerLeftNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToHostChanged(
    std::weak_ptr<Observer<HostChanged>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->hostChangedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToGameStarted(
    std::weak_ptr<Observer<GameStarted>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->gameStartedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToTurnStarted(
    std::weak_ptr<Observer<TurnStarted>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->turnStartedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToPlayerMoved(
    std::weak_ptr<Observer<PlayerMoved>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->playerMovedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToSuggestionMade(
    std::weak_ptr<Observer<SuggestionMade>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->suggestionMadeNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToDisproveRequested(
    std::weak_ptr<Observer<DisproveRequested>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->disproveRequestedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToSuggestionResolved(
    std::weak_ptr<Observer<SuggestionResolved>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->suggestionResolvedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToAccusationMade(
    std::weak_ptr<Observer<AccusationMade>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->accusationMadeNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToGameEnded(
    std::weak_ptr<Observer<GameEnded>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->gameEndedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToStateUpdated(
    std::weak_ptr<Observer<StateUpdated>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->stateUpdatedNotifier.subscribe(std::move(observer));
}

void GameSession::subscribeToSessionAborted(
    std::weak_ptr<Observer<SessionAborted>> observer)
{
    const auto lock = std::lock_guard {impl->mutex};
    impl->sessionAbortedNotifier.subscribe(std::move(observer));
}

Result<Player> GameSession::join(
    const Uuid& player, const std::optional<Suspect>& character)
{
    return impl->execute(
        "join",
        [this, &player, &character]() -> Result<Player>
        {
            auto& state = impl->state;
            const auto known = findPlayer(state, player).has_value();
            const auto index = Engine::join(state, player, character, getRng());
            if (!index) {
                return *index.getError();
            }
            const auto& joined = state.players[*index];
            log(LogLevel::DEBUG, "Session %s: %s %s as %s", state.uuid,
                player, known ? "reconnected" : "joined", joined.character);
            impl->playerJoinedNotifier.notifyAll(
                PlayerJoined {state, player, joined.character, known});
            impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            return joined;
        });
}

Result<> GameSession::leave(const Uuid& player)
{
    return impl->execute(
        "leave",
        [this, &player]() -> Result<>
        {
            auto& state = impl->state;
            const auto host = state.hostIndex;
            auto result = Engine::leave(state, player);
            if (result) {
                log(LogLevel::DEBUG, "Session %s: %s left", state.uuid, player);
                impl->playerLeftNotifier.notifyAll(PlayerLeft {state, player});
                if (state.hostIndex != host) {
                    const auto& newHost = state.players.at(*state.hostIndex);
                    impl->hostChangedNotifier.notifyAll(
                        HostChanged {state, newHost.uuid});
                }
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

Result<> GameSession::startGame(const Uuid& player)
{
    return impl->execute(
        "start",
        [this, &player]() -> Result<>
        {
            auto& state = impl->state;
            auto result = Engine::start(state, player, getRng());
            if (result) {
                log(LogLevel::INFO, "Session %s started with %d players",
                    state.uuid, state.players.size());
                impl->gameStartedNotifier.notifyAll(GameStarted {state});
                impl->notifyTurnStarted();
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

Result<> GameSession::move(const Uuid& player, const Location& target)
{
    return impl->execute(
        "move",
        [this, &player, &target]() -> Result<>
        {
            auto& state = impl->state;
            auto result = Engine::move(
                state, player, target, impl->options.freeMovementInLobby);
            if (result) {
                log(LogLevel::DEBUG, "Session %s: %s moved to %s", state.uuid,
                    player, target);
                impl->playerMovedNotifier.notifyAll(
                    PlayerMoved {state, player, target});
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

Result<SuggestionOutcome> GameSession::suggest(
    const Uuid& player, const Suspect suspect, const Weapon weapon)
{
    return impl->execute(
        "suggest",
        [this, &player, suspect, weapon]() -> Result<SuggestionOutcome>
        {
            auto& state = impl->state;
            const auto timeout = impl->options.disproveTimeout;
            auto result = Engine::suggest(
                state, player, suspect, weapon, SessionClock::now() + timeout);
            if (!result) {
                return result;
            }
            const auto& location = getTokenLocation(state, suspect);
            log(LogLevel::DEBUG, "Session %s: %s suggested %s with %s in %s",
                state.uuid, player, suspect, weapon, location);
            impl->suggestionMadeNotifier.notifyAll(
                SuggestionMade {
                    state, player,
                    CaseFile {suspect, weapon, std::get<Room>(location)}});
            const auto* awaiting = std::get_if<AwaitingDisprove>(&*result);
            if (awaiting) {
                impl->disproveRequestedNotifier.notifyAll(
                    DisproveRequested {
                        state, player, awaiting->disprover,
                        awaiting->requestId, timeout});
            } else {
                impl->notifyResolved(player, *result);
            }
            impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            return result;
        });
}

Result<SuggestionOutcome> GameSession::disprove(
    const Uuid& player, const Card& card)
{
    return impl->execute(
        "disprove",
        [this, &player, &card]() -> Result<SuggestionOutcome>
        {
            auto& state = impl->state;
            auto suggester = std::optional<Uuid> {};
            if (state.pendingDisprove) {
                suggester =
                    state.players.at(state.pendingDisprove->suggester).uuid;
            }
            auto result = Engine::disprove(state, player, card);
            if (result) {
                log(LogLevel::DEBUG, "Session %s: %s disproved", state.uuid,
                    player);
                impl->notifyResolved(*suggester, *result);
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

Result<SuggestionOutcome> GameSession::expireDisprove(
    const std::uint64_t requestId)
{
    return impl->execute(
        "expire",
        [this, requestId]() -> Result<SuggestionOutcome>
        {
            auto& state = impl->state;
            auto suggester = std::optional<Uuid> {};
            if (state.pendingDisprove) {
                suggester =
                    state.players.at(state.pendingDisprove->suggester).uuid;
            }
            auto result = Engine::expireDisprove(state, requestId);
            if (result) {
                log(LogLevel::DEBUG,
                    "Session %s: disprove request %d resolved by default",
                    state.uuid, requestId);
                impl->notifyResolved(*suggester, *result);
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

Result<AccusationOutcome> GameSession::accuse(
    const Uuid& player, const CaseFile& accusation)
{
    return impl->execute(
        "accuse",
        [this, &player, &accusation]() -> Result<AccusationOutcome>
        {
            auto& state = impl->state;
            const auto turnIndex = state.turnIndex;
            auto result = Engine::accuse(state, player, accusation);
            if (!result) {
                return result;
            }
            log(LogLevel::INFO, "Session %s: accusation by %s: %s", state.uuid,
                player, *result);
            impl->accusationMadeNotifier.notifyAll(
                AccusationMade {state, player, *result});
            if (*result == AccusationOutcome::ELIMINATED) {
                verifyCardConservation(state);
                if (state.turnIndex != turnIndex) {
                    impl->notifyTurnStarted();
                }
            }
            impl->notifyEndedIfNeeded();
            impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            return result;
        });
}

Result<> GameSession::endTurn(const Uuid& player)
{
    return impl->execute(
        "end turn",
        [this, &player]() -> Result<>
        {
            auto& state = impl->state;
            auto result = Engine::endTurn(state, player);
            if (result) {
                impl->notifyTurnStarted();
                impl->stateUpdatedNotifier.notifyAll(StateUpdated {state});
            }
            return result;
        });
}

void GameSession::inspect(
    const std::function<void(const SessionState&)>& visitor) const
{
    const auto lock = std::lock_guard {impl->mutex};
    visitor(impl->state);
}

SessionState GameSession::getSnapshot() const
{
    const auto lock = std::lock_guard {impl->mutex};
    return impl->state;
}

const Uuid& GameSession::getUuid() const
{
    // The identifier never changes, so no locking is needed
    return impl->state.uuid;
}

bool GameSession::isAborted() const
{
    const auto lock = std::lock_guard {impl->mutex};
    return impl->aborted;
}

}
}

#include "main/ClueMain.hh"

#include "clue/Board.hh"
#include "clue/Card.hh"
#include "clue/CaseFile.hh"
#include "clue/UuidGenerator.hh"
#include "engine/GameSession.hh"
#include "engine/SessionRegistry.hh"
#include "main/ClueGame.hh"
#include "main/Commands.hh"
#include "main/Config.hh"
#include "main/PlayerControl.hh"
#include "messaging/CardJsonSerializer.hh"
#include "messaging/EndpointIterator.hh"
#include "messaging/FunctionMessageHandler.hh"
#include "messaging/Identity.hh"
#include "messaging/JsonSerializer.hh"
#include "messaging/JsonSerializerUtility.hh"
#include "messaging/LocationJsonSerializer.hh"
#include "messaging/MessageLoop.hh"
#include "messaging/MessageQueue.hh"
#include "messaging/PollingCallbackScheduler.hh"
#include "messaging/SessionJsonSerializer.hh"
#include "messaging/UuidJsonSerializer.hh"
#include "Logging.hh"

#include <boost/uuid/uuid_io.hpp>

#include <cassert>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace Clue {
namespace Main {

using Engine::GameSession;
using Engine::SessionError;
using Messaging::failure;
using Messaging::Identity;
using Messaging::JsonSerializer;
using Messaging::makeMessageHandler;
using Messaging::Reply;
using Messaging::ReplyFailure;
using Messaging::success;

namespace {

bool isValidUuidArg(const Uuid& uuid)
{
    return !uuid.is_nil();
}

bool isValidUuidArg(const std::optional<Uuid>& uuid)
{
    return !uuid || isValidUuidArg(*uuid);
}

Blob errorSuffix(const SessionError error)
{
    return stringToBlob(
        ":" + Engine::SESSION_ERROR_TO_STRING_MAP.left.at(error));
}

using namespace std::string_view_literals;
const auto VERSION = "0.1"sv;
const auto CLIENT_ROLE = "client"sv;

using namespace BlobLiterals;
const auto UNKNOWN_SUFFIX = ":UNK"_B;

}

class ClueMain::Impl {
public:

    Impl(Messaging::MessageContext& context, Config config);

    void run();

private:

    Reply<> hello(
        const Identity& identity, const std::string& version,
        const std::string& role);
    Reply<Uuid> game(
        const Identity& identity, const std::optional<Uuid>& gameUuid);
    Reply<Uuid, Uuid, Suspect> join(
        const Identity& identity, const Uuid& gameUuid,
        const std::optional<Uuid>& playerUuid,
        const std::optional<Suspect>& character);
    Reply<> leave(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid);
    Reply<GameState, ClueGame::Counter> get(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid,
        const std::optional<std::vector<std::string>>& keys);
    Reply<> startGame(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid);
    Reply<> move(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid, const Location& location);
    Reply<Engine::SuggestionOutcome> suggest(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid, Suspect suspect, Weapon weapon);
    Reply<> disprove(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid, const Card& card);
    Reply<Engine::AccusationOutcome> accuse(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid, Suspect suspect, Weapon weapon, Room room);
    Reply<> endTurn(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid);

    template<typename ReplyType, typename Operation>
    ReplyType internalPerform(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid, Operation&& operation);

    template<typename ReplyType, typename Operation>
    ReplyType internalRun(const Uuid& gameUuid, Operation&& operation);

    std::optional<ReplyFailure> internalCheckArgs(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid);
    std::optional<ReplyFailure> internalCheckAccess(
        const Identity& identity, const Uuid& gameUuid,
        const Uuid& playerUuid);
    Engine::Result<std::shared_ptr<GameSession>> internalGetSession(
        const Uuid& gameUuid);
    ClueGame* internalCreateGame(const std::optional<Uuid>& gameUuid);

    const Config config;
    Engine::SessionRegistry registry;
    PlayerControl playerControl;
    std::set<Identity> clients;
    Messaging::SharedSocket eventSocket;
    Messaging::MessageQueue messageQueue;
    Messaging::MessageLoop messageLoop;
    std::shared_ptr<Messaging::PollingCallbackScheduler> callbackScheduler;
    std::map<Uuid, ClueGame> games;
};

ClueMain::Impl::Impl(Messaging::MessageContext& context, Config config) :
    config {std::move(config)},
    registry {this->config.getSessionOptions()},
    eventSocket {
        Messaging::makeSharedSocket(context, Messaging::SocketType::pub)},
    messageQueue {
        {
            stringToBlob(HELLO_COMMAND),
            makeMessageHandler(
                *this, &Impl::hello, JsonSerializer {},
                std::tuple {VERSION_COMMAND, ROLE_COMMAND})
        },
        {
            stringToBlob(GAME_COMMAND),
            makeMessageHandler(
                *this, &Impl::game, JsonSerializer {},
                std::tuple {GAME_COMMAND},
                std::tuple {GAME_COMMAND})
        },
        {
            stringToBlob(JOIN_COMMAND),
            makeMessageHandler(
                *this, &Impl::join, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND, CHARACTER_COMMAND},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND, CHARACTER_COMMAND})
        },
        {
            stringToBlob(LEAVE_COMMAND),
            makeMessageHandler(
                *this, &Impl::leave, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND})
        },
        {
            stringToBlob(GET_COMMAND),
            makeMessageHandler(
                *this, &Impl::get, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND, GET_COMMAND},
                std::tuple {GET_COMMAND, COUNTER_COMMAND})
        },
        {
            stringToBlob(START_GAME_COMMAND),
            makeMessageHandler(
                *this, &Impl::startGame, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND})
        },
        {
            stringToBlob(MOVE_COMMAND),
            makeMessageHandler(
                *this, &Impl::move, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND, LOCATION_COMMAND})
        },
        {
            stringToBlob(SUGGEST_COMMAND),
            makeMessageHandler(
                *this, &Impl::suggest, JsonSerializer {},
                std::tuple {
                    GAME_COMMAND, PLAYER_COMMAND, SUSPECT_COMMAND,
                    WEAPON_COMMAND},
                std::tuple {OUTCOME_COMMAND})
        },
        {
            stringToBlob(DISPROVE_COMMAND),
            makeMessageHandler(
                *this, &Impl::disprove, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND, CARD_COMMAND})
        },
        {
            stringToBlob(ACCUSE_COMMAND),
            makeMessageHandler(
                *this, &Impl::accuse, JsonSerializer {},
                std::tuple {
                    GAME_COMMAND, PLAYER_COMMAND, SUSPECT_COMMAND,
                    WEAPON_COMMAND, ROOM_COMMAND},
                std::tuple {OUTCOME_COMMAND})
        },
        {
            stringToBlob(END_TURN_COMMAND),
            makeMessageHandler(
                *this, &Impl::endTurn, JsonSerializer {},
                std::tuple {GAME_COMMAND, PLAYER_COMMAND})
        },
    },
    messageLoop {},
    callbackScheduler {
        std::make_shared<Messaging::PollingCallbackScheduler>(context)}
{
    auto endpointIterator = this->config.getEndpointIterator();
    auto controlSocket = Messaging::makeSharedSocket(
        context, Messaging::SocketType::router);
    controlSocket->set(zmq::sockopt::router_handover, true);
    Messaging::bindSocket(*controlSocket, *endpointIterator++);
    Messaging::bindSocket(*eventSocket, *endpointIterator++);
    for (const auto& uuid : this->config.getGameUuids()) {
        if (!internalCreateGame(uuid)) {
            log(LogLevel::WARNING, "Duplicate game in configuration: %s", uuid);
        }
    }
    messageLoop.addPollable(
        callbackScheduler->getSocket(),
        [callbackScheduler = this->callbackScheduler](auto& socket)
        {
            assert(callbackScheduler);
            (*callbackScheduler)(socket);
        });
    messageLoop.addPollable(
        std::move(controlSocket),
        [&queue = this->messageQueue](auto& socket) { queue(socket); });
}

void ClueMain::Impl::run()
{
    messageLoop.run();
}

Reply<> ClueMain::Impl::hello(
    const Identity& identity, const std::string& version,
    const std::string& role)
{
    log(LogLevel::DEBUG, "Hello command from %s. Version: %s. Role: %s",
        identity, version, role);
    if (version != VERSION || role != CLIENT_ROLE) {
        return failure();
    }
    log(LogLevel::DEBUG, "Client accepted: %s", identity);
    clients.insert(identity);
    return success();
}

Reply<Uuid> ClueMain::Impl::game(
    const Identity& identity, const std::optional<Uuid>& gameUuid)
{
    log(LogLevel::DEBUG, "Game command from %s. Game: %s", identity, gameUuid);
    if (clients.find(identity) == clients.end()) {
        return failure(UNKNOWN_SUFFIX);
    }
    if (!isValidUuidArg(gameUuid)) {
        return failure();
    }
    if (const auto game = internalCreateGame(gameUuid)) {
        return success(game->getUuid());
    }
    return failure();
}

Reply<Uuid, Uuid, Suspect> ClueMain::Impl::join(
    const Identity& identity, const Uuid& gameUuid,
    const std::optional<Uuid>& playerUuid,
    const std::optional<Suspect>& character)
{
    log(LogLevel::DEBUG,
        "Join command from %s. Game: %s. Player: %s. Character: %s",
        identity, gameUuid, playerUuid, character);
    if (!isValidUuidArg(playerUuid)) {
        return failure();
    }
    const auto player_uuid = playerUuid ? *playerUuid : generateUuid();
    if (auto failed = internalCheckArgs(identity, gameUuid, player_uuid)) {
        return std::move(*failed);
    }
    if (!playerControl.isAvailable(identity, player_uuid)) {
        log(LogLevel::DEBUG, "Player %s is controlled by another client",
            player_uuid);
        return failure();
    }
    return internalRun<Reply<Uuid, Uuid, Suspect>>(
        gameUuid,
        [&](GameSession& session)
            -> Engine::Result<std::tuple<Uuid, Uuid, Suspect>>
        {
            const auto result = session.join(player_uuid, character);
            if (!result) {
                return *result.getError();
            }
            [[maybe_unused]] const auto claimed =
                playerControl.claimPlayer(identity, player_uuid);
            assert(claimed);
            return std::tuple {gameUuid, player_uuid, result->character};
        });
}

Reply<> ClueMain::Impl::leave(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid)
{
    log(LogLevel::DEBUG, "Leave command from %s. Game: %s. Player: %s",
        identity, gameUuid, playerUuid);
    return internalPerform<Reply<>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session) { return session.leave(playerUuid); });
}

Reply<GameState, ClueGame::Counter> ClueMain::Impl::get(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    const std::optional<std::vector<std::string>>& keys)
{
    log(LogLevel::DEBUG, "Get command from %s. Game: %s. Player: %s",
        identity, gameUuid, playerUuid);
    if (auto failed = internalCheckAccess(identity, gameUuid, playerUuid)) {
        return std::move(*failed);
    }
    if (const auto session = internalGetSession(gameUuid); !session) {
        return failure(errorSuffix(*session.getError()));
    }
    const auto iter = games.find(gameUuid);
    if (iter == games.end()) {
        return failure(errorSuffix(SessionError::SESSION_NOT_FOUND));
    }
    const auto& game = iter->second;
    return success(game.getState(playerUuid, keys), game.getCounter());
}

Reply<> ClueMain::Impl::startGame(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid)
{
    log(LogLevel::DEBUG, "Start game command from %s. Game: %s. Player: %s",
        identity, gameUuid, playerUuid);
    return internalPerform<Reply<>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session) { return session.startGame(playerUuid); });
}

Reply<> ClueMain::Impl::move(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    const Location& location)
{
    log(LogLevel::DEBUG,
        "Move command from %s. Game: %s. Player: %s. Location: %s",
        identity, gameUuid, playerUuid, location);
    return internalPerform<Reply<>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session)
        {
            return session.move(playerUuid, location);
        });
}

Reply<Engine::SuggestionOutcome> ClueMain::Impl::suggest(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    const Suspect suspect, const Weapon weapon)
{
    log(LogLevel::DEBUG,
        "Suggest command from %s. Game: %s. Player: %s. Suggestion: %s, %s",
        identity, gameUuid, playerUuid, suspect, weapon);
    return internalPerform<Reply<Engine::SuggestionOutcome>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session)
        {
            return session.suggest(playerUuid, suspect, weapon);
        });
}

Reply<> ClueMain::Impl::disprove(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    const Card& card)
{
    log(LogLevel::DEBUG,
        "Disprove command from %s. Game: %s. Player: %s. Card: %s",
        identity, gameUuid, playerUuid, card);
    return internalPerform<Reply<>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session)
        {
            return session.disprove(playerUuid, card);
        });
}

Reply<Engine::AccusationOutcome> ClueMain::Impl::accuse(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    const Suspect suspect, const Weapon weapon, const Room room)
{
    log(LogLevel::DEBUG, "Accuse command from %s. Game: %s. Player: %s",
        identity, gameUuid, playerUuid);
    return internalPerform<Reply<Engine::AccusationOutcome>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session)
        {
            return session.accuse(
                playerUuid, CaseFile {suspect, weapon, room});
        });
}

Reply<> ClueMain::Impl::endTurn(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid)
{
    log(LogLevel::DEBUG, "End turn command from %s. Game: %s. Player: %s",
        identity, gameUuid, playerUuid);
    return internalPerform<Reply<>>(
        identity, gameUuid, playerUuid,
        [&](GameSession& session) { return session.endTurn(playerUuid); });
}

template<typename ReplyType, typename Operation>
ReplyType ClueMain::Impl::internalPerform(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid,
    Operation&& operation)
{
    if (auto failed = internalCheckAccess(identity, gameUuid, playerUuid)) {
        return std::move(*failed);
    }
    return internalRun<ReplyType>(
        gameUuid, std::forward<Operation>(operation));
}

template<typename ReplyType, typename Operation>
ReplyType ClueMain::Impl::internalRun(
    const Uuid& gameUuid, Operation&& operation)
{
    const auto session = internalGetSession(gameUuid);
    if (!session) {
        return failure(errorSuffix(*session.getError()));
    }
    const auto result = operation(**session);
    if (!result) {
        const auto error = *result.getError();
        log(LogLevel::DEBUG, "Command failed in game %s: %s", gameUuid, error);
        if (error == SessionError::SESSION_ABORTED) {
            registry.removeSession(gameUuid);
            games.erase(gameUuid);
        }
        return failure(errorSuffix(error));
    }
    using Types = typename ReplyType::Types;
    if constexpr (std::tuple_size_v<Types> == 0) {
        return success();
    } else if constexpr (std::tuple_size_v<Types> == 1) {
        return success(*result);
    } else {
        return std::apply(
            [](const auto&... values) { return success(values...); },
            *result);
    }
}

std::optional<ReplyFailure> ClueMain::Impl::internalCheckArgs(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid)
{
    if (clients.find(identity) == clients.end()) {
        return failure(UNKNOWN_SUFFIX);
    }
    if (!isValidUuidArg(gameUuid) || !isValidUuidArg(playerUuid)) {
        return failure();
    }
    return std::nullopt;
}

std::optional<ReplyFailure> ClueMain::Impl::internalCheckAccess(
    const Identity& identity, const Uuid& gameUuid, const Uuid& playerUuid)
{
    if (auto failed = internalCheckArgs(identity, gameUuid, playerUuid)) {
        return failed;
    }
    if (!playerControl.isControlledBy(identity, playerUuid)) {
        log(LogLevel::DEBUG, "Player %s is not controlled by %s",
            playerUuid, identity);
        return failure();
    }
    return std::nullopt;
}

Engine::Result<std::shared_ptr<GameSession>>
ClueMain::Impl::internalGetSession(const Uuid& gameUuid)
{
    auto ret = registry.getSession(gameUuid);
    if (!ret) {
        games.erase(gameUuid);
    }
    return ret;
}

ClueGame* ClueMain::Impl::internalCreateGame(
    const std::optional<Uuid>& gameUuid)
{
    auto session = registry.createSession(gameUuid);
    if (!session) {
        return nullptr;
    }
    const auto uuid = session->getUuid();
    const auto [iter, inserted] = games.emplace(
        std::piecewise_construct,
        std::forward_as_tuple(uuid),
        std::forward_as_tuple(
            std::move(session), eventSocket, callbackScheduler));
    assert(inserted);
    return &iter->second;
}

ClueMain::ClueMain(Messaging::MessageContext& context, Config config) :
    impl {std::make_unique<Impl>(context, std::move(config))}
{
}

ClueMain::~ClueMain() = default;

void ClueMain::run()
{
    assert(impl);
    impl->run();
}

}
}

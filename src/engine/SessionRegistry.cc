#include "engine/SessionRegistry.hh"

#include "clue/UuidGenerator.hh"
#include "Logging.hh"

#include <boost/uuid/uuid_io.hpp>

#include <utility>

namespace Clue {
namespace Engine {

SessionRegistry::SessionRegistry(GameSession::Options options) :
    options {std::move(options)}
{
}

std::shared_ptr<GameSession> SessionRegistry::createSession(
    const std::optional<Uuid>& uuid)
{
    const auto game = uuid ? *uuid : generateUuid();
    const auto lock = std::lock_guard {mutex};
    const auto [iter, inserted] = sessions.try_emplace(game);
    if (!inserted) {
        log(LogLevel::DEBUG, "Session %s already exists", game);
        return nullptr;
    }
    iter->second = std::make_shared<GameSession>(game, options);
    log(LogLevel::INFO, "Session %s created", game);
    return iter->second;
}

Result<std::shared_ptr<GameSession>> SessionRegistry::getSession(
    const Uuid& uuid)
{
    const auto lock = std::lock_guard {mutex};
    const auto iter = sessions.find(uuid);
    if (iter == sessions.end()) {
        return SessionError::SESSION_NOT_FOUND;
    }
    if (iter->second->isAborted()) {
        log(LogLevel::WARNING, "Removing aborted session %s", uuid);
        sessions.erase(iter);
        return SessionError::SESSION_NOT_FOUND;
    }
    return iter->second;
}

bool SessionRegistry::removeSession(const Uuid& uuid)
{
    const auto lock = std::lock_guard {mutex};
    if (sessions.erase(uuid) > 0) {
        log(LogLevel::INFO, "Session %s removed", uuid);
        return true;
    }
    return false;
}

std::vector<Uuid> SessionRegistry::getSessionUuids() const
{
    const auto lock = std::lock_guard {mutex};
    auto ret = std::vector<Uuid> {};
    ret.reserve(sessions.size());
    for (const auto& entry : sessions) {
        ret.push_back(entry.first);
    }
    return ret;
}

std::size_t SessionRegistry::getNumberOfSessions() const
{
    const auto lock = std::lock_guard {mutex};
    return sessions.size();
}

}
}

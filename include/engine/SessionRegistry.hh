/** \file
 *
 * \brief Definition of Clue::Engine::SessionRegistry class
 */

#ifndef ENGINE_SESSIONREGISTRY_HH_
#define ENGINE_SESSIONREGISTRY_HH_

#include "clue/Uuid.hh"
#include "engine/GameSession.hh"
#include "engine/SessionError.hh"

#include <boost/core/noncopyable.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Clue {
namespace Engine {

/** \brief Mapping from game identifiers to session actors
 *
 * The registry owns the sessions. The handles it gives out are meant to be
 * used for the duration of one operation. A session is serialized by its own
 * lock, and the registry lock only protects the mapping, so operations on
 * different sessions never block each other.
 *
 * Aborted sessions are removed the next time they are looked up.
 */
class SessionRegistry : private boost::noncopyable {
public:

    /** \brief Create new registry
     *
     * \param options the options given to each session created
     */
    explicit SessionRegistry(GameSession::Options options = {});

    /** \brief Create new session
     *
     * \param uuid the identifier of the session, or none to generate one
     *
     * \return the new session, or nullptr if a session with \p uuid already
     * exists
     */
    std::shared_ptr<GameSession> createSession(
        const std::optional<Uuid>& uuid = std::nullopt);

    /** \brief Look up a session
     *
     * \param uuid the identifier of the session
     *
     * \return the session, or SessionError::SESSION_NOT_FOUND if there is no
     * session with \p uuid, or it has been aborted
     */
    Result<std::shared_ptr<GameSession>> getSession(const Uuid& uuid);

    /** \brief Remove a session
     *
     * \param uuid the identifier of the session
     *
     * \return true if the session existed, false otherwise
     */
    bool removeSession(const Uuid& uuid);

    /** \brief Get the identifiers of the sessions in the registry
     */
    std::vector<Uuid> getSessionUuids() const;

    /** \brief Get the number of sessions in the registry
     */
    std::size_t getNumberOfSessions() const;

private:

    const GameSession::Options options;
    mutable std::mutex mutex;
    std::map<Uuid, std::shared_ptr<GameSession>> sessions;
};

}
}

#endif // ENGINE_SESSIONREGISTRY_HH_

/** \file
 *
 * \brief Definition of Clue::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "clue/Uuid.hh"
#include "engine/GameSession.hh"

#include <iosfwd>
#include <memory>
#include <string_view>
#include <vector>

namespace Clue {

namespace Messaging {
class EndpointIterator;
}

namespace Main {

/** \brief Configuration of the server
 *
 * The configuration is a Lua script. The following global variables are
 * recognized, all of them optional:
 *
 * \code{.lua}
 * bind_address = "*"            -- interface the sockets are bound to
 * bind_base_port = 5555         -- control port, the event port is the next
 * disprove_timeout = 30         -- seconds a disprover has to choose a card
 * legacy_free_movement = false  -- allow moving in the lobby
 * \endcode
 *
 * In addition the script may call the function \c game to create a game
 * when the server starts:
 *
 * \code{.lua}
 * game { uuid = "0f24b8a2-4d6e-4b3b-9a0e-6c2f6b1f8f11" }
 * \endcode
 */
class Config {
public:

    /** \brief Vector of identifiers of preconfigured games
     */
    using GameUuidVector = std::vector<Uuid>;

    /** \brief Create default configuration
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The stream is read until EOF, and the contents are executed as Lua
     * script.
     *
     * \throw std::runtime_error if reading the stream or running the script
     * fails
     */
    explicit Config(std::istream& in);

    Config(Config&&);

    ~Config();

    Config& operator=(Config&&);

    /** \brief Get iterator generating the control and event endpoints
     */
    Messaging::EndpointIterator getEndpointIterator() const;

    /** \brief Get the options of the sessions
     */
    Engine::GameSession::Options getSessionOptions() const;

    /** \brief Get the identifiers of the preconfigured games
     */
    const GameUuidVector& getGameUuids() const;

private:

    struct Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * - If \p path is empty, the default configuration is returned
 * - If \p path is hyphen (“-”), the configuration is read from stdin
 * - Otherwise the configuration is read from the file at \p path
 *
 * \param path the path of the configuration file
 *
 * \return the configuration
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_

/** \file
 *
 * \brief Definition of Clue::Main::ClueMain
 */

#ifndef MAIN_CLUEMAIN_HH_
#define MAIN_CLUEMAIN_HH_

#include "messaging/Sockets.hh"

#include <memory>

namespace Clue {

/** \brief The glue code and high level logic for the Clue server
 */
namespace Main {

class Config;

/** \brief Set up and run the Clue server
 *
 * ClueMain binds the control socket and the event socket, registers the
 * handlers of the \ref clueprotocol commands and hosts the games created by
 * the clients.
 */
class ClueMain {
public:

    /** \brief Create Clue server
     *
     * \param context the ZeroMQ context of the server
     * \param config the configuration of the server
     */
    ClueMain(Messaging::MessageContext& context, Config config);

    ~ClueMain();

    /** \brief Start receiving and handling messages
     *
     * The method returns when the server receives SIGINT or SIGTERM.
     */
    void run();

private:

    class Impl;
    const std::unique_ptr<Impl> impl;
};

}
}

#endif // MAIN_CLUEMAIN_HH_

/** \file
 *
 * \brief Definition of game state helpers
 */

#ifndef MAIN_GAMESTATEHELPER_HH_
#define MAIN_GAMESTATEHELPER_HH_

#include "clue/Uuid.hh"

#include <nlohmann/json.hpp>

namespace Clue {

namespace Engine {
struct SessionState;
}

namespace Main {

/** \brief Representation of the state of the game
 */
using GameState = nlohmann::json;

/** \brief Create the pubstate subobject of a session
 *
 * The pubstate contains everything that is visible to every player. The case
 * file is included only after a correct accusation.
 *
 * \param state the session state
 *
 * \return the pubstate object
 */
GameState getPubstate(const Engine::SessionState& state);

/** \brief Emplace the pubstate subobject of a session to \p out
 *
 * This implements creating the pubstate subobject in the \ref
 * clueprotocolcontrolget command
 *
 * \param state the session state
 * \param out a JSON object where the pubstate subobject is emplaced
 */
void emplacePubstate(const Engine::SessionState& state, GameState& out);

/** \brief Emplace the privstate subobject of a session to \p out
 *
 * This implements creating the privstate subobject in the \ref
 * clueprotocolcontrolget command. The privstate of a player who has not
 * joined is an empty object.
 *
 * \param state the session state
 * \param player the player whose viewpoint is applied
 * \param out a JSON object where the privstate subobject is emplaced
 */
void emplacePrivstate(
    const Engine::SessionState& state, const Uuid& player, GameState& out);

/** \brief Emplace the self subobject of a session to \p out
 *
 * This implements creating the self subobject in the \ref
 * clueprotocolcontrolget command
 *
 * \param state the session state
 * \param player the player whose viewpoint is applied
 * \param out a JSON object where the self subobject is emplaced
 */
void emplaceSelf(
    const Engine::SessionState& state, const Uuid& player, GameState& out);

}
}

#endif // MAIN_GAMESTATEHELPER_HH_

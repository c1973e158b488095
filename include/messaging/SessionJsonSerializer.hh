/** \file
 *
 * \brief Definition of JSON serializers for session values
 *
 * \page jsonsession Session value JSON representation
 *
 * Clue::Participation, Clue::Engine::SessionStatus,
 * Clue::Engine::AccusationOutcome and Clue::Engine::SessionError are
 * represented by JSON strings:
 *
 * - participation: "active", "eliminated", "disconnected",
 *   "disconnected_eliminated"
 * - session status: "lobby", "inprogress", "ended"
 * - accusation outcome: "win", "eliminated", "tie"
 * - session error: the name used in the ERR:&lt;kind&gt; reply status, for
 *   example "NotYourTurn"
 *
 * A Clue::Engine::SuggestionOutcome is represented by a JSON object whose
 * "result" is one of the following:
 *
 * \code{.json}
 * { "result": "revealed", "disprover": <uuid>, "card": <card> }
 * { "result": "norefute" }
 * { "result": "pending", "disprover": <uuid> }
 * \endcode
 *
 * See \ref jsoncard for the representation of the card.
 */

#ifndef MESSAGING_SESSIONJSONSERIALIZER_HH_
#define MESSAGING_SESSIONJSONSERIALIZER_HH_

#include "clue/Player.hh"
#include "engine/SessionError.hh"
#include "engine/SessionState.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Clue {

/** \brief Convert Participation to JSON
 */
void to_json(nlohmann::json&, Participation);

/** \brief Convert JSON to Participation
 */
void from_json(const nlohmann::json&, Participation&);

namespace Engine {

/** \brief Key for the kind of a suggestion outcome
 *
 * \sa \ref jsonsession
 */
extern const std::string OUTCOME_RESULT_KEY;

/** \brief Key for the disprover of a suggestion outcome
 *
 * \sa \ref jsonsession
 */
extern const std::string OUTCOME_DISPROVER_KEY;

/** \brief Key for the revealed card of a suggestion outcome
 *
 * \sa \ref jsonsession
 */
extern const std::string OUTCOME_CARD_KEY;

/** \brief Convert SessionStatus to JSON
 */
void to_json(nlohmann::json&, SessionStatus);

/** \brief Convert JSON to SessionStatus
 */
void from_json(const nlohmann::json&, SessionStatus&);

/** \brief Convert AccusationOutcome to JSON
 */
void to_json(nlohmann::json&, AccusationOutcome);

/** \brief Convert JSON to AccusationOutcome
 */
void from_json(const nlohmann::json&, AccusationOutcome&);

/** \brief Convert SessionError to JSON
 */
void to_json(nlohmann::json&, SessionError);

/** \brief Convert JSON to SessionError
 */
void from_json(const nlohmann::json&, SessionError&);

/** \brief Convert SuggestionOutcome to JSON
 */
void to_json(nlohmann::json&, const SuggestionOutcome&);

}
}

#endif // MESSAGING_SESSIONJSONSERIALIZER_HH_

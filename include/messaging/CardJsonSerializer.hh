/** \file
 *
 * \brief Definition of JSON serializers for cards and case files
 *
 * \page jsoncard Card JSON representation
 *
 * A Clue::Suspect, Clue::Weapon or Clue::Room is represented by its name as a
 * JSON string: "miss_scarlet", "professor_plum", "mrs_peacock", "mr_green",
 * "mrs_white", "colonel_mustard" for suspects, "rope", "lead_pipe", "knife",
 * "wrench", "candlestick", "revolver" for weapons and "study", "hall",
 * "lounge", "library", "billiard_room", "dining_room", "conservatory",
 * "ballroom", "kitchen" for rooms.
 *
 * A Clue::Card is represented by a JSON object:
 *
 * \code{.json}
 * { "kind": <kind>, "name": <name> }
 * \endcode
 *
 * - &lt;kind&gt; is one of "suspect", "weapon", "room"
 * - &lt;name&gt; is the name of the card as above
 *
 * A Clue::CaseFile is represented by a JSON object:
 *
 * \code{.json}
 * { "suspect": <suspect>, "weapon": <weapon>, "room": <room> }
 * \endcode
 */

#ifndef MESSAGING_CARDJSONSERIALIZER_HH_
#define MESSAGING_CARDJSONSERIALIZER_HH_

#include "clue/Card.hh"

#include <nlohmann/json.hpp>

#include <string>

namespace Clue {

struct CaseFile;

/** \brief Key for the kind of a card
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_KIND_KEY;

/** \brief Key for the name of a card
 *
 * \sa \ref jsoncard
 */
extern const std::string CARD_NAME_KEY;

/** \brief Key for CaseFile::suspect
 *
 * \sa \ref jsoncard
 */
extern const std::string CASE_FILE_SUSPECT_KEY;

/** \brief Key for CaseFile::weapon
 *
 * \sa \ref jsoncard
 */
extern const std::string CASE_FILE_WEAPON_KEY;

/** \brief Key for CaseFile::room
 *
 * \sa \ref jsoncard
 */
extern const std::string CASE_FILE_ROOM_KEY;

/** \brief Convert Suspect to JSON
 */
void to_json(nlohmann::json&, Suspect);

/** \brief Convert JSON to Suspect
 */
void from_json(const nlohmann::json&, Suspect&);

/** \brief Convert Weapon to JSON
 */
void to_json(nlohmann::json&, Weapon);

/** \brief Convert JSON to Weapon
 */
void from_json(const nlohmann::json&, Weapon&);

/** \brief Convert Room to JSON
 */
void to_json(nlohmann::json&, Room);

/** \brief Convert JSON to Room
 */
void from_json(const nlohmann::json&, Room&);

/** \brief Convert Card to JSON
 */
void to_json(nlohmann::json&, const Card&);

/** \brief Convert JSON to Card
 */
void from_json(const nlohmann::json&, Card&);

/** \brief Convert CaseFile to JSON
 */
void to_json(nlohmann::json&, const CaseFile&);

/** \brief Convert JSON to CaseFile
 */
void from_json(const nlohmann::json&, CaseFile&);

}

#endif // MESSAGING_CARDJSONSERIALIZER_HH_

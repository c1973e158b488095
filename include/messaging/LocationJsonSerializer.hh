/** \file
 *
 * \brief Definition of JSON serializer for board locations
 *
 * \page jsonlocation Location JSON representation
 *
 * A Clue::Location is represented by a JSON string. A room is represented by
 * its name as in \ref jsoncard, and a hallway by one of "hallway1" to
 * "hallway12".
 */

#ifndef MESSAGING_LOCATIONJSONSERIALIZER_HH_
#define MESSAGING_LOCATIONJSONSERIALIZER_HH_

#include "clue/Board.hh"

#include <nlohmann/json.hpp>

namespace Clue {

/** \brief Convert Hallway to JSON
 */
void to_json(nlohmann::json&, Hallway);

/** \brief Convert JSON to Hallway
 */
void from_json(const nlohmann::json&, Hallway&);

/** \brief Convert Location to JSON
 */
void to_json(nlohmann::json&, const Location&);

/** \brief Convert JSON to Location
 */
void from_json(const nlohmann::json&, Location&);

}

#endif // MESSAGING_LOCATIONJSONSERIALIZER_HH_

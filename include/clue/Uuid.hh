/** \file
 *
 * \brief Definition of Clue::Uuid
 */

#ifndef UUID_HH_
#define UUID_HH_

#include <boost/uuid/uuid.hpp>

namespace Clue {

/** \brief The preferred UUID implementation of the project
 *
 * Games and players are identified by UUIDs.
 */
using Uuid = boost::uuids::uuid;

}

#endif // UUID_HH_

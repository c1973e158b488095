/** \file
 *
 * \brief Definition of UUID generator utilities
 */

#ifndef UUIDGENERATOR_HH_
#define UUIDGENERATOR_HH_

#include "clue/Random.hh"
#include "clue/Uuid.hh"

#include <boost/uuid/random_generator.hpp>

namespace Clue {

/** \brief The preferred UUID generator of the project
 */
using UuidGenerator = boost::uuids::basic_random_generator<Rng>;

/** \brief Generate new random UUID
 *
 * The UUID is generated using a generator backed by getRng() of the calling
 * thread.
 *
 * \return A newly created UUID
 */
Uuid generateUuid();

}

#endif // UUIDGENERATOR_HH_

/** \file
 *
 * \brief The common random number generator
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <random>

namespace Clue {

/** \brief The preferred random number generator of the project
 */
using Rng = std::mt19937;

/** \brief Get reference to the random number generator of the calling thread
 *
 * Each thread has its own generator seeded from the random source of the
 * operating system, so sessions running in different threads never share
 * generator state.
 *
 * \return Reference to the generator of the calling thread
 */
Rng& getRng();

}

#endif // RANDOM_HH_

/** \file
 *
 * \brief The random number generator used to generate UUIDs
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <random>

namespace TypedUuid {

/** \brief The random number generator of the TypedUuid library
 */
using Rng = std::mt19937;

/** \brief Get reference to the random number generator of the calling thread
 *
 * Each thread has its own generator. When the thread first uses it, its whole
 * state is seeded from the OS random number source.
 *
 * \return Reference to the random number generator of the calling thread
 */
Rng& getRng();

/** \brief Reseed the random number generator of the calling thread
 *
 * Intended for reproducible runs. Other threads are not affected.
 *
 * \param seed the new seed
 */
void seedRng(Rng::result_type seed);

}

#endif // RANDOM_HH_

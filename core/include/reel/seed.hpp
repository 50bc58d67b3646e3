#pragma once

/**
 * @file seed.hpp
 * @brief Loader for the bundled sample catalog (5 actors, 5 movies,
 *        6 roles).
 */

#include "reel/error.hpp"

namespace reel {

class Catalog;

/**
 * @brief Inserts the sample actors, movies and roles into `catalog`.
 *
 * Roles are resolved through the ids returned by the inserts, so the
 * loader also works on a catalog that already holds records. Stops at and
 * returns the first error.
 */
Result<void> seed_sample_catalog(Catalog &catalog);

} // namespace reel

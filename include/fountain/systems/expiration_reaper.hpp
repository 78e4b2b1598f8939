/**
 * @file expiration_reaper.hpp
 * @brief System for removing particles whose lifetime has elapsed
 *
 * Required components:
 * - Lifetime (to read)
 */

#ifndef FOUNTAIN_EXPIRATION_REAPER_HPP
#define FOUNTAIN_EXPIRATION_REAPER_HPP

#include "fountain/core/particle_store.hpp"

namespace Systems {

/**
 * @class ExpirationReaper
 * @brief Destroys every particle with expireTime <= now.
 *
 * Removal is silent. A particle spawned earlier in the same tick is never
 * removed, because its expireTime is strictly later than its spawn time.
 */
class ExpirationReaper {
public:
    static void reap(double now, ParticleStore& store);
};

} // namespace Systems

#endif

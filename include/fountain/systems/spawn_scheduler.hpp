/**
 * @file spawn_scheduler.hpp
 * @brief Time-driven admission of particle batches
 *
 * Once per tick the scheduler compares the tick's timestamp with the stored
 * deadline. When the deadline has passed, a batch of particles is created
 * inside the spawn region and shot upward inside a cone.
 */

#ifndef FOUNTAIN_SPAWN_SCHEDULER_HPP
#define FOUNTAIN_SPAWN_SCHEDULER_HPP

#include <limits>
#include <random>

#include "fountain/core/config.hpp"
#include "fountain/core/particle_store.hpp"

namespace Systems {

/**
 * @brief Seedable random source used for spawn sampling.
 */
using RandomEngine = std::mt19937;

/**
 * @struct SchedulerState
 * @brief The scheduler's only state, persisted across ticks.
 *
 * nextSpawnDeadline starts at -infinity so that the first call admits a batch.
 * It is only ever assigned now + spawnInterval, hence never decreases.
 */
struct SchedulerState {
    double nextSpawnDeadline = -std::numeric_limits<double>::infinity();
};

/**
 * @class SpawnScheduler
 * @brief Creates a batch of particles whenever the spawn deadline has passed.
 */
class SpawnScheduler {
public:
    /**
     * @brief Admits one batch if now is past the deadline, otherwise does nothing.
     *
     * Each particle gets a velocity of length initialSpeed along
     * normalize(u * coneSpread, 1, w * coneSpread) with u, w uniform in [-1, 1],
     * and a position uniform in the spawn region. Afterwards the deadline is
     * set to now + spawnInterval. At most one batch is admitted per call.
     *
     * @param now Timestamp of the current tick in seconds
     * @param config Simulation parameters
     * @param state Scheduler deadline, updated when a batch is admitted
     * @param store Receives the new particles
     * @param rng Random source
     */
    static void maybeSpawn(double now,
                           const FountainConfig& config,
                           SchedulerState& state,
                           ParticleStore& store,
                           RandomEngine& rng);
};

} // namespace Systems

#endif

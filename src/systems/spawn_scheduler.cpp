/**
 * @file spawn_scheduler.cpp
 * @brief Implementation of the batch spawn scheduler
 */

#include "fountain/systems/spawn_scheduler.hpp"

#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"

namespace Systems {

void SpawnScheduler::maybeSpawn(double now,
                                const FountainConfig& config,
                                SchedulerState& state,
                                ParticleStore& store,
                                RandomEngine& rng) {
    if (now <= state.nextSpawnDeadline) {
        return;
    }

    PROFILE_SCOPE("SpawnScheduler");

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const auto& region = config.spawnRegion;

    for (int i = 0; i < config.batchSize; ++i) {
        // Direction inside the cone around +Y
        double const dx = ((unit(rng) * 2.0) - 1.0) * config.coneSpread;
        double const dz = ((unit(rng) * 2.0) - 1.0) * config.coneSpread;
        Vector3 const velocity = Vector3(dx, 1.0, dz).normalized() * config.initialSpeed;

        double const x = region.min.x + unit(rng) * (region.max.x - region.min.x);
        double const y = region.min.y + unit(rng) * (region.max.y - region.min.y);
        double const z = region.min.z + unit(rng) * (region.max.z - region.min.z);

        store.insert(Components::Position(x, y, z),
                     Components::Velocity(velocity),
                     Components::Lifetime{now, now + config.particleLifetime});
    }

    state.nextSpawnDeadline = now + config.spawnInterval;

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
        "SpawnScheduler: " << config.batchSize << " particles at t=" << now
        << ", next deadline " << state.nextSpawnDeadline << "\n");
}

} // namespace Systems

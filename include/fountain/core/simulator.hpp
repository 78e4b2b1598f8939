/**
 * @file simulator.hpp
 * @brief Runs the particle lifecycle one tick at a time.
 */

#pragma once

#include <cstddef>
#include <memory>

#include "fountain/core/config.hpp"
#include "fountain/core/particle_store.hpp"
#include "fountain/systems/physics_backend.hpp"
#include "fountain/systems/spawn_scheduler.hpp"

/**
 * @struct TickStats
 * @brief What the last tick did to the population.
 */
struct TickStats {
    std::size_t spawned = 0;
    std::size_t removedByPhysics = 0;  ///< Implicit removals of the delegated backend
    std::size_t expired = 0;
    std::size_t live = 0;
};

/**
 * @brief Builds the physics backend named by config.backend.
 *
 * The delegated backend gets a SphereWorld whose ground slab and
 * coefficients come from the config.
 */
std::unique_ptr<Systems::PhysicsBackend> createBackend(const FountainConfig& config);

/**
 * @class FountainSimulator
 * @brief Owns the particle store, the scheduler state, the random source and
 *        the physics backend, and runs the three steps in fixed order.
 *
 * The host supplies time: tick(now, dt) performs
 * SpawnScheduler::maybeSpawn, backend step, ExpirationReaper::reap.
 */
class FountainSimulator {
public:
    /**
     * @brief Validates the config and binds the backend to a fresh store.
     * @throws std::invalid_argument if the config is rejected
     */
    FountainSimulator(const FountainConfig& config,
                      std::unique_ptr<Systems::PhysicsBackend> backend);

    /**
     * @brief Convenience: backend chosen with createBackend(config).
     */
    explicit FountainSimulator(const FountainConfig& config);

    ~FountainSimulator();

    FountainSimulator(const FountainSimulator&) = delete;
    FountainSimulator& operator=(const FountainSimulator&) = delete;

    /**
     * @brief Runs one tick.
     * @param now Timestamp of this tick in seconds
     * @param dt Duration of this tick in seconds
     */
    void tick(double now, double dt);

    /**
     * @brief Removes every particle and rewinds the spawn deadline.
     */
    void reset();

    ParticleStore& getStore() { return store; }
    const ParticleStore& getStore() const { return store; }
    const FountainConfig& getConfig() const { return config; }
    const Systems::SchedulerState& getSchedulerState() const { return schedulerState; }
    Systems::PhysicsBackend& getBackend() { return *backend; }
    const Systems::PhysicsBackend& getBackend() const { return *backend; }
    const TickStats& getLastTick() const { return lastTick; }

private:
    FountainConfig config;
    ParticleStore store;
    Systems::SchedulerState schedulerState;
    Systems::RandomEngine rng;
    std::unique_ptr<Systems::PhysicsBackend> backend;
    TickStats lastTick;
};

/**
 * @file physics_backend.hpp
 * @brief Interface for the strategies that advance particle state each tick
 */

#pragma once

#include "fountain/core/config.hpp"
#include "fountain/core/particle_store.hpp"

namespace Systems {

/**
 * @class PhysicsBackend
 * @brief Base interface for all physics strategies
 *
 * A backend is chosen when the simulator is constructed and is the only
 * component allowed to change a particle's Position and Velocity.
 */
class PhysicsBackend {
public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~PhysicsBackend() = default;

    /**
     * @brief Binds the backend to a store before the first tick.
     *
     * Backends that mirror particles elsewhere hook the store's
     * construction and destruction signals here.
     */
    virtual void attach(ParticleStore& /*store*/) {}

    /**
     * @brief Releases whatever attach() set up.
     */
    virtual void detach(ParticleStore& /*store*/) {}

    /**
     * @brief Advances every live particle by one tick.
     *
     * @param dt Tick duration in seconds
     * @param config Simulation parameters
     * @param store Particles to advance
     */
    virtual void step(double dt, const FountainConfig& config, ParticleStore& store) = 0;

    /**
     * @brief Short name for logs and the viewer title
     */
    virtual const char* name() const = 0;
};

} // namespace Systems

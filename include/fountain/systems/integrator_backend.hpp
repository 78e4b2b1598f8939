/**
 * @file integrator_backend.hpp
 * @brief Built-in physics: gravity, movement and a ground plane bounce
 *
 * This backend handles:
 * - Uniform gravity applied to the velocity first (semi-implicit Euler)
 * - Movement by one velocity step per tick
 * - A single discrete contact with the ground plane per tick
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to modify)
 */

#ifndef FOUNTAIN_INTEGRATOR_BACKEND_HPP
#define FOUNTAIN_INTEGRATOR_BACKEND_HPP

#include "fountain/systems/physics_backend.hpp"

namespace Systems {

/**
 * @class IntegratorBackend
 * @brief Advances particles without an external engine.
 *
 * Velocity is expressed per tick: gravity is scaled by dt, while the
 * position advances by the whole velocity. When the predicted height drops
 * below the ground, the particle is clamped onto the plane, moved
 * horizontally by its pre-contact velocity, and only then damped and
 * reflected. There is no sub-stepping, so a very fast particle can pass
 * through the plane in one tick.
 */
class IntegratorBackend : public PhysicsBackend {
public:
    IntegratorBackend() = default;
    ~IntegratorBackend() override = default;

    void step(double dt, const FountainConfig& config, ParticleStore& store) override;

    const char* name() const override { return "internal"; }

    /**
     * @brief Advances a single particle; step() applies this to every particle.
     */
    static void integrate(double dt, const FountainConfig& config,
                          Components::Position& pos, Components::Velocity& vel);
};

} // namespace Systems

#endif

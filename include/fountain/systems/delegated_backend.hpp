/**
 * @file delegated_backend.hpp
 * @brief Physics strategy that hands particles to a rigid-body world
 *
 * This backend handles:
 * - Creating a dynamic sphere for every new particle
 * - Stepping the world and copying positions/velocities back
 * - Removing the body when its particle is destroyed
 *
 * Required components:
 * - Position, Velocity (overwritten from the world)
 * - Lifetime (construction signal marks a new particle)
 * - RigidBody (added by this backend)
 */

#ifndef FOUNTAIN_DELEGATED_BACKEND_HPP
#define FOUNTAIN_DELEGATED_BACKEND_HPP

#include <cstddef>
#include <memory>

#include "fountain/engine/rigid_body_world.hpp"
#include "fountain/systems/physics_backend.hpp"

namespace Systems {

/**
 * @class DelegatedBackend
 * @brief Mirrors particles as bodies of an IRigidBodyWorld.
 *
 * The world is authoritative for position and velocity. A body the world
 * stops reporting counts as an implicit removal and its particle is
 * destroyed. Bodies the world holds that no particle refers to are left
 * alone.
 */
class DelegatedBackend : public PhysicsBackend {
public:
    explicit DelegatedBackend(std::unique_ptr<Engine::IRigidBodyWorld> world);
    ~DelegatedBackend() override = default;

    void attach(ParticleStore& store) override;
    void detach(ParticleStore& store) override;
    void step(double dt, const FountainConfig& config, ParticleStore& store) override;

    const char* name() const override { return "delegated"; }

    Engine::IRigidBodyWorld& getWorld() { return *world; }
    const Engine::IRigidBodyWorld& getWorld() const { return *world; }

    /**
     * @brief Particles destroyed because the world lost their body (cumulative)
     */
    std::size_t getImplicitRemovals() const { return implicitRemovals; }

private:
    void onParticleCreated(entt::registry& registry, entt::entity entity);
    void onParticleDestroyed(entt::registry& registry, entt::entity entity);

    std::unique_ptr<Engine::IRigidBodyWorld> world;
    double bodyRadius = 0.0;
    std::size_t implicitRemovals = 0;
};

} // namespace Systems

#endif

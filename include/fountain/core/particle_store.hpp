/**
 * @file particle_store.hpp
 * @brief Storage for the live particle population.
 */

#pragma once

#include <cstddef>
#include <entt/entt.hpp>

#include "fountain/components/basic.hpp"

/**
 * @class ParticleStore
 * @brief Arena of particle records addressed by generation-checked handles.
 *
 * Each particle is an entity of the owned registry carrying Position,
 * Velocity and Lifetime. Handles are entt::entity values: their version bits
 * make a handle to a removed particle invalid even after its slot is reused.
 * The sphere shape is held once and shared by every particle.
 *
 * The store holds no behaviour. Particles are created by the spawn
 * scheduler, mutated by the physics backend and removed by the reaper.
 */
class ParticleStore {
public:
    explicit ParticleStore(double particleRadius);

    ParticleStore(const ParticleStore&) = delete;
    ParticleStore& operator=(const ParticleStore&) = delete;

    /**
     * @brief Adds a particle and returns its handle.
     *
     * Lifetime is emplaced last, so construction listeners on Lifetime see a
     * particle whose Position and Velocity are already set.
     */
    entt::entity insert(const Components::Position& position,
                        const Components::Velocity& velocity,
                        const Components::Lifetime& lifetime);

    /**
     * @brief Removes a particle.
     * @return false if the handle is stale or unknown
     */
    bool remove(entt::entity particle);

    bool contains(entt::entity particle) const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    /**
     * @brief Removes every particle (destruction listeners fire for each).
     */
    void clear();

    const Components::SphereShape& getShape() const { return shape; }

    /**
     * @brief Calls fn(entity, Position&, Velocity&, const Lifetime&) for every particle.
     */
    template <typename Func>
    void forEach(Func&& fn) {
        auto view = registry.view<Components::Position, Components::Velocity, Components::Lifetime>();
        for (auto &&[entity, pos, vel, life] : view.each()) {
            fn(entity, pos, vel, static_cast<const Components::Lifetime&>(life));
        }
    }

    /**
     * @brief Read-only iteration, e.g. for renderers.
     */
    template <typename Func>
    void forEach(Func&& fn) const {
        auto view = registry.view<const Components::Position, const Components::Velocity,
                                  const Components::Lifetime>();
        for (auto &&[entity, pos, vel, life] : view.each()) {
            fn(entity, pos, vel, life);
        }
    }

    /**
     * @brief Access to the underlying registry (backends attach listeners here)
     */
    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    entt::registry registry;
    Components::SphereShape shape;
};

#include "fountain/core/particle_store.hpp"

#include <vector>

ParticleStore::ParticleStore(double particleRadius)
    : shape{particleRadius}
{
    // Create the pools up front so const views are always backed by storage.
    registry.storage<Components::Position>();
    registry.storage<Components::Velocity>();
    registry.storage<Components::Lifetime>();
}

entt::entity ParticleStore::insert(const Components::Position& position,
                                   const Components::Velocity& velocity,
                                   const Components::Lifetime& lifetime) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, position);
    registry.emplace<Components::Velocity>(entity, velocity);
    registry.emplace<Components::Lifetime>(entity, lifetime);
    return entity;
}

bool ParticleStore::remove(entt::entity particle) {
    if (!contains(particle)) {
        return false;
    }
    registry.destroy(particle);
    return true;
}

bool ParticleStore::contains(entt::entity particle) const {
    return registry.valid(particle) && registry.all_of<Components::Lifetime>(particle);
}

std::size_t ParticleStore::size() const {
    return registry.view<const Components::Lifetime>().size();
}

void ParticleStore::clear() {
    auto view = registry.view<Components::Lifetime>();
    std::vector<entt::entity> all(view.begin(), view.end());
    registry.destroy(all.begin(), all.end());
}

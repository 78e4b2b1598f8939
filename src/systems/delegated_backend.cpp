/**
 * @file delegated_backend.cpp
 * @brief Implementation of the rigid-body world delegation
 */

#include "fountain/systems/delegated_backend.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"

namespace Systems {

DelegatedBackend::DelegatedBackend(std::unique_ptr<Engine::IRigidBodyWorld> world)
    : world(std::move(world))
{
    if (!this->world) {
        throw std::invalid_argument("DelegatedBackend requires a rigid-body world");
    }
}

void DelegatedBackend::attach(ParticleStore& store) {
    bodyRadius = store.getShape().radius;

    auto& registry = store.getRegistry();
    registry.on_construct<Components::Lifetime>().connect<&DelegatedBackend::onParticleCreated>(*this);
    registry.on_destroy<Components::RigidBody>().connect<&DelegatedBackend::onParticleDestroyed>(*this);
}

void DelegatedBackend::detach(ParticleStore& store) {
    auto& registry = store.getRegistry();
    registry.on_construct<Components::Lifetime>().disconnect<&DelegatedBackend::onParticleCreated>(*this);
    registry.on_destroy<Components::RigidBody>().disconnect<&DelegatedBackend::onParticleDestroyed>(*this);
}

void DelegatedBackend::onParticleCreated(entt::registry& registry, entt::entity entity) {
    const auto& pos = registry.get<Components::Position>(entity);
    const auto& vel = registry.get<Components::Velocity>(entity);

    Engine::BodyId const id = world->createDynamicSphere(Engine::BodyDesc{pos, vel, bodyRadius});
    registry.emplace<Components::RigidBody>(entity, id);
}

void DelegatedBackend::onParticleDestroyed(entt::registry& registry, entt::entity entity) {
    // False when the world dropped the body itself; nothing left to remove then.
    world->removeBody(registry.get<Components::RigidBody>(entity).bodyId);
}

void DelegatedBackend::step(double dt, const FountainConfig& /*config*/, ParticleStore& store) {
    PROFILE_SCOPE("DelegatedBackend");

    world->step(dt);

    auto& registry = store.getRegistry();
    auto view = registry.view<const Components::RigidBody, Components::Position, Components::Velocity>();

    std::vector<entt::entity> lost;
    for (auto &&[entity, body, pos, vel] : view.each()) {
        if (auto state = world->bodyState(body.bodyId)) {
            pos = state->position;
            vel = state->linearVelocity;
        } else {
            lost.push_back(entity);
        }
    }

    registry.destroy(lost.begin(), lost.end());
    implicitRemovals += lost.size();

    if (!lost.empty()) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "DelegatedBackend: " << lost.size() << " bodies no longer reported, particles removed\n");
    }
    if (world->bodyCount() > store.size()) {
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
            "DelegatedBackend: world holds " << world->bodyCount() - store.size()
            << " untracked bodies\n");
    }
}

} // namespace Systems

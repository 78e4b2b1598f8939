/**
 * @file integrator_backend.cpp
 * @brief Implementation of the built-in integrator with ground contact
 */

#include "fountain/systems/integrator_backend.hpp"

#include "fountain/core/profile.hpp"

namespace Systems {

void IntegratorBackend::integrate(double dt, const FountainConfig& config,
                                  Components::Position& pos, Components::Velocity& vel) {
    vel.y -= config.gravity * dt;

    double const nextY = pos.y + vel.y;

    if (nextY < config.groundHeight) {
        pos.y = config.groundHeight;

        // Horizontal displacement uses the velocity before damping.
        pos.x += vel.x;
        pos.z += vel.z;

        vel.x *= config.horizontalDamping;
        vel.z *= config.horizontalDamping;
        vel.y = -vel.y * config.restitution;
    } else {
        pos += vel;
    }
}

void IntegratorBackend::step(double dt, const FountainConfig& config, ParticleStore& store) {
    PROFILE_SCOPE("IntegratorBackend");

    auto view = store.getRegistry().view<Components::Position, Components::Velocity>();
    for (auto &&[entity, pos, vel] : view.each()) {
        integrate(dt, config, pos, vel);
    }
}

} // namespace Systems

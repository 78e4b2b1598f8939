/**
 * @file classic_fountain.hpp
 * @brief Declaration of the ClassicFountainScenario class
 */

#pragma once

#include "fountain/scenarios/i_scenario.hpp"

/**
 * @struct ClassicFountainConfig
 * @brief Parameters of the rigid-body fountain
 */
struct ClassicFountainConfig {
    double spawnIntervalSeconds = 0.1;
    int particlesPerBatch = 20;
    double lifetimeSeconds = 20.0;
    double sphereRadius = 0.25;
    double launchSpeed = 9.81;          // m/s
    double coneSpread = 0.25;

    // The ground slab is centred on the origin; its top sits at half a meter.
    double groundHeight = 0.5;
    double groundHalfExtent = 128.0;
    double restitution = 0.3;
    double groundDamping = 0.9;
    double sphereFriction = 0.2;
};

/**
 * @class ClassicFountainScenario
 *
 * Spheres are launched from a small box near the origin into a rigid-body
 * world where they pile up on the ground and against each other.
 */
class ClassicFountainScenario : public IScenario {
public:
    ClassicFountainScenario() = default;
    ~ClassicFountainScenario() override = default;

    FountainConfig getConfig() const override;
    std::string getName() const override { return "Classic fountain"; }

private:
    ClassicFountainConfig scenarioConfig;
};

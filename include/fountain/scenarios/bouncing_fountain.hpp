/**
 * @file bouncing_fountain.hpp
 * @brief Declaration of the BouncingFountainScenario class
 */

#pragma once

#include "fountain/scenarios/i_scenario.hpp"

/**
 * @struct BouncingFountainConfig
 * @brief Parameters of the fountain run by the built-in integrator
 *
 * The integrator moves particles by their whole velocity each tick, so
 * speeds here are per tick and gravity is the per-tick velocity change per
 * second of simulated time.
 */
struct BouncingFountainConfig {
    double spawnIntervalSeconds = 0.05;
    int particlesPerBatch = 10;
    double lifetimeSeconds = 8.0;
    double particleRadius = 0.1;
    double launchSpeedPerTick = 0.25;
    double coneSpread = 0.1;
    double restitution = 0.6;
    double horizontalDamping = 0.9;
};

/**
 * @class BouncingFountainScenario
 *
 * Particles rise from a small box above the origin, fall back and skip
 * along the ground plane, losing height with every bounce.
 */
class BouncingFountainScenario : public IScenario {
public:
    BouncingFountainScenario() = default;
    ~BouncingFountainScenario() override = default;

    FountainConfig getConfig() const override;
    std::string getName() const override { return "Bouncing fountain"; }

private:
    BouncingFountainConfig scenarioConfig;
};

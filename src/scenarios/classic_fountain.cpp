/**
 * @file classic_fountain.cpp
 * @brief Rigid-body fountain: spheres spawned in a 2x1x2 box, launched up a
 *        narrow cone and handed to the sphere world.
 */

#include "fountain/scenarios/classic_fountain.hpp"

#include "fountain/core/constants.hpp"

FountainConfig ClassicFountainScenario::getConfig() const {
  FountainConfig cfg;
  cfg.spawnInterval = scenarioConfig.spawnIntervalSeconds;
  cfg.batchSize = scenarioConfig.particlesPerBatch;
  cfg.particleLifetime = scenarioConfig.lifetimeSeconds;
  cfg.particleRadius = scenarioConfig.sphereRadius;
  cfg.spawnRegion = SpawnRegion{{1.0, 1.0, 1.0}, {3.0, 2.0, 3.0}};
  cfg.initialSpeed = scenarioConfig.launchSpeed;
  cfg.coneSpread = scenarioConfig.coneSpread;

  cfg.gravity = 9.81;
  cfg.groundHeight = scenarioConfig.groundHeight;
  cfg.restitution = scenarioConfig.restitution;
  cfg.horizontalDamping = scenarioConfig.groundDamping;

  cfg.groundHalfExtent = scenarioConfig.groundHalfExtent;
  cfg.particleFriction = scenarioConfig.sphereFriction;
  cfg.solverIterations = 4;

  cfg.backend = BackendType::Delegated;
  cfg.secondsPerTick = 1.0 / FountainConstants::StepsPerSecond;
  return cfg;
}

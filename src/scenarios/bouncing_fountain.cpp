#include "fountain/scenarios/bouncing_fountain.hpp"

#include "fountain/core/constants.hpp"

FountainConfig BouncingFountainScenario::getConfig() const {
  FountainConfig cfg;
  cfg.secondsPerTick = 1.0 / FountainConstants::StepsPerSecond;

  cfg.spawnInterval = scenarioConfig.spawnIntervalSeconds;
  cfg.batchSize = scenarioConfig.particlesPerBatch;
  cfg.particleLifetime = scenarioConfig.lifetimeSeconds;
  cfg.particleRadius = scenarioConfig.particleRadius;
  cfg.spawnRegion = SpawnRegion{{-0.5, 1.0, -0.5}, {0.5, 1.5, 0.5}};
  cfg.initialSpeed = scenarioConfig.launchSpeedPerTick;
  cfg.coneSpread = scenarioConfig.coneSpread;

  // 9.81 m/s² expressed as a per-tick velocity change per simulated second
  cfg.gravity = 9.81 * cfg.secondsPerTick;
  cfg.groundHeight = 0.0;
  cfg.restitution = scenarioConfig.restitution;
  cfg.horizontalDamping = scenarioConfig.horizontalDamping;

  cfg.backend = BackendType::Internal;
  return cfg;
}

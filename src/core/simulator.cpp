/**
 * @fileoverview simulator.cpp
 * @brief Implementation of FountainSimulator.
 */

#include "fountain/core/simulator.hpp"

#include <ctime>
#include <stdexcept>
#include <utility>

#include "fountain/core/debug.hpp"
#include "fountain/core/profile.hpp"
#include "fountain/engine/sphere_world.hpp"
#include "fountain/systems/delegated_backend.hpp"
#include "fountain/systems/expiration_reaper.hpp"
#include "fountain/systems/integrator_backend.hpp"

namespace {

const FountainConfig& validated(const FountainConfig& config) {
  validateConfig(config);
  return config;
}

uint32_t seedFor(const FountainConfig& config) {
  if (config.seed != 0) {
    return config.seed;
  }
  return static_cast<uint32_t>(time(nullptr));
}

}  // namespace

std::unique_ptr<Systems::PhysicsBackend> createBackend(const FountainConfig& config) {
  switch (config.backend) {
    case BackendType::Internal:
      return std::make_unique<Systems::IntegratorBackend>();
    case BackendType::Delegated: {
      Engine::SphereWorldConfig worldCfg;
      worldCfg.gravity = config.gravity;
      worldCfg.groundHeight = config.groundHeight;
      worldCfg.groundHalfExtent = config.groundHalfExtent;
      worldCfg.restitution = config.restitution;
      worldCfg.horizontalDamping = config.horizontalDamping;
      worldCfg.friction = config.particleFriction;
      worldCfg.solverIterations = config.solverIterations;
      return std::make_unique<Systems::DelegatedBackend>(
          std::make_unique<Engine::SphereWorld>(worldCfg));
    }
  }
  throw std::invalid_argument("createBackend: unknown backend type");
}

FountainSimulator::FountainSimulator(const FountainConfig& config,
                                     std::unique_ptr<Systems::PhysicsBackend> backend)
    : config(validated(config))
    , store(config.particleRadius)
    , rng(seedFor(config))
    , backend(std::move(backend))
{
  if (!this->backend) {
    throw std::invalid_argument("FountainSimulator requires a physics backend");
  }
  this->backend->attach(store);

  DEBUG_MSG(DEBUG_LEVEL_BASIC,
      "FountainSimulator: backend " << this->backend->name()
      << ", batch " << config.batchSize << " every " << config.spawnInterval << "s\n");
}

FountainSimulator::FountainSimulator(const FountainConfig& config)
    : FountainSimulator(config, createBackend(validated(config)))
{
}

FountainSimulator::~FountainSimulator() {
  backend->detach(store);
}

void FountainSimulator::tick(double now, double dt) {
  PROFILE_SCOPE("FountainSimulator::tick");

  TickStats stats;

  std::size_t const before = store.size();
  Systems::SpawnScheduler::maybeSpawn(now, config, schedulerState, store, rng);
  std::size_t const afterSpawn = store.size();
  stats.spawned = afterSpawn - before;

  backend->step(dt, config, store);
  std::size_t const afterPhysics = store.size();
  stats.removedByPhysics = afterSpawn - afterPhysics;

  Systems::ExpirationReaper::reap(now, store);
  stats.live = store.size();
  stats.expired = afterPhysics - stats.live;

  lastTick = stats;
}

void FountainSimulator::reset() {
  store.clear();
  schedulerState = Systems::SchedulerState{};
  lastTick = TickStats{};
}

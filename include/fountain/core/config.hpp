/**
 * @file config.hpp
 * @brief Simulation parameters shared by every fountain component
 */

#ifndef FOUNTAIN_CONFIG_HPP
#define FOUNTAIN_CONFIG_HPP

#include <cstdint>
#include <string>

#include "fountain/math/vector_math.hpp"

/**
 * @enum BackendType
 * @brief Selects the physics strategy used to advance particles.
 */
enum class BackendType {
    Internal,   ///< IntegratorBackend: semi-implicit Euler with a ground plane
    Delegated   ///< DelegatedBackend: bodies live in a rigid-body world
};

/**
 * @struct SpawnRegion
 * @brief Axis-aligned box from which initial particle positions are drawn.
 */
struct SpawnRegion {
    Vector3 min;
    Vector3 max;
};

/**
 * @struct FountainConfig
 * @brief Holds all configuration parameters for a fountain simulation.
 *
 * Filled once (usually from a scenario), validated by validateConfig() and
 * not modified afterwards. Times are in seconds.
 */
struct FountainConfig {
    // Spawning
    double spawnInterval = 0.1;
    int batchSize = 20;
    double particleLifetime = 20.0;
    double particleRadius = 0.25;
    SpawnRegion spawnRegion{{1.0, 1.0, 1.0}, {3.0, 2.0, 3.0}};
    double initialSpeed = 9.81;
    double coneSpread = 1.0;       // scales the horizontal direction samples

    // Physics
    double gravity = 9.81;         // magnitude, acts along -Y
    double groundHeight = 0.0;
    double restitution = 0.4;
    double horizontalDamping = 0.9;

    // Rigid-body world (delegated backend only)
    double groundHalfExtent = 128.0;
    double particleFriction = 0.2;
    int solverIterations = 4;

    BackendType backend = BackendType::Internal;
    double secondsPerTick = 1.0 / 60.0;
    uint32_t seed = 0;             // 0 = seed from the clock
};

/**
 * @brief Rejects parameter sets the simulation cannot run with.
 *
 * @param config Parameters to check
 * @throws std::invalid_argument naming the first offending field
 */
void validateConfig(const FountainConfig& config);

/**
 * @brief Human-readable name of a backend type.
 */
std::string getBackendName(BackendType type);

#endif // FOUNTAIN_CONFIG_HPP

#include "fountain/core/config.hpp"

#include <cmath>
#include <stdexcept>

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("FountainConfig: " + message);
    }
}

bool isFinite(const Vector3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

} // namespace

void validateConfig(const FountainConfig& config) {
    require(std::isfinite(config.spawnInterval) && config.spawnInterval >= 0.0,
            "spawnInterval must be a non-negative number");
    require(config.batchSize > 0, "batchSize must be positive");
    require(std::isfinite(config.particleLifetime) && config.particleLifetime > 0.0,
            "particleLifetime must be positive");
    require(std::isfinite(config.particleRadius) && config.particleRadius > 0.0,
            "particleRadius must be positive");

    const auto& region = config.spawnRegion;
    require(isFinite(region.min) && isFinite(region.max), "spawnRegion must be finite");
    require(region.min.x <= region.max.x && region.min.y <= region.max.y &&
            region.min.z <= region.max.z,
            "spawnRegion min must not exceed max on any axis");

    require(std::isfinite(config.initialSpeed) && config.initialSpeed >= 0.0,
            "initialSpeed must be non-negative");
    require(std::isfinite(config.coneSpread) && config.coneSpread >= 0.0,
            "coneSpread must be non-negative");
    require(std::isfinite(config.gravity) && config.gravity >= 0.0,
            "gravity must be a non-negative magnitude");
    require(std::isfinite(config.groundHeight), "groundHeight must be finite");
    require(config.restitution >= 0.0 && config.restitution <= 1.0,
            "restitution must lie in [0, 1]");
    require(config.horizontalDamping >= 0.0 && config.horizontalDamping <= 1.0,
            "horizontalDamping must lie in [0, 1]");

    require(std::isfinite(config.groundHalfExtent) && config.groundHalfExtent > 0.0,
            "groundHalfExtent must be positive");
    require(config.particleFriction >= 0.0 && config.particleFriction <= 1.0,
            "particleFriction must lie in [0, 1]");
    require(config.solverIterations >= 1, "solverIterations must be at least 1");
    require(std::isfinite(config.secondsPerTick) && config.secondsPerTick > 0.0,
            "secondsPerTick must be positive");
}

std::string getBackendName(BackendType type) {
    switch (type) {
        case BackendType::Internal:  return "INTERNAL";
        case BackendType::Delegated: return "DELEGATED";
        default: return "UNKNOWN";
    }
}

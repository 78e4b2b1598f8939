#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "fountain/core/config.hpp"

TEST(ConfigTest, DefaultsAreValid) {
    FountainConfig config;
    EXPECT_NO_THROW(validateConfig(config));

    EXPECT_DOUBLE_EQ(config.spawnInterval, 0.1);
    EXPECT_EQ(config.batchSize, 20);
    EXPECT_DOUBLE_EQ(config.particleLifetime, 20.0);
    EXPECT_DOUBLE_EQ(config.particleRadius, 0.25);
    EXPECT_DOUBLE_EQ(config.gravity, 9.81);
    EXPECT_EQ(config.backend, BackendType::Internal);
}

TEST(ConfigTest, ZeroSpawnIntervalIsAllowed) {
    FountainConfig config;
    config.spawnInterval = 0.0;
    EXPECT_NO_THROW(validateConfig(config));
}

TEST(ConfigTest, DegenerateSpawnRegionIsAllowed) {
    FountainConfig config;
    config.spawnRegion = {{1.0, 1.0, 1.0}, {1.0, 1.0, 1.0}};
    EXPECT_NO_THROW(validateConfig(config));
}

TEST(ConfigTest, RejectsNonPositiveBatchSize) {
    FountainConfig config;
    config.batchSize = 0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsNegativeSpawnInterval) {
    FountainConfig config;
    config.spawnInterval = -0.1;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config.spawnInterval = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsNonPositiveLifetimeAndRadius) {
    FountainConfig config;
    config.particleLifetime = 0.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.particleRadius = -1.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsInvertedSpawnRegion) {
    FountainConfig config;
    config.spawnRegion = {{3.0, 1.0, 1.0}, {1.0, 2.0, 3.0}};
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsCoefficientsOutsideUnitInterval) {
    FountainConfig config;
    config.restitution = 1.5;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.horizontalDamping = -0.1;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.particleFriction = 2.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsNegativeMagnitudes) {
    FountainConfig config;
    config.gravity = -9.81;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.initialSpeed = -1.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.coneSpread = -0.5;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, RejectsBadWorldAndClockSettings) {
    FountainConfig config;
    config.groundHalfExtent = 0.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.solverIterations = 0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);

    config = FountainConfig{};
    config.secondsPerTick = 0.0;
    EXPECT_THROW(validateConfig(config), std::invalid_argument);
}

TEST(ConfigTest, BackendNames) {
    EXPECT_EQ(getBackendName(BackendType::Internal), "INTERNAL");
    EXPECT_EQ(getBackendName(BackendType::Delegated), "DELEGATED");
}

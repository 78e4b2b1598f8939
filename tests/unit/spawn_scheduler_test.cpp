#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "fountain/systems/spawn_scheduler.hpp"

using namespace Systems;

class SpawnSchedulerTest : public ::testing::Test {
protected:
    FountainConfig config;
    SchedulerState state;
    RandomEngine rng{12345u};
    ParticleStore store{0.25};

    void SetUp() override {
        config.spawnInterval = 0.1;
        config.batchSize = 30;
    }
};

TEST_F(SpawnSchedulerTest, AdmitsBatchesOnDeadline) {
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);
    EXPECT_EQ(store.size(), 30u);
    EXPECT_DOUBLE_EQ(state.nextSpawnDeadline, 0.1);

    SpawnScheduler::maybeSpawn(0.05, config, state, store, rng);
    EXPECT_EQ(store.size(), 30u);
    EXPECT_DOUBLE_EQ(state.nextSpawnDeadline, 0.1);

    SpawnScheduler::maybeSpawn(0.101, config, state, store, rng);
    EXPECT_EQ(store.size(), 60u);
    EXPECT_DOUBLE_EQ(state.nextSpawnDeadline, 0.201);
}

TEST_F(SpawnSchedulerTest, NoSpawnExactlyAtDeadline) {
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);
    SpawnScheduler::maybeSpawn(0.1, config, state, store, rng);
    EXPECT_EQ(store.size(), 30u);
}

TEST_F(SpawnSchedulerTest, LateTickAdmitsOnlyOneBatch) {
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);
    SpawnScheduler::maybeSpawn(5.0, config, state, store, rng);
    EXPECT_EQ(store.size(), 60u);
    EXPECT_DOUBLE_EQ(state.nextSpawnDeadline, 5.1);
}

TEST_F(SpawnSchedulerTest, DeadlineNeverDecreases) {
    double previous = state.nextSpawnDeadline;
    for (int tick = 0; tick < 100; ++tick) {
        SpawnScheduler::maybeSpawn(tick * 0.016, config, state, store, rng);
        EXPECT_GE(state.nextSpawnDeadline, previous);
        previous = state.nextSpawnDeadline;
    }
}

TEST_F(SpawnSchedulerTest, ZeroIntervalSpawnsEveryAdvancingTick) {
    config.spawnInterval = 0.0;
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);
    SpawnScheduler::maybeSpawn(0.01, config, state, store, rng);
    EXPECT_EQ(store.size(), 60u);
}

TEST_F(SpawnSchedulerTest, ParticlesRespectSpeedConeAndRegion) {
    config.initialSpeed = 9.81;
    config.coneSpread = 0.25;
    config.particleLifetime = 20.0;
    SpawnScheduler::maybeSpawn(2.0, config, state, store, rng);

    const auto& region = config.spawnRegion;
    store.forEach([&](entt::entity, const Components::Position& pos,
                      const Components::Velocity& vel, const Components::Lifetime& life) {
        EXPECT_NEAR(vel.length(), 9.81, 1e-9);
        EXPECT_GT(vel.y, 0.0);
        // Horizontal components are bounded by coneSpread before normalization
        EXPECT_LE(std::abs(vel.x / vel.y), 0.25 + 1e-12);
        EXPECT_LE(std::abs(vel.z / vel.y), 0.25 + 1e-12);

        EXPECT_GE(pos.x, region.min.x);
        EXPECT_LE(pos.x, region.max.x);
        EXPECT_GE(pos.y, region.min.y);
        EXPECT_LE(pos.y, region.max.y);
        EXPECT_GE(pos.z, region.min.z);
        EXPECT_LE(pos.z, region.max.z);

        EXPECT_DOUBLE_EQ(life.spawnTime, 2.0);
        EXPECT_DOUBLE_EQ(life.expireTime, 22.0);
    });
}

TEST_F(SpawnSchedulerTest, ZeroConeShootsStraightUp) {
    config.coneSpread = 0.0;
    config.initialSpeed = 3.0;
    SpawnScheduler::maybeSpawn(0.0, config, state, store, rng);

    store.forEach([](entt::entity, const Components::Position&,
                     const Components::Velocity& vel, const Components::Lifetime&) {
        EXPECT_DOUBLE_EQ(vel.x, 0.0);
        EXPECT_DOUBLE_EQ(vel.y, 3.0);
        EXPECT_DOUBLE_EQ(vel.z, 0.0);
    });
}

TEST_F(SpawnSchedulerTest, SameSeedReproducesBatch) {
    auto collect = [this](uint32_t seed) {
        ParticleStore local(0.25);
        SchedulerState localState;
        RandomEngine localRng(seed);
        SpawnScheduler::maybeSpawn(0.0, config, localState, local, localRng);

        std::vector<double> values;
        local.forEach([&](entt::entity, const Components::Position& pos,
                          const Components::Velocity& vel, const Components::Lifetime&) {
            values.push_back(pos.x);
            values.push_back(pos.z);
            values.push_back(vel.x);
        });
        return values;
    };

    EXPECT_EQ(collect(7u), collect(7u));
    EXPECT_NE(collect(7u), collect(8u));
}

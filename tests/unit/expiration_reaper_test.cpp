#include <gtest/gtest.h>
#include "fountain/systems/expiration_reaper.hpp"
#include "fountain/systems/spawn_scheduler.hpp"

using namespace Systems;

class ExpirationReaperTest : public ::testing::Test {
protected:
    ParticleStore store{0.25};

    entt::entity addParticle(double spawnTime, double lifetime) {
        return store.insert(Components::Position(0.0, 1.0, 0.0),
                            Components::Velocity(),
                            Components::Lifetime{spawnTime, spawnTime + lifetime});
    }
};

TEST_F(ExpirationReaperTest, RemovesAtExpireTime) {
    auto e = addParticle(0.0, 10.0);

    ExpirationReaper::reap(9.999, store);
    EXPECT_TRUE(store.contains(e));

    ExpirationReaper::reap(10.0, store);
    EXPECT_FALSE(store.contains(e));
    EXPECT_TRUE(store.empty());
}

TEST_F(ExpirationReaperTest, KeepsOnlyUnexpiredParticles) {
    auto early = addParticle(0.0, 1.0);
    auto middle = addParticle(0.0, 2.0);
    auto late = addParticle(0.0, 3.0);

    ExpirationReaper::reap(2.0, store);
    EXPECT_FALSE(store.contains(early));
    EXPECT_FALSE(store.contains(middle));
    EXPECT_TRUE(store.contains(late));
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(ExpirationReaperTest, RepeatedReapIsNoOp) {
    addParticle(0.0, 1.0);
    addParticle(0.0, 5.0);

    ExpirationReaper::reap(2.0, store);
    ASSERT_EQ(store.size(), 1u);
    ExpirationReaper::reap(2.0, store);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(ExpirationReaperTest, ManyExpireInOneCall) {
    for (int i = 0; i < 500; ++i) {
        addParticle(0.0, (i % 2 == 0) ? 1.0 : 100.0);
    }
    ExpirationReaper::reap(1.0, store);
    EXPECT_EQ(store.size(), 250u);
}

TEST_F(ExpirationReaperTest, FreshlySpawnedSurviveSameTick) {
    FountainConfig config;
    config.particleLifetime = 0.001;
    SchedulerState state;
    RandomEngine rng(1u);

    SpawnScheduler::maybeSpawn(4.0, config, state, store, rng);
    ExpirationReaper::reap(4.0, store);
    EXPECT_EQ(store.size(), static_cast<std::size_t>(config.batchSize));
}

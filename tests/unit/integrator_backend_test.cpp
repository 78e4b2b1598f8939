#include <gtest/gtest.h>
#include <vector>
#include "fountain/systems/integrator_backend.hpp"

using namespace Systems;

class IntegratorBackendTest : public ::testing::Test {
protected:
    FountainConfig config;
    IntegratorBackend backend;

    void SetUp() override {
        config.groundHeight = 0.0;
        config.restitution = 0.4;
        config.horizontalDamping = 0.9;
        config.gravity = 9.81;
    }
};

TEST_F(IntegratorBackendTest, BouncesOffGround) {
    Components::Position pos(0.0, 1.0, 0.0);
    Components::Velocity vel(0.0, -5.0, 0.0);

    IntegratorBackend::integrate(0.0, config, pos, vel);

    EXPECT_DOUBLE_EQ(pos.y, 0.0);
    EXPECT_DOUBLE_EQ(vel.y, 2.0);
}

TEST_F(IntegratorBackendTest, FreeFlightAppliesGravityThenMoves) {
    Components::Position pos(1.0, 10.0, -1.0);
    Components::Velocity vel(0.5, 0.0, 0.25);

    IntegratorBackend::integrate(0.1, config, pos, vel);

    EXPECT_DOUBLE_EQ(vel.y, -0.981);
    EXPECT_DOUBLE_EQ(pos.y, 10.0 - 0.981);
    EXPECT_DOUBLE_EQ(pos.x, 1.5);
    EXPECT_DOUBLE_EQ(pos.z, -0.75);
    // No damping without ground contact
    EXPECT_DOUBLE_EQ(vel.x, 0.5);
    EXPECT_DOUBLE_EQ(vel.z, 0.25);
}

TEST_F(IntegratorBackendTest, HorizontalMoveUsesUndampedVelocity) {
    Components::Position pos(0.0, 0.5, 0.0);
    Components::Velocity vel(2.0, -1.0, -4.0);

    IntegratorBackend::integrate(0.0, config, pos, vel);

    EXPECT_DOUBLE_EQ(pos.x, 2.0);
    EXPECT_DOUBLE_EQ(pos.z, -4.0);
    EXPECT_DOUBLE_EQ(vel.x, 1.8);
    EXPECT_DOUBLE_EQ(vel.z, -3.6);
    EXPECT_DOUBLE_EQ(pos.y, 0.0);
    EXPECT_DOUBLE_EQ(vel.y, 0.4);
}

TEST_F(IntegratorBackendTest, LandingExactlyOnGroundIsNotContact) {
    Components::Position pos(0.0, 1.0, 0.0);
    Components::Velocity vel(1.0, -1.0, 0.0);

    IntegratorBackend::integrate(0.0, config, pos, vel);

    EXPECT_DOUBLE_EQ(pos.y, 0.0);
    EXPECT_DOUBLE_EQ(vel.y, -1.0);
    EXPECT_DOUBLE_EQ(vel.x, 1.0);
}

TEST_F(IntegratorBackendTest, RespectsRaisedGround) {
    config.groundHeight = 2.0;
    Components::Position pos(0.0, 2.5, 0.0);
    Components::Velocity vel(0.0, -1.0, 0.0);

    IntegratorBackend::integrate(0.0, config, pos, vel);

    EXPECT_DOUBLE_EQ(pos.y, 2.0);
    EXPECT_DOUBLE_EQ(vel.y, 0.4);
}

TEST_F(IntegratorBackendTest, BouncePeaksDecrease) {
    config.gravity = 1.0;
    config.restitution = 0.5;

    Components::Position pos(0.0, 5.0, 0.0);
    Components::Velocity vel;

    std::vector<double> peaks;
    double previousY = pos.y;
    bool rising = false;
    for (int tick = 0; tick < 2000 && peaks.size() < 3; ++tick) {
        IntegratorBackend::integrate(0.1, config, pos, vel);
        EXPECT_GE(pos.y, config.groundHeight - 1e-9);
        if (pos.y > previousY) {
            rising = true;
        } else if (rising && pos.y < previousY) {
            peaks.push_back(previousY);
            rising = false;
        }
        previousY = pos.y;
    }

    ASSERT_EQ(peaks.size(), 3u);
    EXPECT_LT(peaks[0], 5.0);
    EXPECT_LT(peaks[1], peaks[0]);
    EXPECT_LT(peaks[2], peaks[1]);
}

TEST_F(IntegratorBackendTest, StepAdvancesEveryParticle) {
    ParticleStore store(0.1);
    auto a = store.insert(Components::Position(0.0, 10.0, 0.0), Components::Velocity(),
                          Components::Lifetime{0.0, 10.0});
    auto b = store.insert(Components::Position(0.0, 0.5, 0.0), Components::Velocity(0.0, -1.0, 0.0),
                          Components::Lifetime{0.0, 10.0});

    backend.step(0.0, config, store);

    const auto& registry = store.getRegistry();
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(a).y, 10.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(b).y, 0.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(b).y, 0.4);
    EXPECT_STREQ(backend.name(), "internal");
}

#include <gtest/gtest.h>
#include <physics/integrator.hpp>
#include "test_helpers.hpp"

using namespace traitgalaxy;
using namespace traitgalaxy::test;

class IntegratorTest : public ::testing::Test {
protected:
    PhysicsConfig config;
    TraitVector preferences{80.0f, 20.0f, 50.0f};

    // Disable every force so only the integration itself is observed
    void disable_forces() {
        config.attraction_k = 0.0f;
        config.repulsion_k = 0.0f;
        config.compatibility_floor = 0.0f;
    }
};

TEST_F(IntegratorTest, CentralNodeIsPinnedToOrigin) {
    auto nodes = make_galaxy(preferences, {{10.0f, 90.0f, 50.0f}});
    nodes[0].position = Vec3(5.0f, 5.0f, 5.0f);
    nodes[0].velocity = Vec3(1.0f, 0.0f, 0.0f);

    Integrator::step(nodes, preferences, config, 1.0f / 60.0f);

    EXPECT_EQ(nodes[0].position, Vec3::zero());
    EXPECT_EQ(nodes[0].velocity, Vec3::zero());
}

TEST_F(IntegratorTest, CompatibleNodeMovesTowardCenter) {
    auto nodes = make_galaxy(preferences, {preferences});

    Integrator::step(nodes, preferences, config, 0.1f);

    EXPECT_LT(nodes[1].velocity.x, 0.0f);
    EXPECT_LT(nodes[1].position.x, 10.0f);
    EXPECT_FLOAT_EQ(nodes[1].position.y, 0.0f);
}

TEST_F(IntegratorTest, VelocityIsDampedAfterMoving) {
    disable_forces();
    config.damping = 0.5f;
    auto nodes = make_galaxy(preferences, {preferences});
    nodes[1].velocity = Vec3(1.0f, 0.0f, 0.0f);

    Integrator::step(nodes, preferences, config, 1.0f);

    EXPECT_FLOAT_EQ(nodes[1].position.x, 11.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, 0.5f);
}

TEST_F(IntegratorTest, DraggedNodeKeepsPositionWithZeroVelocity) {
    auto nodes = make_galaxy(preferences, {{0.0f, 0.0f, 0.0f}, {100.0f, 100.0f, 100.0f}});
    nodes[1].velocity = Vec3(3.0f, 3.0f, 3.0f);
    Vec3 held = nodes[1].position;

    Integrator::step(nodes, preferences, config, 1.0f / 60.0f, size_t{1});

    EXPECT_EQ(nodes[1].position, held);
    EXPECT_EQ(nodes[1].velocity, Vec3::zero());
}

TEST_F(IntegratorTest, DraggedNodeExertsNoRepulsion) {
    disable_forces();
    config.repulsion_k = 20.0f;
    auto nodes = make_galaxy(preferences, {{0.0f, 0.0f, 0.0f}, {100.0f, 100.0f, 100.0f}});
    nodes[2].position = Vec3(11.0f, 0.0f, 0.0f);

    Integrator::step(nodes, preferences, config, 1.0f / 60.0f, size_t{1});

    EXPECT_EQ(nodes[2].velocity, Vec3::zero());
    EXPECT_FLOAT_EQ(nodes[2].position.x, 11.0f);
}

TEST_F(IntegratorTest, RepulsionIsSymmetric) {
    disable_forces();
    config.repulsion_k = 20.0f;
    auto nodes = make_galaxy(preferences, {{0.0f, 0.0f, 0.0f}, {100.0f, 100.0f, 100.0f}});
    nodes[1].position = Vec3(-5.0f, 0.0f, 0.0f);
    nodes[2].position = Vec3(5.0f, 0.0f, 0.0f);

    Integrator::step(nodes, preferences, config, 1.0f / 60.0f);

    EXPECT_LT(nodes[1].velocity.x, 0.0f);
    EXPECT_GT(nodes[2].velocity.x, 0.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, -nodes[2].velocity.x);
}

TEST_F(IntegratorTest, TrackingMovesAtBoundedSpeed) {
    auto nodes = make_galaxy(preferences, {preferences});
    nodes[1].velocity = Vec3(4.0f, 0.0f, 0.0f);
    std::vector<Vec3> targets{Vec3::zero(), Vec3(0.0f, 0.0f, 0.0f)};

    TrackingConfig tracking;
    tracking.return_speed = 2.0f;

    ASSERT_TRUE(Integrator::track_targets(nodes, targets, tracking, 0.5f));

    EXPECT_FLOAT_EQ(nodes[1].position.x, 9.0f);
    EXPECT_EQ(nodes[1].velocity, Vec3::zero());
}

TEST_F(IntegratorTest, TrackingSnapsWhenClose) {
    auto nodes = make_galaxy(preferences, {preferences, preferences});
    std::vector<Vec3> targets{Vec3::zero(), Vec3(10.05f, 0.0f, 0.0f), Vec3(20.5f, 0.0f, 0.0f)};

    TrackingConfig tracking;
    tracking.return_speed = 2.0f;
    tracking.snap_epsilon = 0.1f;

    // Node 1 is within epsilon, node 2 within one step of 2 * 0.5
    ASSERT_TRUE(Integrator::track_targets(nodes, targets, tracking, 0.5f));

    EXPECT_EQ(nodes[1].position, targets[1]);
    EXPECT_EQ(nodes[2].position, targets[2]);
}

TEST_F(IntegratorTest, TrackingSkipsDraggedNode) {
    auto nodes = make_galaxy(preferences, {preferences});
    std::vector<Vec3> targets{Vec3::zero(), Vec3(50.0f, 0.0f, 0.0f)};

    ASSERT_TRUE(Integrator::track_targets(nodes, targets, TrackingConfig{}, 1.0f, size_t{1}));

    EXPECT_FLOAT_EQ(nodes[1].position.x, 10.0f);
}

TEST_F(IntegratorTest, TrackingRejectsMismatchedTargets) {
    auto nodes = make_galaxy(preferences, {preferences, preferences});
    std::vector<Vec3> targets{Vec3::zero(), Vec3(50.0f, 0.0f, 0.0f)};

    EXPECT_FALSE(Integrator::track_targets(nodes, targets, TrackingConfig{}, 1.0f));
    EXPECT_FLOAT_EQ(nodes[1].position.x, 10.0f);
    EXPECT_FLOAT_EQ(nodes[2].position.x, 20.0f);
}

#include <gtest/gtest.h>
#include <physics/cluster_placement.hpp>
#include <galaxy/node_generator.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <set>

using namespace traitgalaxy;
using namespace traitgalaxy::test;

namespace {

float horizontal_radius(const Vec3& p) {
    return std::sqrt(p.x * p.x + p.z * p.z);
}

}  // namespace

TEST(ClusterPlacementTest, TraitHashIsOrderSensitive) {
    EXPECT_EQ(ClusterPlacement::trait_hash({1.0f, 2.0f, 3.0f}), 1026u);
    EXPECT_EQ(ClusterPlacement::trait_hash({3.0f, 2.0f, 1.0f}), 2946u);
    EXPECT_EQ(ClusterPlacement::trait_hash({}), 0u);
    // Values are rounded before hashing
    EXPECT_EQ(ClusterPlacement::trait_hash({0.6f, 2.2f, 2.9f}), 1026u);
}

TEST(ClusterPlacementTest, GroupsByExactTraitsInFirstAppearanceOrder) {
    TraitVector prefs{50.0f, 50.0f, 50.0f};
    auto nodes = make_galaxy(prefs, {
        {10.0f, 20.0f, 30.0f},
        {90.0f, 90.0f, 90.0f},
        {10.0f, 20.0f, 30.0f},
        {10.0f, 20.0f, 31.0f},
    });

    auto clusters = ClusterPlacement::group_by_traits(nodes);
    ASSERT_EQ(clusters.size(), 3u);
    EXPECT_EQ(clusters[0].members, (std::vector<size_t>{1, 3}));
    EXPECT_EQ(clusters[1].members, (std::vector<size_t>{2}));
    EXPECT_EQ(clusters[2].members, (std::vector<size_t>{4}));
}

TEST(ClusterPlacementTest, CentralEntryIsOrigin) {
    TraitVector prefs{75.0f, 25.0f, 60.0f};
    auto nodes = make_galaxy(prefs, {{10.0f, 20.0f, 30.0f}});
    std::swap(nodes[0], nodes[1]);

    auto positions = ClusterPlacement::place(nodes, prefs);
    ASSERT_EQ(positions.size(), 2u);
    EXPECT_EQ(positions[1], Vec3::zero());
    EXPECT_FALSE(positions[0].is_zero());
}

TEST(ClusterPlacementTest, LoneCompatibleNodeUsesBaseRadius) {
    TraitVector prefs{75.0f, 25.0f, 60.0f};
    auto nodes = make_galaxy(prefs, {prefs});

    auto positions = ClusterPlacement::place(nodes, prefs);

    EXPECT_NEAR(horizontal_radius(positions[1]), 15.0f, 1e-3f);
    EXPECT_LE(std::abs(positions[1].y), 20.0f);
}

TEST(ClusterPlacementTest, IncompatibleGroupsSitFarther) {
    TraitVector prefs{100.0f, 100.0f, 100.0f};
    auto nodes = make_galaxy(prefs, {
        {100.0f, 100.0f, 100.0f},
        {0.0f, 0.0f, 0.0f},
    });

    auto positions = ClusterPlacement::place(nodes, prefs);

    EXPECT_NEAR(horizontal_radius(positions[1]), 15.0f, 1e-3f);
    EXPECT_NEAR(horizontal_radius(positions[2]), 75.0f, 1e-3f);
    // Zero hash: angle 0, lowest height bucket
    EXPECT_NEAR(positions[2].x, 75.0f, 1e-3f);
    EXPECT_NEAR(positions[2].y, -20.0f, 1e-3f);
}

TEST(ClusterPlacementTest, IdenticalTraitsGetDistinctNearbyPositions) {
    TraitVector prefs{75.0f, 25.0f, 60.0f};
    TraitVector shared{40.0f, 40.0f, 40.0f};
    auto nodes = make_galaxy(prefs, {shared, shared, shared});

    auto positions = ClusterPlacement::place(nodes, prefs);

    for (size_t i = 1; i < positions.size(); ++i) {
        for (size_t j = i + 1; j < positions.size(); ++j) {
            float d = positions[i].distance_to(positions[j]);
            EXPECT_GT(d, 0.5f);
            EXPECT_LT(d, 8.0f);
        }
    }
}

TEST(ClusterPlacementTest, IsDeterministic) {
    GenerationConfig gen;
    gen.node_count = 25;
    gen.random_seed = 7;
    auto nodes = generate_nodes(gen);

    auto first = ClusterPlacement::place(nodes, nodes[0].traits);
    auto second = ClusterPlacement::place(nodes, nodes[0].traits);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i], second[i]);
    }
}

TEST(ClusterPlacementTest, PositionsStayWithinRadiusBounds) {
    GenerationConfig gen;
    gen.node_count = 40;
    gen.attribute_count = 5;
    auto nodes = generate_nodes(gen);
    // Duplicate trait vectors force multi-member groups
    nodes[5].traits = nodes[3].traits;
    nodes[9].traits = nodes[3].traits;

    auto positions = ClusterPlacement::place(nodes, nodes[0].traits);

    for (size_t i = 1; i < positions.size(); ++i) {
        float r = positions[i].length();
        EXPECT_GE(r, 8.0f - 1e-3f) << "node " << i;
        EXPECT_LE(r, 120.0f + 1e-3f) << "node " << i;
    }
}

TEST(ClusterPlacementTest, MemberOffsets) {
    ClusterConfig config;
    EXPECT_EQ(ClusterPlacement::member_offset(0, 1, config), Vec3::zero());

    Vec3 first = ClusterPlacement::member_offset(0, 4, config);
    EXPECT_FLOAT_EQ(first.x, 2.0f);
    EXPECT_FLOAT_EQ(first.y, 0.5f);

    Vec3 second = ClusterPlacement::member_offset(1, 4, config);
    EXPECT_NEAR(second.z, 2.5f, 1e-5f);
    EXPECT_FLOAT_EQ(second.y, -0.5f);
}

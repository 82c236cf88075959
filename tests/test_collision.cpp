#include <gtest/gtest.h>
#include <vector>
#include "Collision.hpp"

namespace {

// Player centred in lane 1 of the reference layout: x [185,235], y [460,540].
const Box kPlayer = Box::centered(210.0, 500.0, 50.0, 80.0);

Obstacle car(double x, double y, double w = 42.0, double h = 80.0) {
    Obstacle o;
    o.laneX = x;
    o.y = y;
    o.width = w;
    o.height = h;
    return o;
}

}

TEST(Collision, CenteredBoxCorners) {
    EXPECT_DOUBLE_EQ(kPlayer.x, 185.0);
    EXPECT_DOUBLE_EQ(kPlayer.y, 460.0);
    EXPECT_DOUBLE_EQ(kPlayer.w, 50.0);
    EXPECT_DOUBLE_EQ(kPlayer.h, 80.0);
}

TEST(Collision, TouchingEdgesDoNotCollide) {
    // Left edge of the obstacle at 235, the player's right edge.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(256.0, 500.0)}));
    // Right edge of the obstacle at 185, the player's left edge.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(164.0, 500.0)}));
    // Top of the obstacle at 540, the player's bottom.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(210.0, 580.0)}));
    // Bottom of the obstacle at 460, the player's top.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(210.0, 420.0)}));
}

TEST(Collision, OneUnitOverlapCollides) {
    // Left edge 234, top edge 539.
    EXPECT_TRUE(CollisionDetector::anyHit(kPlayer, {car(255.0, 579.0)}));
    // Right edge 186, bottom edge 461.
    EXPECT_TRUE(CollisionDetector::anyHit(kPlayer, {car(165.0, 421.0)}));
}

TEST(Collision, OverlapInOneAxisOnlyIsNotAHit) {
    // Same rows, neighbouring lane.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(310.0, 500.0)}));
    // Same lane, far above.
    EXPECT_FALSE(CollisionDetector::anyHit(kPlayer, {car(210.0, -95.0)}));
}

TEST(Collision, FirstHitFollowsListOrder) {
    std::vector<Obstacle> traffic = {
        car(110.0, 500.0),
        car(210.0, 480.0),
        car(210.0, 520.0),
    };
    EXPECT_EQ(CollisionDetector::firstHit(kPlayer, traffic), 1u);
}

TEST(Collision, EmptyTrafficNeverHits) {
    EXPECT_EQ(CollisionDetector::firstHit(kPlayer, {}), CollisionDetector::npos);
}

TEST(Collision, ContainedBoxCollides) {
    Box big = Box::centered(210.0, 500.0, 200.0, 200.0);
    EXPECT_TRUE(big.overlaps(kPlayer));
    EXPECT_TRUE(kPlayer.overlaps(big));
}

#pragma once
#include <cstddef>
#include <vector>
#include "Obstacle.hpp"

// Axis-aligned box, origin at the top-left corner.
struct Box {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    static Box centered(double cx, double cy, double w, double h) {
        return Box{cx - w / 2.0, cy - h / 2.0, w, h};
    }

    // Strict on all four sides: boxes sharing an edge do not overlap.
    bool overlaps(const Box& o) const {
        return x < o.x + o.w && x + w > o.x &&
               y < o.y + o.h && y + h > o.y;
    }
};

inline Box boxOf(const Obstacle& o) {
    return Box::centered(o.laneX, o.y, o.width, o.height);
}

class CollisionDetector {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    // Index of the first obstacle (list order) overlapping the player, or npos.
    static std::size_t firstHit(const Box& player, const std::vector<Obstacle>& obstacles) {
        for (std::size_t i=0;i<obstacles.size();++i)
            if (player.overlaps(boxOf(obstacles[i]))) return i;
        return npos;
    }

    static bool anyHit(const Box& player, const std::vector<Obstacle>& obstacles) {
        return firstHit(player, obstacles) != npos;
    }
};

#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "Obstacle.hpp"

// Copy of everything a renderer or HUD needs for one frame. Taken after
// the tick; editing it has no effect on the race.
struct RaceView {
    bool                  running      = true;
    double                speed        = 0.0;
    double                distance     = 0.0;
    std::int64_t          best         = 0;
    std::uint64_t         session      = 0;
    std::size_t           laneIndex    = 0;
    double                playerX      = 0.0;
    double                playerY      = 0.0;
    double                playerWidth  = 0.0;
    double                playerHeight = 0.0;
    double                roadOffset   = 0.0;
    double                viewHeight   = 0.0;
    std::vector<double>   lanes;
    std::vector<Obstacle> obstacles;

    // The HUD reads 0 once the car has crashed.
    long displaySpeed() const { return running ? std::lround(speed) : 0L; }
    long displayDistance() const { return std::lround(distance); }
};

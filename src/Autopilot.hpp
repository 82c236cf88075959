#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>
#include "InputLatch.hpp"
#include "RaceView.hpp"
#include "logger.hpp"

/* --------------------------------------------------------------------------
   Headless stand-in for a player. Looks at the latest view and pushes
   intents into the latch the same way keyboard callbacks would.
   Deterministic for a given view.
---------------------------------------------------------------------------- */
class Autopilot {
public:
    struct Settings {
        double lookAhead = 260.0;   // how far above the car traffic counts
        bool   holdBoost = false;
    };

    Autopilot() = default;
    explicit Autopilot(const Settings& s) : settings_(s) {
        if (!(settings_.lookAhead >= 0.0)) settings_.lookAhead = Settings{}.lookAhead;
    }

    void setLogger(Logger* l) { logger_ = l; }

    // Free road in front of the car in `lane`: distance from the car's nose
    // to the nearest obstacle tail in the window, infinity if none, and
    // negative if something is already alongside.
    static double clearance(const RaceView& v, std::size_t lane, double lookAhead) {
        double nose = v.playerY - v.playerHeight / 2.0;
        double tail = v.playerY + v.playerHeight / 2.0;
        double best = std::numeric_limits<double>::infinity();
        for (const auto& o : v.obstacles) {
            if (laneOf(v, o.laneX) != lane) continue;
            double top    = o.y - o.height / 2.0;
            double bottom = o.y + o.height / 2.0;
            if (top >= tail) continue;                // already behind
            if (bottom < nose - lookAhead) continue;  // too far to matter
            best = std::min(best, nose - bottom);
        }
        return best;
    }

    void steer(const RaceView& v, InputLatch& in) {
        in.setBoost(settings_.holdBoost);
        if (!v.running || v.lanes.empty()) return;

        double here = clearance(v, v.laneIndex, settings_.lookAhead);
        if (std::isinf(here)) return;

        std::size_t target = v.laneIndex;
        double targetClear = here;
        for (std::size_t lane=0; lane<v.lanes.size(); ++lane) {
            if (lane == v.laneIndex) continue;
            // Only an adjacent lane can be reached this tick; farther ones
            // count only if the lane in between is passable.
            std::size_t step = lane < v.laneIndex ? v.laneIndex - 1 : v.laneIndex + 1;
            if (clearance(v, step, settings_.lookAhead) < 0.0) continue;
            double c = clearance(v, lane, settings_.lookAhead);
            if (c > targetClear) { target = lane; targetClear = c; }
        }
        if (target == v.laneIndex) return;
        if (target < v.laneIndex) in.setMoveLeft();
        else                      in.setMoveRight();
        LOG_TRACE(logger_, "Autopilot lane {} -> {} clearance {} -> {}",
                  v.laneIndex, target, here, targetClear);
    }

private:
    static std::size_t laneOf(const RaceView& v, double x) {
        std::size_t idx = 0;
        double bestDist = std::numeric_limits<double>::infinity();
        for (std::size_t i=0;i<v.lanes.size();++i) {
            double d = std::fabs(v.lanes[i] - x);
            if (d < bestDist) { bestDist = d; idx = i; }
        }
        return idx;
    }

    Settings settings_{};
    Logger*  logger_ = nullptr;
};

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>
#include "Obstacle.hpp"
#include "logger.hpp"

/* --------------------------------------------------------------------------
   Decides when traffic enters and what it looks like.
   The interval shrinks by 4 ms per unit of distance from 850 ms down to a
   350 ms floor, reached at distance 125.
---------------------------------------------------------------------------- */
class SpawnPolicy {
public:
    // Returns values in [0, 1).
    using UniformSource = std::function<double()>;

    static constexpr double kBaseIntervalMs   = 850.0;
    static constexpr double kMsPerDistance    = 4.0;
    static constexpr double kFloorIntervalMs  = 350.0;
    static constexpr double kMinSize          = 60.0;
    static constexpr double kSizeSpan         = 30.0;
    static constexpr double kWidthRatio       = 0.7;
    static constexpr double kMinSpeed         = 80.0;
    static constexpr double kSpeedSpan        = 80.0;
    static constexpr double kEntryGap         = 20.0;
    static constexpr double kMinHue           = 200.0;
    static constexpr double kHueSpan          = 80.0;

    SpawnPolicy() : SpawnPolicy(seededSource(std::random_device{}())) {}
    explicit SpawnPolicy(UniformSource src) : source_(std::move(src)) {
        if (!source_) source_ = seededSource(std::random_device{}());
    }

    static UniformSource seededSource(std::uint32_t seed) {
        auto gen = std::make_shared<std::mt19937>(seed);
        return [gen]() {
            return std::uniform_real_distribution<double>(0.0, 1.0)(*gen);
        };
    }

    void setLogger(Logger* l) { logger_ = l; }

    static double intervalMs(double distance) {
        return std::max(kFloorIntervalMs, kBaseIntervalMs - distance * kMsPerDistance);
    }

    // Advances `sinceLastMs` by deltaMs; appends one obstacle and zeroes the
    // timer when the interval for `distance` has been exceeded.
    // Returns true if it spawned.
    bool tick(double& sinceLastMs, double deltaMs, double distance,
              const std::vector<double>& lanes, std::vector<Obstacle>& out) {
        sinceLastMs += deltaMs;
        if (lanes.empty() || !(sinceLastMs > intervalMs(distance))) return false;
        out.push_back(make(lanes));
        sinceLastMs = 0.0;
        const Obstacle& o = out.back();
        LOG_TRACE(logger_, "Spawn x={} size={} vs={} live={}",
                  o.laneX, o.height, o.verticalSpeed, out.size());
        return true;
    }

private:
    double draw() {
        double u = source_();
        if (!(u >= 0.0)) return 0.0;
        return u < 1.0 ? u : std::nextafter(1.0, 0.0);
    }

    // lo + u*span can round up to lo+span for u just below 1; keep [lo, lo+span).
    double range(double lo, double span) {
        double hi = lo + span;
        double v = lo + draw() * span;
        return v < hi ? v : std::nextafter(hi, lo);
    }

    Obstacle make(const std::vector<double>& lanes) {
        auto lane = static_cast<std::size_t>(draw() * static_cast<double>(lanes.size()));
        lane = std::min(lane, lanes.size() - 1);
        double size = range(kMinSize, kSizeSpan);
        Obstacle o;
        o.laneX         = lanes[lane];
        o.width         = size * kWidthRatio;
        o.height        = size;
        o.verticalSpeed = range(kMinSpeed, kSpeedSpan);
        o.hue           = range(kMinHue, kHueSpan);
        o.y             = -(size + kEntryGap);
        return o;
    }

    UniformSource source_;
    Logger*       logger_ = nullptr;
};

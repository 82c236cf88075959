#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "Collision.hpp"
#include "InputLatch.hpp"
#include "Obstacle.hpp"
#include "RaceView.hpp"
#include "ScoreStore.hpp"
#include "SpawnPolicy.hpp"
#include "logger.hpp"
#include "profiler.hpp"

// Mutable world of one session. Replaced wholesale on restart.
struct SimulationState {
    bool                  running     = true;
    double                speed       = 0.0;
    double                distance    = 0.0;
    std::size_t           laneIndex   = 0;
    double                playerX     = 0.0;
    double                roadOffset  = 0.0;
    double                sinceSpawnMs = 0.0;
    std::vector<Obstacle> obstacles;
};

/* --------------------------------------------------------------------------
   The simulation context: owns the session state, the input inbox, the
   spawner and the best-score record. The host constructs one, feeds
   input(), calls tick() once per frame and renders view().
---------------------------------------------------------------------------- */
class Race {
public:
    struct Settings {
        std::vector<double> lanes         = {110.0, 210.0, 310.0};
        std::size_t  startLane            = 1;
        double       playerY              = 500.0;
        double       playerWidth          = 50.0;
        double       playerHeight         = 80.0;
        double       baseSpeed            = 140.0;
        double       boostBonus           = 80.0;
        double       smoothing            = 0.05;    // blend per tick, not per second
        double       viewHeight           = 640.0;
        double       despawnMargin        = 120.0;
        double       roadDivisor          = 120.0;
        double       roadPeriod           = 80.0;
        double       fallbackDeltaMs      = 16.0;
        double       maxDeltaMs           = 250.0;
    };

    explicit Race(KeyValueStore* store,
                  SpawnPolicy::UniformSource source = {},
                  Logger* logger = nullptr)
        : Race(Settings{}, store, std::move(source), logger) {}

    Race(const Settings& s, KeyValueStore* store,
         SpawnPolicy::UniformSource source = {},
         Logger* logger = nullptr)
        : spawner_(std::move(source)), best_(store), logger_(logger)
    {
        spawner_.setLogger(logger_);
        best_.setLogger(logger_);
        applySettings(s);
        best_.load();
        restart();
    }

    void setLogger(Logger* l) {
        logger_ = l;
        spawner_.setLogger(l);
        best_.setLogger(l);
    }
    void setProfiler(Profiler* p) { profiler_ = p; }

    const Settings&        settings() const { return settings_; }
    const SimulationState& state()    const { return state_; }
    InputLatch&            input()          { return input_; }
    const BestScore&       best()     const { return best_; }
    std::uint64_t          session()  const { return session_; }
    bool                   running()  const { return state_.running; }

    // Degenerate frame times (non-positive, NaN, stalls) become one
    // fallback tick rather than a jump.
    static double sanitizeDelta(double ms, const Settings& s) {
        if (!std::isfinite(ms) || ms <= 0.0 || ms > s.maxDeltaMs) return s.fallbackDeltaMs;
        return ms;
    }

    Box playerBox() const {
        return Box::centered(state_.playerX, settings_.playerY,
                             settings_.playerWidth, settings_.playerHeight);
    }

    void restart() {
        SimulationState fresh;
        fresh.laneIndex = settings_.startLane;
        fresh.playerX   = settings_.lanes[fresh.laneIndex];
        state_ = std::move(fresh);
        input_.clearPending();
        ++session_;
        LOG_INFO(logger_, "Session {} start lane={} best={}", session_, state_.laneIndex, best_.value());
    }

    // Advances one frame. Returns true if the session ended on this tick.
    bool tick(double deltaMs) {
        if (!state_.running) return false;
        PROF_SCOPE(profiler_, "Race:tick");

        double dt = sanitizeDelta(deltaMs, settings_);
        if (dt != deltaMs)
            LOG_DEBUG(logger_, "Delta {}ms replaced by {}ms", deltaMs, dt);

        {
            PROF_SCOPE(profiler_, "Race:physics");
            state_.laneIndex = input_.consume(state_.laneIndex, settings_.lanes.size());
            state_.playerX   = settings_.lanes[state_.laneIndex];

            double target = settings_.baseSpeed + (input_.boost() ? settings_.boostBonus : 0.0);
            state_.speed += (target - state_.speed) * settings_.smoothing;
            if (state_.speed < 0.0) state_.speed = 0.0;

            state_.distance += state_.speed * dt / 1000.0;

            state_.roadOffset += state_.speed * dt / settings_.roadDivisor;
            if (state_.roadOffset > settings_.roadPeriod) state_.roadOffset = 0.0;

            for (auto& o : state_.obstacles)
                o.y += (state_.speed + o.verticalSpeed) * dt / 1000.0;

            double limit = settings_.viewHeight + settings_.despawnMargin;
            state_.obstacles.erase(
                std::remove_if(state_.obstacles.begin(), state_.obstacles.end(),
                               [limit](const Obstacle& o){ return o.y >= limit; }),
                state_.obstacles.end());
        }

        {
            PROF_SCOPE(profiler_, "Race:spawn");
            spawner_.tick(state_.sinceSpawnMs, dt, state_.distance,
                          settings_.lanes, state_.obstacles);
        }

        std::size_t hit;
        {
            PROF_SCOPE(profiler_, "Race:collide");
            hit = CollisionDetector::firstHit(playerBox(), state_.obstacles);
        }
        if (hit == CollisionDetector::npos) return false;

        crash(hit);
        return true;
    }

    RaceView view() const {
        RaceView v;
        v.running      = state_.running;
        v.speed        = state_.speed;
        v.distance     = state_.distance;
        v.best         = best_.value();
        v.session      = session_;
        v.laneIndex    = state_.laneIndex;
        v.playerX      = state_.playerX;
        v.playerY      = settings_.playerY;
        v.playerWidth  = settings_.playerWidth;
        v.playerHeight = settings_.playerHeight;
        v.roadOffset   = state_.roadOffset;
        v.viewHeight   = settings_.viewHeight;
        v.lanes        = settings_.lanes;
        v.obstacles    = state_.obstacles;
        return v;
    }

private:
    void applySettings(const Settings& s) {
        const Settings def{};
        settings_ = s;
        if (settings_.lanes.empty()) settings_.lanes = def.lanes;
        if (settings_.startLane >= settings_.lanes.size())
            settings_.startLane = settings_.lanes.size() / 2;
        if (!(settings_.playerWidth > 0.0))  settings_.playerWidth  = def.playerWidth;
        if (!(settings_.playerHeight > 0.0)) settings_.playerHeight = def.playerHeight;
        if (!(settings_.baseSpeed >= 0.0))   settings_.baseSpeed    = def.baseSpeed;
        if (!(settings_.boostBonus >= 0.0))  settings_.boostBonus   = def.boostBonus;
        if (!(settings_.smoothing > 0.0 && settings_.smoothing <= 1.0))
            settings_.smoothing = def.smoothing;
        if (!(settings_.viewHeight > 0.0))   settings_.viewHeight   = def.viewHeight;
        if (!(settings_.despawnMargin >= 0.0)) settings_.despawnMargin = def.despawnMargin;
        if (!(settings_.roadDivisor > 0.0))  settings_.roadDivisor  = def.roadDivisor;
        if (!(settings_.roadPeriod > 0.0))   settings_.roadPeriod   = def.roadPeriod;
        if (!(settings_.fallbackDeltaMs > 0.0)) settings_.fallbackDeltaMs = def.fallbackDeltaMs;
        if (!(settings_.maxDeltaMs >= settings_.fallbackDeltaMs))
            settings_.maxDeltaMs = std::max(def.maxDeltaMs, settings_.fallbackDeltaMs);
        LOG_INFO(logger_,
                 "Race lanes={} startLane={} baseSpeed={} boost={} smoothing={} view={} fallbackDelta={}ms maxDelta={}ms",
                 settings_.lanes.size(), settings_.startLane, settings_.baseSpeed,
                 settings_.boostBonus, settings_.smoothing, settings_.viewHeight,
                 settings_.fallbackDeltaMs, settings_.maxDeltaMs);
    }

    void crash(std::size_t hit) {
        state_.running = false;
        auto rounded = static_cast<std::int64_t>(std::llround(state_.distance));
        bool record = best_.offer(rounded);
        const Obstacle& o = state_.obstacles[hit];
        LOG_INFO(logger_, "Crash session={} distance={} best={} newBest={} obstacle x={} y={}",
                 session_, rounded, best_.value(), record, o.laneX, o.y);
    }

    Settings        settings_{};
    SimulationState state_{};
    InputLatch      input_{};
    SpawnPolicy     spawner_;
    BestScore       best_;
    std::uint64_t   session_  = 0;
    Logger*         logger_   = nullptr;
    Profiler*       profiler_ = nullptr;
};

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "logger.hpp"
#include "profiler.hpp"

/* --------------------------------------------------------------------------
   Host frame loop. Each frame runs the enabled phases in order, each
   phase's subsystems in registration order, all on the calling thread.
   Subsystems receive the frame number and the elapsed time since the
   previous frame in milliseconds (or the fixed delta, when set).
---------------------------------------------------------------------------- */
class FrameDriver {
public:
    using Clock = std::chrono::steady_clock;
    using Millis = std::chrono::duration<double, std::milli>;

    struct Settings {
        double        hz               = 60.0;
        std::int64_t  maxFrames        = -1;     // < 0: until requestExit()
        double        fixedDeltaMs     = 0.0;    // > 0: report this instead of wall time
        bool          realtime         = true;   // pace frames to hz
        int           driftLogInterval = 600;
        int           spinMicros       = 200;
        bool          logPhases        = false;
    };

    using Subsystem = std::function<void(std::int64_t frame, double deltaMs)>;

    struct Phase {
        std::string            name;
        std::vector<Subsystem> subsystems;
        bool                   enabled = true;
    };

    FrameDriver() : FrameDriver(Settings{}) {}
    explicit FrameDriver(const Settings& s, Logger* logger = nullptr)
        : logger_(logger) { applySettings(s); }

    void setLogger(Logger* l)    { logger_ = l; }
    void setProfiler(Profiler* p){ profiler_ = p; }

    void applySettings(const Settings& s) {
        settings_ = s;
        if (!(settings_.hz > 0.0)) settings_.hz = 60.0;
        if (settings_.fixedDeltaMs < 0.0) settings_.fixedDeltaMs = 0.0;
        if (settings_.spinMicros < 0) settings_.spinMicros = 0;
        period_ = Millis{1000.0 / settings_.hz};
        LOG_INFO(logger_,
                 "Driver hz={} maxFrames={} fixedDelta={}ms realtime={} driftInterval={} spinMicros={}",
                 settings_.hz, settings_.maxFrames, settings_.fixedDeltaMs,
                 settings_.realtime, settings_.driftLogInterval, settings_.spinMicros);
    }
    const Settings& settings() const { return settings_; }

    std::size_t addPhase(const std::string& name) {
        phases_.push_back(Phase{name, {}, true});
        LOG_DEBUG(logger_, "AddPhase '{}'", name);
        return phases_.size()-1;
    }
    void addSubsystem(std::size_t phaseIndex, Subsystem fn) {
        phases_[phaseIndex].subsystems.push_back(std::move(fn));
        LOG_TRACE(logger_, "Add subsystem to phase '{}'", phases_[phaseIndex].name);
    }
    void setPhaseEnabled(std::size_t phaseIndex, bool on) {
        phases_[phaseIndex].enabled = on;
        LOG_DEBUG(logger_, "Phase '{}' enabled={}", phases_[phaseIndex].name, on);
    }

    void requestExit() { terminate_ = true; }
    bool exitRequested() const { return terminate_; }
    std::int64_t frame() const { return frame_; }
    double lastDeltaMs() const { return lastDeltaMs_; }
    double lastDriftMs() const { return lastDriftMs_; }

    void run() {
        LOG_INFO(logger_, "Run loop start");
        startReal_ = Clock::now();
        lastFrameTime_ = startReal_;
        nextFrameTarget_ = startReal_;
        while (advance()) { /* loop */ }
        LOG_INFO(logger_, "Run loop end frame={}", frame_);
    }

    // Runs one frame with an explicit delta; run() calls this with the
    // measured one.
    void step(double deltaMs) {
        PROF_SCOPE(profiler_, "Frame");
        lastDeltaMs_ = deltaMs;
        for (auto& ph : phases_) {
            if (!ph.enabled) continue;
            if (settings_.logPhases)
                LOG_DEBUG(logger_, "PhaseBegin '{}' frame={}", ph.name, frame_);
            PROF_SCOPE(profiler_, "Phase:" + ph.name);
            for (auto& sub : ph.subsystems)
                sub(frame_, deltaMs);
            if (settings_.logPhases)
                LOG_DEBUG(logger_, "PhaseEnd   '{}' frame={}", ph.name, frame_);
        }
        ++frame_;
        if ((frame_ & 0xFFF) == 0)
            LOG_INFO(logger_, "Progress frame={}", frame_);
    }

private:
    bool done() const {
        return terminate_ || (settings_.maxFrames >= 0 && frame_ >= settings_.maxFrames);
    }

    bool advance() {
        if (done()) return false;

        auto now = Clock::now();
        double delta = settings_.fixedDeltaMs > 0.0
                     ? settings_.fixedDeltaMs
                     : Millis(now - lastFrameTime_).count();
        lastFrameTime_ = now;
        step(delta);

        if (settings_.realtime) {
            nextFrameTarget_ += std::chrono::duration_cast<Clock::duration>(period_);
            // More than a frame late: drop the backlog, one update per frame.
            if (Clock::now() > nextFrameTarget_ + std::chrono::duration_cast<Clock::duration>(period_))
                nextFrameTarget_ = Clock::now();
            waitUntil(nextFrameTarget_);
        }
        logDrift();
        return !done();
    }

    void waitUntil(Clock::time_point target) {
        auto spinBudget = std::chrono::microseconds(settings_.spinMicros);
        for (;;) {
            auto now = Clock::now();
            if (now + spinBudget >= target) {
                while (Clock::now() < target)
                    std::this_thread::yield();
                break;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    void logDrift() {
        if (settings_.driftLogInterval <= 0) return;
        if (frame_ % settings_.driftLogInterval) return;
        double simT  = static_cast<double>(frame_) * period_.count() / 1000.0;
        double realT = std::chrono::duration<double>(Clock::now() - startReal_).count();
        lastDriftMs_ = (simT - realT) * 1000.0;
        LOG_INFO(logger_, "[DRIFT] frame={} simT={}s realT={}s drift={}ms",
                 frame_, simT, realT, lastDriftMs_);
    }

    Settings               settings_{};
    std::vector<Phase>     phases_;
    std::int64_t           frame_      = 0;
    bool                   terminate_  = false;

    Millis                 period_{1000.0 / 60.0};
    Clock::time_point      nextFrameTarget_{};
    Clock::time_point      lastFrameTime_{};
    Clock::time_point      startReal_{};
    double                 lastDeltaMs_ = 0.0;
    double                 lastDriftMs_ = 0.0;

    Logger*   logger_   = nullptr;
    Profiler* profiler_ = nullptr;
};

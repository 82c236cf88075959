#include <gtest/gtest.h>
#include <cmath>
#include <string>
#include <vector>
#include "FrameDriver.hpp"
#include "Race.hpp"
#include "ScoreStore.hpp"
#include "logger.hpp"
#include "scripted_source.hpp"

namespace {

FrameDriver::Settings headless(std::int64_t frames) {
    FrameDriver::Settings s;
    s.maxFrames = frames;
    s.fixedDeltaMs = 16.0;
    s.realtime = false;
    s.driftLogInterval = 0;
    return s;
}

}

TEST(FrameDriver, RunsExactFrames) {
    Logger log; log.setLevel(Logger::Level::Error);
    FrameDriver driver(headless(600), &log);

    int calls = 0;
    auto phase = driver.addPhase("Update");
    driver.addSubsystem(phase, [&](std::int64_t, double deltaMs){
        EXPECT_DOUBLE_EQ(deltaMs, 16.0);
        ++calls;
    });

    driver.run();
    EXPECT_EQ(driver.frame(), 600);
    EXPECT_EQ(calls, 600);
    EXPECT_DOUBLE_EQ(driver.lastDeltaMs(), 16.0);
}

TEST(FrameDriver, PhasesRunInOrder) {
    FrameDriver driver(headless(2));
    std::vector<std::string> seen;
    auto input  = driver.addPhase("Input");
    auto update = driver.addPhase("Update");
    auto render = driver.addPhase("Render");
    driver.addSubsystem(render, [&](std::int64_t f, double){ seen.push_back("render" + std::to_string(f)); });
    driver.addSubsystem(input,  [&](std::int64_t f, double){ seen.push_back("input"  + std::to_string(f)); });
    driver.addSubsystem(update, [&](std::int64_t f, double){ seen.push_back("update" + std::to_string(f)); });

    driver.run();
    std::vector<std::string> expected = {
        "input0", "update0", "render0", "input1", "update1", "render1"};
    EXPECT_EQ(seen, expected);
}

TEST(FrameDriver, DisabledPhaseIsSkipped) {
    FrameDriver driver(headless(5));
    int renders = 0;
    auto render = driver.addPhase("Render");
    driver.addSubsystem(render, [&](std::int64_t, double){ ++renders; });
    driver.setPhaseEnabled(render, false);
    driver.run();
    EXPECT_EQ(renders, 0);
    EXPECT_EQ(driver.frame(), 5);
}

TEST(FrameDriver, ExitRequestEndsTheLoop) {
    FrameDriver driver(headless(-1));
    auto phase = driver.addPhase("Update");
    driver.addSubsystem(phase, [&](std::int64_t f, double){
        if (f == 9) driver.requestExit();
    });
    driver.run();
    EXPECT_TRUE(driver.exitRequested());
    EXPECT_EQ(driver.frame(), 10);
}

TEST(FrameDriver, WallClockDeltaIsMeasured) {
    FrameDriver::Settings s;
    s.hz = 200.0;
    s.maxFrames = 20;
    s.driftLogInterval = 10;
    FrameDriver driver(s);

    std::vector<double> deltas;
    auto phase = driver.addPhase("Update");
    driver.addSubsystem(phase, [&](std::int64_t, double d){ deltas.push_back(d); });
    driver.run();

    ASSERT_EQ(deltas.size(), 20u);
    for (std::size_t i=1;i<deltas.size();++i) EXPECT_GT(deltas[i], 0.0);
    EXPECT_TRUE(std::isfinite(driver.lastDriftMs()));
}

TEST(FrameDriver, BadSettingsAreSanitised) {
    FrameDriver::Settings s;
    s.hz = 0.0;
    s.fixedDeltaMs = -3.0;
    s.spinMicros = -1;
    FrameDriver driver(s);
    EXPECT_DOUBLE_EQ(driver.settings().hz, 60.0);
    EXPECT_DOUBLE_EQ(driver.settings().fixedDeltaMs, 0.0);
    EXPECT_EQ(driver.settings().spinMicros, 0);
}

TEST(FrameDriver, DrivesARaceToItsCrash) {
    MemoryStore store;
    Race race(&store, constantSource(0.5));
    FrameDriver driver(headless(10000));

    auto update = driver.addPhase("Update");
    auto render = driver.addPhase("Render");
    RaceView view = race.view();
    driver.addSubsystem(update, [&](std::int64_t, double deltaMs){
        if (race.tick(deltaMs)) driver.requestExit();
    });
    driver.addSubsystem(render, [&](std::int64_t, double){ view = race.view(); });

    driver.run();
    EXPECT_LT(driver.frame(), 10000);
    EXPECT_FALSE(view.running);
    EXPECT_EQ(view.best, view.displayDistance());
}

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "FrameDriver.hpp"
#include "Race.hpp"
#include "ScoreStore.hpp"
#include "logger.hpp"
#include "profiler.hpp"
#include "scripted_source.hpp"

TEST(ProfilerIntegration, CollectsFramePhaseAndRaceStages) {
#ifdef PROF_ENABLED
    FrameDriver::Settings s;
    s.maxFrames = 100;
    s.fixedDeltaMs = 16.0;
    s.realtime = false;
    s.driftLogInterval = 0;

    Logger log; log.setLevel(Logger::Level::Error);
    Profiler prof;

    MemoryStore store;
    Race race(&store, constantSource(0.0), &log);
    race.setProfiler(&prof);

    FrameDriver driver(s, &log);
    driver.setProfiler(&prof);
    auto phase = driver.addPhase("Update");
    driver.addSubsystem(phase, [&](std::int64_t, double d){ race.tick(d); });

    driver.run();

    bool foundFrame=false, foundPhase=false, foundTick=false, foundCollide=false;
    for (auto& e : prof.summary()) {
        if (e.name == "Frame")         { foundFrame = true; EXPECT_EQ(e.count, 100u); }
        if (e.name == "Phase:Update")  foundPhase = true;
        if (e.name == "Race:tick")     foundTick = true;
        if (e.name == "Race:collide")  foundCollide = true;
    }
    EXPECT_TRUE(foundFrame);
    EXPECT_TRUE(foundPhase);
    EXPECT_TRUE(foundTick);
    EXPECT_TRUE(foundCollide);

    prof.reset();
    EXPECT_TRUE(prof.summary().empty());
#else
    GTEST_SKIP() << "Profiler disabled";
#endif
}

TEST(ProfilerIntegration, ScopeCoversTheRestOfTheBlock) {
#ifdef PROF_ENABLED
    Profiler prof;
    {
        PROF_SCOPE(&prof, "Block");
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        EXPECT_TRUE(prof.summary().empty());
    }
    auto entries = prof.summary();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "Block");
    EXPECT_EQ(entries[0].count, 1u);
    EXPECT_GE(entries[0].totalNs, 3.0e6L);
#else
    GTEST_SKIP() << "Profiler disabled";
#endif
}

TEST(ProfilerIntegration, NullProfilerIsHarmless) {
    MemoryStore store;
    Race race(&store, constantSource(0.0));
    race.setProfiler(nullptr);
    for (int i=0;i<10;++i) race.tick(16.0);
    EXPECT_TRUE(race.running());
}

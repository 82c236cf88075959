#include "FrameDriver.hpp"
#include "Race.hpp"
#include "Autopilot.hpp"
#include "ScoreStore.hpp"
#include "logger.hpp"
#include "profiler.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static double parseDouble(const char* s, double def){ if(!s) return def; char* e=nullptr; double v=strtod(s,&e); return (e && e!=s && *e==0)? v: def; }
static long   parseLong  (const char* s, long def){ if(!s) return def; char* e=nullptr; long v=strtol(s,&e,10); return (e && e!=s && *e==0)? v: def; }

static void usage(const char* argv0) {
    std::cout <<
        "usage: " << argv0 << " [options]\n"
        "  --hz N              frame rate (default 60)\n"
        "  --frames N          stop after N frames (default 36000, -1 = no limit)\n"
        "  --fixed-delta MS    report a fixed frame time instead of wall time\n"
        "  --realtime 0|1      pace frames to --hz (default 1)\n"
        "  --seed N            seed for traffic generation\n"
        "  --store PATH        best-score file (default neon_sprint.scores)\n"
        "  --sessions N        sessions to play before exiting (default 1)\n"
        "  --boost             hold boost the whole time\n"
        "  --no-autopilot      drive straight ahead\n"
        "  --hud-every N       HUD line every N frames (default 60, 0 = off)\n"
        "  --log-level LEVEL   trace|debug|info|warn|error|none\n"
        "  --log-file PATH     also append log lines to PATH\n";
}

int main(int argc, char* argv[]) {
    FrameDriver::Settings drv;
    drv.maxFrames = 36000;       // ten minutes at 60 Hz
    Race::Settings race;
    Autopilot::Settings pilot;
    std::string storePath = "neon_sprint.scores";
    std::string logFile;
    long sessions = 1;
    long hudEvery = 60;
    long seed = -1;
    bool autopilot = true;
    Logger::Level level = Logger::Level::Info;

    for (int i=1;i<argc;++i){
        if (std::strcmp(argv[i],"--help")==0 || std::strcmp(argv[i],"-h")==0) { usage(argv[0]); return 0; }
        else if (std::strcmp(argv[i],"--hz")==0 && i+1<argc) drv.hz = parseDouble(argv[++i], drv.hz);
        else if (std::strcmp(argv[i],"--frames")==0 && i+1<argc) drv.maxFrames = parseLong(argv[++i], (long)drv.maxFrames);
        else if (std::strcmp(argv[i],"--fixed-delta")==0 && i+1<argc) drv.fixedDeltaMs = parseDouble(argv[++i], drv.fixedDeltaMs);
        else if (std::strcmp(argv[i],"--realtime")==0 && i+1<argc) drv.realtime = parseLong(argv[++i], 1) != 0;
        else if (std::strcmp(argv[i],"--seed")==0 && i+1<argc) seed = parseLong(argv[++i], seed);
        else if (std::strcmp(argv[i],"--store")==0 && i+1<argc) storePath = argv[++i];
        else if (std::strcmp(argv[i],"--sessions")==0 && i+1<argc) sessions = parseLong(argv[++i], sessions);
        else if (std::strcmp(argv[i],"--boost")==0) pilot.holdBoost = true;
        else if (std::strcmp(argv[i],"--no-autopilot")==0) autopilot = false;
        else if (std::strcmp(argv[i],"--hud-every")==0 && i+1<argc) hudEvery = parseLong(argv[++i], hudEvery);
        else if (std::strcmp(argv[i],"--log-level")==0 && i+1<argc) {
            const char* v = argv[++i];
            if (!Logger::parseLevel(v, level))
                std::cerr << "unknown log level '" << v << "', keeping info\n";
        }
        else if (std::strcmp(argv[i],"--log-file")==0 && i+1<argc) logFile = argv[++i];
        else { std::cerr << "unknown option '" << argv[i] << "'\n"; usage(argv[0]); return 2; }
    }
    if (sessions < 1) sessions = 1;

    Logger logger;
    logger.setLevel(level);
    logger.addSink(std::make_shared<Logger::StdoutSink>());
    if (!logFile.empty()) {
        auto file = std::make_shared<Logger::FileSink>(logFile);
        if (file->ok()) logger.addSink(file);
        else LOG_WARN(&logger, "Cannot open log file '{}'", logFile);
    }

    Profiler profiler;

    FileStore store(storePath);
    store.setLogger(&logger);

    SpawnPolicy::UniformSource source;
    if (seed >= 0) source = SpawnPolicy::seededSource(static_cast<std::uint32_t>(seed));

    Race game(race, &store, source, &logger);
    game.setProfiler(&profiler);

    Autopilot bot(pilot);
    bot.setLogger(&logger);

    FrameDriver driver(drv, &logger);
    driver.setProfiler(&profiler);

    auto input  = driver.addPhase("Input");
    auto update = driver.addPhase("Update");
    auto render = driver.addPhase("Render");

    RaceView view = game.view();
    long played = 0;

    driver.addSubsystem(input, [&](std::int64_t, double){
        if (autopilot) bot.steer(view, game.input());
        else game.input().setBoost(pilot.holdBoost);
    });

    driver.addSubsystem(update, [&](std::int64_t f, double deltaMs){
        if (!game.running()) {
            if (played >= sessions) { driver.requestExit(); return; }
            game.restart();
        }
        if (game.tick(deltaMs)) {
            ++played;
            LOG_INFO(&logger, "Crash! frame={} distance={} best={} (session {}/{})",
                     f, game.view().displayDistance(), game.best().value(), played, sessions);
        }
    });

    driver.addSubsystem(render, [&](std::int64_t f, double){
        view = game.view();
        if (hudEvery > 0 && view.running && f % hudEvery == 0)
            LOG_INFO(&logger, "HUD speed={} distance={} best={} lane={} traffic={}",
                     view.displaySpeed(), view.displayDistance(), view.best,
                     view.laneIndex, view.obstacles.size());
    });

    driver.run();

    if (game.best().lastWriteFailed())
        LOG_WARN(&logger, "Best score {} could not be saved to '{}'", game.best().value(), store.path());
    profiler.dump(&logger);

    std::cout << "sessions=" << played
              << " frames=" << driver.frame()
              << " last=" << game.view().displayDistance()
              << " best=" << game.best().value()
              << "\n";
    return 0;
}

#include "core/config.hpp"
#include "core/money.hpp"
#include "engine/simulation_engine.hpp"
#include "io/snapshot_json.hpp"
#include "strategy/restocker.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace core;
using namespace engine;
using namespace strategy;

// Global stop signal
std::atomic<bool> running{true};

// Graceful shutdown on Ctrl+C
void signalHandler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    GameConfig config;
    HostOptions options;
    try {
        options = parseHostOptions(std::vector<std::string>(argv + 1, argv + argc));
        if (std::filesystem::exists(options.config_path)) {
            config = loadConfig(options.config_path);
        }
        if (options.preset) config.preset = presetByName(*options.preset);
        if (options.seed) config.seed = *options.seed;
        if (options.verbose) config.verbose = *options.verbose;
        validateConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] Bad configuration: " << ex.what() << std::endl;
        return 1;
    }

    const uint32_t days = options.days;
    const uint32_t speed = options.speed;
    const bool fast = options.fast;
    const std::chrono::milliseconds cadence(100);

    std::cout << "[ENGINE] Preset: " << config.preset.name
              << ", Seed: " << config.seed
              << ", Days: " << days
              << ", Speed: " << speed << "x"
              << (fast ? " (unthrottled)" : "") << "\n";

    signal(SIGINT, signalHandler);

    SimulationEngine simulation(config);

    // the strategy runs on this thread, so it may apply commands directly
    std::unique_ptr<Strategy> player = std::make_unique<Restocker>(
        [&](const Command& c) { return simulation.apply(c); },
        config.preset.starting_cash / 5);

    // display stand-in: reads committed snapshots from another thread
    std::thread reporter([&]() {
        while (running) {
            auto snap = simulation.latest();
            std::cout << "[STATUS] " << snap->time.toString()
                      << " | Cash " << formatCents(snap->cash)
                      << " | Reputation " << snap->reputation_stars << "/5"
                      << " | Orders " << snap->orders.size()
                      << " | Lots " << snap->inventory.size() << std::endl;
            for (int i = 0; i < 20 && running; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
    });

    uint64_t last_printed = 0;
    auto print_activity = [&](const Snapshot& snap) {
        for (const auto& record : snap.activity) {
            if (record.sequence <= last_printed) continue;
            std::cout << "  " << GameTime{record.day, record.minute}.toString() << "  " << record.message << "\n";
            last_printed = record.sequence;
        }
    };

    auto snapshot = simulation.latest();
    print_activity(*snapshot);

    while (running && snapshot->time.day <= days) {
        snapshot = simulation.tick(cadence * speed);
        player->onSnapshot(*snapshot);
        snapshot = simulation.latest();
        print_activity(*snapshot);

        if (!fast) {
            std::this_thread::sleep_for(cadence);
        }
    }

    running = false;
    reporter.join();

    player->printSummary();

    try {
        std::filesystem::create_directories("logs");
        io::exportSummary(*snapshot, "logs/summary.json");
        io::exportSnapshot(*snapshot, "logs/final_state.json");
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "[ENGINE] Final cash " << formatCents(snapshot->cash)
              << ", profit " << formatCents(snapshot->analytics.totalProfit()) << "\n";
    std::cout << "[ENGINE] Shutdown complete.\n";
    return 0;
}

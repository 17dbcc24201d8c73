#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include "core/cache/manager/CacheStore.hpp"
#include "core/common/Clock.hpp"
#include "core/maintenance/MaintenanceScheduler.hpp"

using namespace infercache::core;
using cache::CacheCategory;
using cache::Payload;
using maintenance::MaintenanceConfig;
using maintenance::MaintenanceScheduler;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

void smokeTestCacheMaintenance() {
    auto dir = fs::temp_directory_path() / "infercache_test_maintenance";
    fs::remove_all(dir);

    auto clock = std::make_shared<common::ManualClock>();
    cache::CacheConfig cacheConfig;
    cacheConfig.directory = dir.string();
    auto store = std::make_shared<cache::CacheStore>(cacheConfig, clock);
    assert(store->initialize());

    MaintenanceScheduler maintenance(MaintenanceConfig{}, clock);
    maintenance.registerCacheMaintenance(store);
    assert(maintenance.taskNames().size() == 2);
    assert(maintenance.runDue() == 0);

    assert(store->put(CacheCategory::Suggestions, "short", Payload::fromString("text/plain", "beach"),
                      std::chrono::seconds(600)));
    assert(store->put(CacheCategory::Suggestions, "long", Payload::fromString("text/plain", "mountains")));
    clock->advance(61min);
    assert(maintenance.runDue() == 1);
    assert(maintenance.runCount("cleanup") == 1);
    assert(store->stats().entryCount == 1);
    assert(store->get(CacheCategory::Suggestions, "long"));

    {
        std::ofstream orphan(dir / "suggestions_orphan.bin", std::ios::binary);
        orphan << "stray";
    }
    clock->advance(5h);
    // Пропущенные периоды очистки не наверстываются
    assert(maintenance.runDue() == 2);
    assert(maintenance.runCount("cleanup") == 2);
    assert(maintenance.runCount("reconcile") == 1);
    assert(!fs::exists(dir / "suggestions_orphan.bin"));

    store.reset();
    fs::remove_all(dir);
    std::cout << "[OK] MaintenanceScheduler cache tasks\n";
}

void smokeTestFailingTask() {
    auto clock = std::make_shared<common::ManualClock>();
    MaintenanceScheduler maintenance(MaintenanceConfig{}, clock);
    int counter = 0;
    maintenance.addTask("broken", 1s, [] { throw std::runtime_error("disk unavailable"); });
    maintenance.addTask("counter", 1s, [&counter] { ++counter; });

    clock->advance(2s);
    assert(maintenance.runDue() == 2);
    assert(counter == 1);
    assert(maintenance.runCount("broken") == 1);
    assert(maintenance.runCount("missing") == 0);
    std::cout << "[OK] MaintenanceScheduler failing task\n";
}

void smokeTestBackgroundWorker() {
    auto clock = std::make_shared<common::ManualClock>();
    MaintenanceConfig config;
    config.pollInterval = 10ms;
    MaintenanceScheduler maintenance(config, clock);
    std::atomic<int> runs{0};
    maintenance.addTask("tick", 1s, [&runs] { ++runs; });

    assert(maintenance.start());
    assert(!maintenance.start());
    assert(maintenance.isRunning());

    clock->advance(2s);
    for (int i = 0; i < 200 && runs == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    maintenance.stop();
    assert(runs == 1);
    assert(!maintenance.isRunning());

    MaintenanceConfig disabled;
    disabled.enabled = false;
    MaintenanceScheduler idle(disabled, clock);
    assert(!idle.start());

    auto restored = MaintenanceConfig::fromJson(config.toJson());
    assert(restored.pollInterval == 10ms);
    assert(restored.validate());
    std::cout << "[OK] MaintenanceScheduler background worker\n";
}

int main() {
    smokeTestCacheMaintenance();
    smokeTestFailingTask();
    smokeTestBackgroundWorker();
    std::cout << "All MaintenanceScheduler tests passed!\n";
    return 0;
}

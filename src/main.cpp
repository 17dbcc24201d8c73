#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <random>
#include <signal.h>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/balancer/AdaptiveConcurrencyController.hpp"
#include "core/cache/manager/CacheStore.hpp"
#include "core/common/Clock.hpp"
#include "core/common/InferenceError.hpp"
#include "core/common/Logging.hpp"
#include "core/config/ServiceConfig.hpp"
#include "core/maintenance/MaintenanceScheduler.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/platform/ResourceProbe.hpp"
#include "core/scheduler/RequestScheduler.hpp"

using namespace infercache::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::shared_ptr<cache::CacheStore> g_cache;
std::shared_ptr<balancer::AdaptiveConcurrencyController> g_controller;
std::shared_ptr<metrics::PerformanceMonitor> g_monitor;
std::shared_ptr<scheduler::RequestScheduler> g_scheduler;
std::shared_ptr<maintenance::MaintenanceScheduler> g_maintenance;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Load configuration from the optional command line argument
config::ServiceConfig loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        return config::ServiceConfig::loadFromFile(argv[1]);
    }
    return config::ServiceConfig{};
}

// Initialize core components
void initializeComponents(const config::ServiceConfig& cfg) {
    spdlog::info("Initializing core components...");

    try {
        auto clock = std::make_shared<common::SystemClock>();

        g_cache = std::make_shared<cache::CacheStore>(cfg.cacheConfig, clock);
        if (!g_cache->initialize()) {
            spdlog::warn("Cache store unavailable, requests will bypass the cache");
        } else {
            spdlog::info("Cache store initialized in '{}'", cfg.cacheConfig.directory);
        }

        auto probe = std::make_shared<platform::SystemResourceProbe>();
        g_controller = std::make_shared<balancer::AdaptiveConcurrencyController>(cfg.concurrencyConfig, probe);
        spdlog::info("Concurrency controller initialized, limit {}", g_controller->currentLimit());

        g_monitor = std::make_shared<metrics::PerformanceMonitor>();

        g_scheduler = std::make_shared<scheduler::RequestScheduler>(
            cfg.schedulerConfig, cfg.timeoutConfig, cfg.retryConfig, g_cache, g_controller, g_monitor);
        spdlog::info("Request scheduler initialized");

        g_maintenance = std::make_shared<maintenance::MaintenanceScheduler>(cfg.maintenanceConfig, clock);
        g_maintenance->registerCacheMaintenance(g_cache);
        g_maintenance->start();

        spdlog::info("All components initialized successfully");
    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize components: {}", e.what());
        throw;
    }
}

// Simulated inference backend: variable latency and occasional transient failures
scheduler::Executor makeBackendCall(const scheduler::InferenceRequest& request, unsigned seed) {
    return [request, seed](const scheduler::CancellationToken& token) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> latency(50, 300);
        std::uniform_int_distribution<int> failure(0, 9);

        if (token.waitFor(std::chrono::milliseconds(latency(rng)))) {
            throw common::InferenceError(common::ErrorKind::Cancelled, "backend call cancelled");
        }
        if (failure(rng) == 0) {
            throw common::InferenceError(common::ErrorKind::NetworkTransient, "simulated connection reset");
        }

        nlohmann::json result = {
            {"kind", scheduler::toString(request.kind)},
            {"input", request.parameters},
            {"confidence", 0.5 + (seed % 50) / 100.0}
        };
        return cache::Payload::fromJson("application/json", result);
    };
}

// Client workload: bursts of partially duplicated requests
void runWorkload(size_t rounds) {
    spdlog::info("Starting workload: {} rounds", rounds);

    const std::vector<scheduler::RequestKind> kinds = scheduler::allRequestKinds();
    const std::vector<std::string> items = {"laptop", "charger", "passport", "jacket", "camera"};

    for (size_t round = 0; round < rounds && g_running; ++round) {
        std::vector<std::thread> clients;
        for (size_t client = 0; client < 8; ++client) {
            clients.emplace_back([&, round, client] {
                scheduler::InferenceRequest request;
                request.kind = kinds[(round + client / 2) % kinds.size()];
                request.priority = static_cast<scheduler::RequestPriority>(client % 4);
                request.parameters = {{"item", items[(round + client / 4) % items.size()]}};

                try {
                    auto payload = g_scheduler->enqueue(request,
                        makeBackendCall(request, static_cast<unsigned>(round * 31 + client)));
                    spdlog::debug("Client {} received {} bytes", client, payload.size());
                } catch (const common::InferenceError& e) {
                    spdlog::warn("Client {} request failed ({}): {}", client, common::toString(e.kind()), e.what());
                }
            });
        }
        for (auto& t : clients) {
            t.join();
        }

        auto status = g_scheduler->getQueueStatus();
        spdlog::info("Round {} done: limit {}, network {}, avg RTT {:.2f}s",
            round, status.limit, status.networkQuality, status.averageRttSeconds);
    }

    spdlog::info("Workload finished");
}

// Graceful shutdown
void shutdown() {
    spdlog::info("Initiating graceful shutdown...");

    try {
        if (g_maintenance) {
            g_maintenance->stop();
        }
        if (g_scheduler) {
            g_scheduler->shutdown();
        }
        if (g_cache) {
            g_cache->waitForBackgroundTasks();
        }
        spdlog::info("All components shut down successfully");
    } catch (const std::exception& e) {
        spdlog::error("Error during shutdown: {}", e.what());
    }
}

int main(int argc, char* argv[]) {
    try {
        // Set up signal handlers
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        auto cfg = loadConfiguration(argc, argv);
        common::initializeLogging(cfg.loggingConfig, "infercache_service");
        spdlog::info("=== InferCache Service Starting ===");

        initializeComponents(cfg);
        runWorkload(argc > 2 ? std::stoul(argv[2]) : 10);

        nlohmann::json report = {
            {"cache", g_scheduler->stats().toJson()},
            {"requests", g_monitor->toJson()},
            {"queue", g_scheduler->getQueueStatus().toJson()},
            {"concurrency", g_controller->snapshot().toJson()}
        };
        g_monitor->logSummary();
        std::cout << report.dump(2) << std::endl;

        shutdown();

        spdlog::info("=== InferCache Service Shutdown Complete ===");
        return 0;

    } catch (const common::InferenceError& e) {
        std::cerr << "Service error (" << common::toString(e.kind()) << "): " << e.what() << std::endl;
        return e.kind() == common::ErrorKind::Configuration ? 2 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/cache/manager/CacheStore.hpp"
#include "core/common/Clock.hpp"

namespace infercache {
namespace core {
namespace maintenance {

// Периодичность обслуживания хранилища
struct MaintenanceConfig {
    bool enabled = true;
    std::chrono::seconds cleanupInterval{60 * 60};          // Просроченные записи и бюджет
    std::chrono::seconds reconcileInterval{6 * 60 * 60};    // Сверка индекса с файлами
    std::chrono::milliseconds pollInterval{1000};           // Период проверки в фоновом потоке

    bool validate() const {
        return cleanupInterval.count() > 0 && reconcileInterval.count() > 0 && pollInterval.count() > 0;
    }

    nlohmann::json toJson() const {
        return {
            {"enabled", enabled},
            {"cleanup_interval_seconds", cleanupInterval.count()},
            {"reconcile_interval_seconds", reconcileInterval.count()},
            {"poll_interval_ms", pollInterval.count()}
        };
    }

    static MaintenanceConfig fromJson(const nlohmann::json& j) { return fromJson(j, MaintenanceConfig{}); }
    static MaintenanceConfig fromJson(const nlohmann::json& j, const MaintenanceConfig& defaults) {
        MaintenanceConfig config = defaults;
        config.enabled = j.value("enabled", defaults.enabled);
        config.cleanupInterval = std::chrono::seconds(
            j.value("cleanup_interval_seconds", static_cast<int64_t>(defaults.cleanupInterval.count())));
        config.reconcileInterval = std::chrono::seconds(
            j.value("reconcile_interval_seconds", static_cast<int64_t>(defaults.reconcileInterval.count())));
        config.pollInterval = std::chrono::milliseconds(
            j.value("poll_interval_ms", static_cast<int64_t>(defaults.pollInterval.count())));
        return config;
    }
};

/**
 * @brief Планировщик периодических задач обслуживания
 *
 * Время берётся из внедрённого common::Clock: в тестах используется
 * ManualClock и runDue(), в сервисе фоновый поток (start()).
 * Первый запуск задачи происходит через interval после регистрации.
 */
class MaintenanceScheduler {
public:
    MaintenanceScheduler(const MaintenanceConfig& config, std::shared_ptr<const common::Clock> clock);
    ~MaintenanceScheduler();

    MaintenanceScheduler(const MaintenanceScheduler&) = delete;
    MaintenanceScheduler& operator=(const MaintenanceScheduler&) = delete;

    void addTask(const std::string& name, std::chrono::seconds interval, std::function<void()> action);

    // Стандартные задачи хранилища: очистка и вытеснение, сверка индекса
    void registerCacheMaintenance(std::shared_ptr<cache::CacheStore> store);

    // Выполнение задач, срок которых наступил; возвращает число запущенных
    size_t runDue();

    bool start();
    void stop();
    bool isRunning() const;

    size_t runCount(const std::string& name) const;
    std::vector<std::string> taskNames() const;

private:
    struct Task {
        std::string name;
        std::chrono::seconds interval;
        std::function<void()> action;
        common::Clock::TimePoint nextRun;
        size_t runs = 0;
    };

    MaintenanceConfig config_;
    std::shared_ptr<const common::Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<Task> tasks_;
    bool running_ = false;
    std::thread worker_;
};

} // namespace maintenance
} // namespace core
} // namespace infercache

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/balancer/AdaptiveConcurrencyController.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/common/Logging.hpp"
#include "core/maintenance/MaintenanceScheduler.hpp"
#include "core/scheduler/RequestScheduler.hpp"
#include "core/scheduler/RequestTypes.hpp"
#include "core/scheduler/RetryPolicy.hpp"

namespace infercache {
namespace core {
namespace config {

/**
 * @brief Полная конфигурация сервиса
 *
 * Формат файла (все разделы и поля необязательны):
 * @code
 * {
 *   "cache":       { "directory": "cache", "max_size_bytes": 52428800, ... },
 *   "concurrency": { "hard_cap": 6, ... },
 *   "timeouts":    { "base_timeout_ms": 30000, "kind_multipliers": { ... } },
 *   "retry":       { "max_attempts": 3, "base_delay_ms": 1000, "max_delay_ms": 10000 },
 *   "scheduler":   { "executor_threads": 8, ... },
 *   "maintenance": { "cleanup_interval_seconds": 3600, ... },
 *   "logging":     { "directory": "logs", "level": "info", ... }
 * }
 * @endcode
 */
struct ServiceConfig {
    cache::CacheConfig cacheConfig;
    balancer::ConcurrencyConfig concurrencyConfig;
    scheduler::TimeoutConfig timeoutConfig;
    scheduler::RetryConfig retryConfig;
    scheduler::SchedulerConfig schedulerConfig;
    maintenance::MaintenanceConfig maintenanceConfig;
    common::LoggingConfig loggingConfig;

    bool validate() const;

    nlohmann::json toJson() const;

    // Бросает common::InferenceError(Configuration) при неверных значениях
    static ServiceConfig fromJson(const nlohmann::json& j);

    // Бросает common::InferenceError(Configuration), если файл не читается или некорректен
    static ServiceConfig loadFromFile(const std::string& path);
};

} // namespace config
} // namespace core
} // namespace infercache

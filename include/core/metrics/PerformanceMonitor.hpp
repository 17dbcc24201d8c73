#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/common/InferenceError.hpp"

namespace infercache {
namespace core {
namespace metrics {

// Счётчики по одному виду запросов
struct RequestStatistics {
    size_t requests = 0;
    size_t cacheHits = 0;
    size_t deduplicated = 0;        // Присоединились к выполняющемуся запросу
    size_t successes = 0;
    size_t failures = 0;
    size_t retries = 0;
    double totalLatencyMs = 0.0;    // Суммарное время успешных вызовов
    double maxLatencyMs = 0.0;
    std::map<std::string, size_t> failuresByKind;

    double averageLatencyMs() const {
        return successes > 0 ? totalLatencyMs / successes : 0.0;
    }
    double successRate() const {
        size_t total = successes + failures;
        return total > 0 ? static_cast<double>(successes) / total : 0.0;
    }
    double hitRate() const {
        return requests > 0 ? static_cast<double>(cacheHits) / requests : 0.0;
    }

    void merge(const RequestStatistics& other);
    nlohmann::json toJson() const;
};

/**
 * @brief Монитор производительности запросов
 *
 * Собирает по видам запросов число обращений, попаданий в кэш,
 * дедупликаций, успешных и неудачных завершений и среднюю задержку.
 *
 * @note Потокобезопасен
 */
class PerformanceMonitor {
public:
    PerformanceMonitor();

    void recordRequest(const std::string& kind);
    void recordCacheHit(const std::string& kind);
    void recordDeduplicated(const std::string& kind);
    void recordRetry(const std::string& kind);
    void recordSuccess(const std::string& kind, std::chrono::duration<double> latency);
    void recordFailure(const std::string& kind, common::ErrorKind error);

    RequestStatistics statisticsFor(const std::string& kind) const;
    RequestStatistics totals() const;

    // {"totals": {...}, "kinds": {"<kind>": {...}}}
    nlohmann::json toJson() const;

    // Краткая сводка в лог
    void logSummary() const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, RequestStatistics> perKind_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace metrics
} // namespace core
} // namespace infercache

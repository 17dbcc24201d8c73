#include "core/metrics/PerformanceMonitor.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>

namespace infercache {
namespace core {
namespace metrics {

void RequestStatistics::merge(const RequestStatistics& other) {
    requests += other.requests;
    cacheHits += other.cacheHits;
    deduplicated += other.deduplicated;
    successes += other.successes;
    failures += other.failures;
    retries += other.retries;
    totalLatencyMs += other.totalLatencyMs;
    maxLatencyMs = std::max(maxLatencyMs, other.maxLatencyMs);
    for (const auto& item : other.failuresByKind) {
        failuresByKind[item.first] += item.second;
    }
}

nlohmann::json RequestStatistics::toJson() const {
    return {
        {"requests", requests},
        {"cacheHits", cacheHits},
        {"hitRate", hitRate()},
        {"deduplicated", deduplicated},
        {"successes", successes},
        {"failures", failures},
        {"successRate", successRate()},
        {"retries", retries},
        {"averageLatencyMs", averageLatencyMs()},
        {"maxLatencyMs", maxLatencyMs},
        {"failuresByKind", failuresByKind}
    };
}

PerformanceMonitor::PerformanceMonitor()
    : logger_(common::componentLogger("monitor")) {}

void PerformanceMonitor::recordRequest(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++perKind_[kind].requests;
}

void PerformanceMonitor::recordCacheHit(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++perKind_[kind].cacheHits;
}

void PerformanceMonitor::recordDeduplicated(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++perKind_[kind].deduplicated;
}

void PerformanceMonitor::recordRetry(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++perKind_[kind].retries;
}

void PerformanceMonitor::recordSuccess(const std::string& kind, std::chrono::duration<double> latency) {
    const double ms = latency.count() * 1000.0;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = perKind_[kind];
    ++stats.successes;
    stats.totalLatencyMs += ms;
    stats.maxLatencyMs = std::max(stats.maxLatencyMs, ms);
}

void PerformanceMonitor::recordFailure(const std::string& kind, common::ErrorKind error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = perKind_[kind];
    ++stats.failures;
    ++stats.failuresByKind[common::toString(error)];
}

RequestStatistics PerformanceMonitor::statisticsFor(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = perKind_.find(kind);
    return it != perKind_.end() ? it->second : RequestStatistics{};
}

RequestStatistics PerformanceMonitor::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RequestStatistics result;
    for (const auto& item : perKind_) {
        result.merge(item.second);
    }
    return result;
}

nlohmann::json PerformanceMonitor::toJson() const {
    nlohmann::json kinds = nlohmann::json::object();
    RequestStatistics total;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : perKind_) {
            kinds[item.first] = item.second.toJson();
            total.merge(item.second);
        }
    }
    return {
        {"totals", total.toJson()},
        {"kinds", kinds}
    };
}

void PerformanceMonitor::logSummary() const {
    auto total = totals();
    logger_->info("Запросов: {}, попаданий в кэш: {:.1f}%, дедупликаций: {}, успешно: {}, ошибок: {}, средняя задержка: {:.1f} мс",
        total.requests, total.hitRate() * 100.0, total.deduplicated,
        total.successes, total.failures, total.averageLatencyMs());
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    perKind_.clear();
}

} // namespace metrics
} // namespace core
} // namespace infercache

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/balancer/AdaptiveConcurrencyController.hpp"
#include "core/cache/CacheTypes.hpp"
#include "core/cache/manager/CacheStore.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/scheduler/CancellationToken.hpp"
#include "core/scheduler/RequestTypes.hpp"
#include "core/scheduler/RetryPolicy.hpp"

namespace infercache {
namespace core {
namespace scheduler {

/**
 * @brief Вызов бэкенда
 *
 * Возвращает сериализованный результат или бросает исключение.
 * common::InferenceError классифицируется по kind(), любое другое
 * исключение (в том числе не std::exception) считается ErrorKind::Unknown.
 * Токен отменяется по таймауту, при уходе последнего ожидающего и при
 * остановке.
 */
using Executor = std::function<cache::Payload(const CancellationToken&)>;

// Параметры планировщика
struct SchedulerConfig {
    size_t executorThreads = 8;         // Не меньше ConcurrencyConfig::hardCap
    size_t maxPending = 1024;           // Предел числа различных запросов в очереди
    std::chrono::milliseconds limitRecheckInterval{500};   // Пересчёт лимита при непустой очереди

    bool validate() const {
        return executorThreads > 0 && maxPending > 0 && limitRecheckInterval.count() > 0;
    }

    nlohmann::json toJson() const {
        return {
            {"executor_threads", executorThreads},
            {"max_pending", maxPending},
            {"limit_recheck_interval_ms", limitRecheckInterval.count()}
        };
    }

    static SchedulerConfig fromJson(const nlohmann::json& j) { return fromJson(j, SchedulerConfig{}); }
    static SchedulerConfig fromJson(const nlohmann::json& j, const SchedulerConfig& defaults) {
        SchedulerConfig config = defaults;
        config.executorThreads = j.value("executor_threads", defaults.executorThreads);
        config.maxPending = j.value("max_pending", defaults.maxPending);
        config.limitRecheckInterval = std::chrono::milliseconds(
            j.value("limit_recheck_interval_ms", static_cast<int64_t>(defaults.limitRecheckInterval.count())));
        return config;
    }
};

/**
 * @brief Планировщик запросов к бэкенду
 *
 * @details Для каждого запроса:
 *  1. Проверка кэша: при попадании исполнитель не вызывается.
 *  2. Дедупликация: вызывающий с тем же отпечатком присоединяется к уже
 *     выполняющемуся или ожидающему запросу и получает тот же результат.
 *  3. Очередь по приоритету (при равенстве FIFO), допуск пока число
 *     выполняющихся вызовов меньше AdaptiveConcurrencyController::currentLimit().
 *  4. Выполнение с таймаутом, повторы по RetryPolicy с задержкой.
 *  5. Успешный результат записывается в кэш с TTL категории.
 *
 * Одновременно выполняется не более одного вызова исполнителя на отпечаток.
 * Вызов, прерванный по таймауту, занимает слот до фактического возврата.
 *
 * Уход ожидающего (отмена его токена) не прерывает общий вызов, пока есть
 * другие ожидающие; уход последнего отменяет вызов.
 *
 * @note Потокобезопасен
 */
class RequestScheduler {
public:
    RequestScheduler(const SchedulerConfig& config,
                     const TimeoutConfig& timeouts,
                     const RetryConfig& retry,
                     std::shared_ptr<cache::CacheStore> cache,
                     std::shared_ptr<balancer::AdaptiveConcurrencyController> controller,
                     std::shared_ptr<metrics::PerformanceMonitor> monitor = nullptr);

    // Останавливает планировщик (shutdown)
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&) = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    /**
     * @brief Выполнить запрос (блокирующий вызов)
     * @param request Запрос
     * @param executor Вызов бэкенда
     * @param cancel Токен отмены вызывающего
     * @return Результат из кэша или от исполнителя
     * @throws common::InferenceError Cancelled при отмене, DuplicateInFlight если
     *         общий запрос был прерван не этим вызывающим, иначе ошибка последней попытки
     */
    cache::Payload enqueue(const InferenceRequest& request,
                           Executor executor,
                           const CancellationToken& cancel = CancellationToken());

    // Чтение из кэша без вызова бэкенда
    std::optional<cache::Payload> getCached(const InferenceRequest& request);
    std::optional<cache::Payload> getCached(cache::CacheCategory category, const cache::CacheKey& fingerprint);

    // Время ожидания ответа для запроса при текущем состоянии системы
    std::chrono::milliseconds computeTimeout(RequestKind kind) const;

    QueueStatus getQueueStatus() const;

    // Прерывание всех ожидающих и выполняющихся запросов
    size_t cancelAll();

    // Отмена всех запросов и остановка потоков; повторный вызов безопасен
    void shutdown();

    cache::CacheStatistics stats() const;
    size_t clearCategory(cache::CacheCategory category);
    size_t clearAll();
    size_t clearExpired();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace scheduler
} // namespace core
} // namespace infercache

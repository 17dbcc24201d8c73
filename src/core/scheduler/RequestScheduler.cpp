#include "core/scheduler/RequestScheduler.hpp"
#include "core/common/Logging.hpp"
#include "core/thread/ThreadPool.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace infercache {
namespace core {
namespace scheduler {

using common::ErrorKind;
using common::InferenceError;

namespace {

using SteadyClock = std::chrono::steady_clock;

// Фаза жизненного цикла запроса
enum class Phase {
    Queued,     // Ожидает слота
    Backoff,    // Ожидает повтора
    Executing,  // Вызов исполнителя
    Resolving,  // Результат получен, запись в кэш
    Done
};

struct RequestState {
    cache::CacheKey fingerprint;
    InferenceRequest request;
    Executor executor;
    uint64_t seq = 0;                       // Порядок постановки в очередь
    RequestPriority priority = RequestPriority::Normal;
    Phase phase = Phase::Queued;
    size_t attempts = 0;                    // Начатых попыток
    uint64_t attemptId = 0;                 // Идентификатор текущей попытки
    bool executorRunning = false;           // Исполнитель ещё не вернул управление
    std::shared_ptr<CancellationSource> attemptCancel;
    size_t waiters = 0;
    bool done = false;
    bool abortedByCancel = false;           // Прерван cancelAll()/shutdown()
    std::optional<cache::Payload> result;
    std::optional<InferenceError> error;
    std::condition_variable condition;
    SteadyClock::time_point enqueuedAt;
    std::chrono::milliseconds timeout{0};
};

struct PendingKey {
    int priority;
    uint64_t seq;

    bool operator<(const PendingKey& other) const {
        if (priority != other.priority) return priority > other.priority;
        return seq < other.seq;
    }
};

enum class TimerKind {
    Backoff,
    Deadline
};

struct TimerEntry {
    TimerKind kind;
    std::weak_ptr<RequestState> state;
    uint64_t attemptId;
};

std::string shortKey(const cache::CacheKey& key) {
    return key.substr(0, 12);
}

} // namespace

// Реализация PIMPL
struct RequestScheduler::Impl {
    SchedulerConfig config;
    TimeoutConfig timeouts;
    RetryPolicy retry;
    std::shared_ptr<cache::CacheStore> store;
    std::shared_ptr<balancer::AdaptiveConcurrencyController> controller;
    std::shared_ptr<metrics::PerformanceMonitor> monitor;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::mutex mutex;
    std::unordered_map<cache::CacheKey, std::shared_ptr<RequestState>> requests;
    std::map<PendingKey, std::shared_ptr<RequestState>> pending;
    std::multimap<SteadyClock::time_point, TimerEntry> timers;
    std::condition_variable timerCondition;
    size_t active = 0;                      // Выполняющихся вызовов исполнителя
    uint64_t nextSeq = 0;
    uint64_t completions = 0;               // Успешно завершённых запросов
    bool stopping = false;
    std::atomic<bool> shutdownStarted{false};

    std::unique_ptr<thread::ThreadPool> executors;
    std::thread timerThread;

    Impl(const SchedulerConfig& cfg,
         const TimeoutConfig& timeoutConfig,
         const RetryConfig& retryConfig,
         std::shared_ptr<cache::CacheStore> cacheStore,
         std::shared_ptr<balancer::AdaptiveConcurrencyController> concurrency,
         std::shared_ptr<metrics::PerformanceMonitor> perf)
        : config(cfg)
        , timeouts(timeoutConfig)
        , retry(retryConfig)
        , store(std::move(cacheStore))
        , controller(std::move(concurrency))
        , monitor(std::move(perf))
        , logger(common::componentLogger("scheduler")) {
        thread::ThreadPoolConfig poolConfig;
        poolConfig.name = "executors";
        poolConfig.workerCount = config.executorThreads;
        poolConfig.queueSize = std::max<size_t>(config.executorThreads, 1) * 2;
        executors = std::make_unique<thread::ThreadPool>(poolConfig);
        timerThread = std::thread([this] { timerLoop(); });
    }

    std::chrono::milliseconds computeTimeout(RequestKind kind) const {
        double factor = timeouts.multiplierFor(kind) * controller->timeoutMultiplier();
        auto ms = static_cast<int64_t>(static_cast<double>(timeouts.baseTimeout.count()) * factor);
        return std::chrono::milliseconds(std::max<int64_t>(1, ms));
    }

    void resolveLocked(const std::shared_ptr<RequestState>& state,
                       std::optional<cache::Payload> result,
                       std::optional<InferenceError> error) {
        if (state->done) return;
        state->done = true;
        state->phase = Phase::Done;
        if (result) ++completions;
        state->result = std::move(result);
        state->error = std::move(error);

        auto it = requests.find(state->fingerprint);
        if (it != requests.end() && it->second == state) {
            requests.erase(it);
        }
        pending.erase(PendingKey{static_cast<int>(state->priority), state->seq});
        state->condition.notify_all();
    }

    // Прерывание запроса; возвращает источник отмены выполняющейся попытки
    std::shared_ptr<CancellationSource> abortLocked(const std::shared_ptr<RequestState>& state,
                                                    const InferenceError& error) {
        if (monitor) monitor->recordFailure(toString(state->request.kind), error.kind());
        auto source = state->executorRunning ? state->attemptCancel : nullptr;
        resolveLocked(state, std::nullopt, error);
        return source;
    }

    void pumpLocked() {
        if (stopping) return;
        const size_t limit = std::min(controller->currentLimit(), config.executorThreads);
        for (auto it = pending.begin(); it != pending.end() && active < limit;) {
            auto state = it->second;
            if (state->executorRunning) {
                // Прерванная по таймауту попытка ещё не вернулась
                ++it;
                continue;
            }
            it = pending.erase(it);
            launchLocked(state);
        }
    }

    void launchLocked(const std::shared_ptr<RequestState>& state) {
        state->phase = Phase::Executing;
        ++state->attempts;
        const uint64_t attemptId = ++state->attemptId;
        state->executorRunning = true;
        state->attemptCancel = std::make_shared<CancellationSource>();
        ++active;
        controller->observeLoad(active);

        state->timeout = computeTimeout(state->request.kind);
        timers.emplace(SteadyClock::now() + state->timeout, TimerEntry{TimerKind::Deadline, state, attemptId});
        timerCondition.notify_one();

        logger->debug("Запуск {} [{}]: попытка {}/{}, таймаут {} мс, активно {}",
            toString(state->request.kind), shortKey(state->fingerprint),
            state->attempts, retry.maxAttempts(), state->timeout.count(), active);

        auto token = state->attemptCancel->token();
        auto executor = state->executor;
        try {
            executors->enqueue([this, state, attemptId, token, executor] {
                runAttempt(state, attemptId, token, executor);
            });
        } catch (const std::runtime_error& e) {
            state->executorRunning = false;
            --active;
            controller->observeLoad(active);
            logger->error("Не удалось запустить исполнитель: {}", e.what());
            if (monitor) monitor->recordFailure(toString(state->request.kind), ErrorKind::Unknown);
            resolveLocked(state, std::nullopt, InferenceError(ErrorKind::Unknown, e.what()));
        }
    }

    void runAttempt(const std::shared_ptr<RequestState>& state, uint64_t attemptId,
                    const CancellationToken& token, const Executor& executor) {
        const auto started = SteadyClock::now();
        std::optional<cache::Payload> result;
        std::optional<InferenceError> error;
        try {
            result = executor(token);
        } catch (const InferenceError& e) {
            error = e;
        } catch (const std::exception& e) {
            error = InferenceError(ErrorKind::Unknown, e.what());
        } catch (...) {
            error = InferenceError(ErrorKind::Unknown, "Исполнитель бросил исключение неизвестного типа");
        }
        finishAttempt(state, attemptId, std::move(result), std::move(error), SteadyClock::now() - started);
    }

    void finishAttempt(const std::shared_ptr<RequestState>& state, uint64_t attemptId,
                       std::optional<cache::Payload> result, std::optional<InferenceError> error,
                       std::chrono::duration<double> elapsed) {
        std::unique_lock<std::mutex> lock(mutex);
        state->executorRunning = false;
        --active;
        controller->observeLoad(active);

        const bool current = !state->done && state->attemptId == attemptId && state->phase == Phase::Executing;
        if (!current) {
            logger->debug("Результат устаревшей попытки {} [{}] отброшен",
                attemptId, shortKey(state->fingerprint));
            pumpLocked();
            return;
        }

        const char* kindName = toString(state->request.kind);
        if (result) {
            state->phase = Phase::Resolving;
            lock.unlock();

            controller->observe(elapsed);
            if (!store->put(state->request.category(), state->fingerprint, *result, state->request.ttl)) {
                logger->warn("Результат {} [{}] не сохранён в кэш", kindName, shortKey(state->fingerprint));
            }
            if (monitor) monitor->recordSuccess(kindName, elapsed);

            lock.lock();
            logger->debug("Запрос {} [{}] выполнен за {:.0f} мс, ожидающих {}",
                kindName, shortKey(state->fingerprint), elapsed.count() * 1000.0, state->waiters);
            resolveLocked(state, std::move(result), std::nullopt);
        } else {
            handleFailureLocked(state, *error);
        }
        pumpLocked();
    }

    void handleFailureLocked(const std::shared_ptr<RequestState>& state, const InferenceError& error) {
        const char* kindName = toString(state->request.kind);
        const size_t attempt = state->attempts > 0 ? state->attempts - 1 : 0;

        if (!stopping && retry.shouldRetry(error.kind(), attempt)) {
            auto delay = retry.backoffDelay(attempt);
            state->phase = Phase::Backoff;
            timers.emplace(SteadyClock::now() + delay, TimerEntry{TimerKind::Backoff, state, state->attemptId});
            timerCondition.notify_one();
            if (monitor) monitor->recordRetry(kindName);
            logger->warn("Попытка {}/{} {} [{}] завершилась ошибкой {} ({}), повтор через {} мс",
                state->attempts, retry.maxAttempts(), kindName, shortKey(state->fingerprint),
                common::toString(error.kind()), error.what(), delay.count());
            return;
        }

        logger->error("Запрос {} [{}] завершился ошибкой {} после {} попыток: {}",
            kindName, shortKey(state->fingerprint), common::toString(error.kind()),
            state->attempts, error.what());
        if (monitor) monitor->recordFailure(kindName, error.kind());
        resolveLocked(state, std::nullopt, error);
    }

    void timerLoop() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            auto wakeAt = SteadyClock::now() + config.limitRecheckInterval;
            if (!timers.empty() && timers.begin()->first < wakeAt) {
                wakeAt = timers.begin()->first;
            }
            timerCondition.wait_until(lock, wakeAt);
            if (stopping) break;

            const auto now = SteadyClock::now();
            std::vector<std::shared_ptr<CancellationSource>> toCancel;
            while (!timers.empty() && timers.begin()->first <= now) {
                TimerEntry entry = timers.begin()->second;
                timers.erase(timers.begin());

                auto state = entry.state.lock();
                if (!state || state->done || state->attemptId != entry.attemptId) {
                    continue;
                }

                if (entry.kind == TimerKind::Deadline && state->phase == Phase::Executing) {
                    toCancel.push_back(state->attemptCancel);
                    handleFailureLocked(state, InferenceError(ErrorKind::Timeout,
                        "Превышено время ожидания ответа (" + std::to_string(state->timeout.count()) + " мс)"));
                } else if (entry.kind == TimerKind::Backoff && state->phase == Phase::Backoff) {
                    state->phase = Phase::Queued;
                    pending.emplace(PendingKey{static_cast<int>(state->priority), state->seq}, state);
                }
            }

            if (!pending.empty()) {
                pumpLocked();
            }

            if (!toCancel.empty()) {
                lock.unlock();
                for (auto& source : toCancel) {
                    source->cancel();
                }
                lock.lock();
            }
        }
    }

    cache::Payload enqueue(const InferenceRequest& request, Executor executor, const CancellationToken& cancel) {
        const char* kindName = toString(request.kind);
        if (!executor) {
            throw InferenceError(ErrorKind::Configuration, "Не задан исполнитель запроса");
        }
        if (monitor) monitor->recordRequest(kindName);

        const auto fingerprint = request.fingerprint();
        const auto category = request.category();

        uint64_t seenCompletions;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) {
                throw InferenceError(ErrorKind::Cancelled, "Планировщик остановлен");
            }
            seenCompletions = completions;
        }
        if (cancel.isCancelled()) {
            throw InferenceError(ErrorKind::Cancelled, "Запрос отменён до постановки в очередь");
        }

        if (auto hit = store->get(category, fingerprint)) {
            if (monitor) monitor->recordCacheHit(kindName);
            logger->debug("Кэш-попадание {} [{}]", kindName, shortKey(fingerprint));
            return std::move(hit->payload);
        }

        CancellationToken::Registration registration;
        std::unique_lock<std::mutex> lock(mutex);
        if (stopping) {
            throw InferenceError(ErrorKind::Cancelled, "Планировщик остановлен");
        }

        std::shared_ptr<RequestState> state;
        bool originator = false;
        auto existing = requests.find(fingerprint);
        if (existing != requests.end()) {
            state = existing->second;
            ++state->waiters;
            if (monitor) monitor->recordDeduplicated(kindName);
            // Повышение приоритета ожидающего запроса
            if (state->phase == Phase::Queued && request.priority > state->priority) {
                auto node = pending.extract(PendingKey{static_cast<int>(state->priority), state->seq});
                state->priority = request.priority;
                if (!node.empty()) {
                    node.key() = PendingKey{static_cast<int>(state->priority), state->seq};
                    pending.insert(std::move(node));
                }
            } else if (request.priority > state->priority) {
                state->priority = request.priority;
            }
            logger->debug("Дубликат {} [{}] присоединён, ожидающих {}",
                kindName, shortKey(fingerprint), state->waiters);
        } else {
            if (completions != seenCompletions) {
                // Запрос мог завершиться между проверкой кэша и захватом блокировки
                if (auto hit = store->get(category, fingerprint)) {
                    lock.unlock();
                    if (monitor) monitor->recordCacheHit(kindName);
                    return std::move(hit->payload);
                }
            }
            if (requests.size() >= config.maxPending) {
                lock.unlock();
                if (monitor) monitor->recordFailure(kindName, ErrorKind::RateLimited);
                throw InferenceError(ErrorKind::RateLimited, "Очередь запросов переполнена");
            }

            state = std::make_shared<RequestState>();
            state->fingerprint = fingerprint;
            state->request = request;
            state->executor = std::move(executor);
            state->seq = nextSeq++;
            state->priority = request.priority;
            state->waiters = 1;
            state->enqueuedAt = SteadyClock::now();
            originator = true;

            requests.emplace(fingerprint, state);
            pending.emplace(PendingKey{static_cast<int>(state->priority), state->seq}, state);
            logger->debug("Запрос {} [{}] поставлен в очередь, приоритет {}, в очереди {}",
                kindName, shortKey(fingerprint), toString(request.priority), pending.size());
            pumpLocked();
        }

        registration = cancel.onCancel([this, state] {
            std::lock_guard<std::mutex> guard(mutex);
            state->condition.notify_all();
        });

        state->condition.wait(lock, [&] { return state->done || cancel.isCancelled(); });

        if (state->done) {
            --state->waiters;
            if (state->result) {
                cache::Payload payload = *state->result;
                lock.unlock();
                registration.reset();
                return payload;
            }
            InferenceError error = *state->error;
            const bool foreignAbort = !originator && state->abortedByCancel;
            lock.unlock();
            registration.reset();
            if (foreignAbort) {
                throw InferenceError(ErrorKind::DuplicateInFlight,
                    std::string("Общий запрос прерван: ") + error.what());
            }
            throw error;
        }

        // Отменён вызывающим
        --state->waiters;
        std::shared_ptr<CancellationSource> toCancel;
        if (state->waiters == 0) {
            logger->debug("Последний ожидающий {} [{}] ушёл, запрос прерывается", kindName, shortKey(fingerprint));
            toCancel = abortLocked(state, InferenceError(ErrorKind::Cancelled, "Запрос отменён"));
            pumpLocked();
        } else {
            logger->debug("Ожидающий {} [{}] ушёл, осталось {}", kindName, shortKey(fingerprint), state->waiters);
        }
        lock.unlock();
        registration.reset();
        if (toCancel) {
            toCancel->cancel();
        }
        throw InferenceError(ErrorKind::Cancelled, "Ожидание запроса отменено");
    }

    size_t cancelAll() {
        std::vector<std::shared_ptr<CancellationSource>> toCancel;
        size_t count = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            std::vector<std::shared_ptr<RequestState>> states;
            states.reserve(requests.size());
            for (const auto& item : requests) {
                states.push_back(item.second);
            }
            for (const auto& state : states) {
                state->abortedByCancel = true;
                if (auto source = abortLocked(state, InferenceError(ErrorKind::Cancelled, "Запрос отменён"))) {
                    toCancel.push_back(std::move(source));
                }
                ++count;
            }
            pending.clear();
        }
        for (auto& source : toCancel) {
            source->cancel();
        }
        if (count > 0) {
            logger->info("Отменено запросов: {}", count);
        }
        return count;
    }

    void shutdown() {
        if (shutdownStarted.exchange(true)) return;
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        cancelAll();
        timerCondition.notify_all();
        if (timerThread.joinable()) {
            timerThread.join();
        }
        executors->stop();
        logger->info("Планировщик остановлен");
    }

    QueueStatus queueStatus() const {
        QueueStatus status;
        {
            std::lock_guard<std::mutex> lock(mutex);
            status.active = active;
            for (const auto& item : requests) {
                const auto& state = item.second;
                if (state->phase == Phase::Queued || state->phase == Phase::Backoff) {
                    ++status.pending;
                }
                status.waiters += state->waiters;
            }
        }
        auto snapshot = controller->snapshot();
        status.limit = std::min(snapshot.limit, config.executorThreads);
        status.availableSlots = status.limit > status.active ? status.limit - status.active : 0;
        status.networkQuality = balancer::toString(snapshot.networkQuality);
        status.averageRttSeconds = snapshot.averageRttSeconds;
        return status;
    }
};

RequestScheduler::RequestScheduler(const SchedulerConfig& config,
                                   const TimeoutConfig& timeouts,
                                   const RetryConfig& retry,
                                   std::shared_ptr<cache::CacheStore> cache,
                                   std::shared_ptr<balancer::AdaptiveConcurrencyController> controller,
                                   std::shared_ptr<metrics::PerformanceMonitor> monitor) {
    if (!config.validate() || !timeouts.validate() || !retry.validate()) {
        throw InferenceError(ErrorKind::Configuration, "Некорректная конфигурация планировщика");
    }
    if (!cache || !controller) {
        throw InferenceError(ErrorKind::Configuration, "Планировщику не переданы кэш или контроллер");
    }
    pImpl = std::make_unique<Impl>(config, timeouts, retry, std::move(cache),
                                   std::move(controller), std::move(monitor));
    pImpl->logger->info("Планировщик запущен: {} потоков исполнителей, попыток {}",
        config.executorThreads, retry.maxAttempts);
}

RequestScheduler::~RequestScheduler() {
    pImpl->shutdown();
}

cache::Payload RequestScheduler::enqueue(const InferenceRequest& request,
                                         Executor executor,
                                         const CancellationToken& cancel) {
    return pImpl->enqueue(request, std::move(executor), cancel);
}

std::optional<cache::Payload> RequestScheduler::getCached(const InferenceRequest& request) {
    return getCached(request.category(), request.fingerprint());
}

std::optional<cache::Payload> RequestScheduler::getCached(cache::CacheCategory category,
                                                          const cache::CacheKey& fingerprint) {
    auto entry = pImpl->store->get(category, fingerprint);
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->payload);
}

std::chrono::milliseconds RequestScheduler::computeTimeout(RequestKind kind) const {
    return pImpl->computeTimeout(kind);
}

QueueStatus RequestScheduler::getQueueStatus() const {
    return pImpl->queueStatus();
}

size_t RequestScheduler::cancelAll() {
    return pImpl->cancelAll();
}

void RequestScheduler::shutdown() {
    pImpl->shutdown();
}

cache::CacheStatistics RequestScheduler::stats() const {
    return pImpl->store->stats();
}

size_t RequestScheduler::clearCategory(cache::CacheCategory category) {
    return pImpl->store->removeCategory(category);
}

size_t RequestScheduler::clearAll() {
    return pImpl->store->clearAll();
}

size_t RequestScheduler::clearExpired() {
    return pImpl->store->clearExpired();
}

} // namespace scheduler
} // namespace core
} // namespace infercache

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/balancer/AdaptiveConcurrencyController.hpp"
#include "core/cache/manager/CacheStore.hpp"
#include "core/common/Clock.hpp"
#include "core/common/InferenceError.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/scheduler/CancellationToken.hpp"
#include "core/scheduler/RequestScheduler.hpp"

using namespace infercache::core;
using cache::Payload;
using common::ErrorKind;
using common::InferenceError;
using scheduler::CancellationSource;
using scheduler::CancellationToken;
using scheduler::InferenceRequest;
using scheduler::RequestKind;
using scheduler::RequestPriority;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

scheduler::RetryConfig fastRetry(size_t attempts = 3) {
    scheduler::RetryConfig retry;
    retry.maxAttempts = attempts;
    retry.baseDelay = 20ms;
    retry.maxDelay = 100ms;
    return retry;
}

// Планировщик с кэшем во временном каталоге
struct Harness {
    fs::path dir;
    std::shared_ptr<cache::CacheStore> store;
    std::shared_ptr<balancer::AdaptiveConcurrencyController> controller;
    std::shared_ptr<metrics::PerformanceMonitor> monitor;
    std::unique_ptr<scheduler::RequestScheduler> requestScheduler;

    Harness(const std::string& name, size_t hardCap,
            std::chrono::milliseconds baseTimeout = 30000ms,
            const scheduler::RetryConfig& retry = fastRetry()) {
        dir = fs::temp_directory_path() / ("infercache_scheduler_" + name);
        fs::remove_all(dir);

        cache::CacheConfig cacheConfig;
        cacheConfig.directory = dir.string();
        store = std::make_shared<cache::CacheStore>(cacheConfig, std::make_shared<common::SystemClock>());
        bool ok = store->initialize();
        assert(ok);
        (void)ok;

        platform::DeviceProfile profile;
        profile.cpuCount = 8;
        profile.totalMemoryBytes = 16 * kGiB;
        balancer::ConcurrencyConfig concurrency;
        concurrency.hardCap = hardCap;
        controller = std::make_shared<balancer::AdaptiveConcurrencyController>(
            concurrency, std::make_shared<platform::StaticResourceProbe>(profile, 0.1));

        monitor = std::make_shared<metrics::PerformanceMonitor>();

        scheduler::TimeoutConfig timeouts;
        timeouts.baseTimeout = baseTimeout;
        requestScheduler = std::make_unique<scheduler::RequestScheduler>(
            scheduler::SchedulerConfig{}, timeouts, retry, store, controller, monitor);
    }

    ~Harness() {
        requestScheduler->shutdown();
        requestScheduler.reset();
        store.reset();
        fs::remove_all(dir);
    }
};

InferenceRequest makeRequest(const std::string& item, RequestPriority priority = RequestPriority::Normal) {
    InferenceRequest request;
    request.kind = RequestKind::ItemIdentification;
    request.priority = priority;
    request.parameters = {{"item", item}};
    return request;
}

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

// Результат вызова enqueue в отдельном потоке
struct Outcome {
    std::optional<std::string> value;
    std::optional<ErrorKind> error;
};

Outcome runEnqueue(scheduler::RequestScheduler& s, const InferenceRequest& request,
                   scheduler::Executor executor, const CancellationToken& cancel = CancellationToken()) {
    Outcome outcome;
    try {
        outcome.value = s.enqueue(request, std::move(executor), cancel).asString();
    } catch (const InferenceError& e) {
        outcome.error = e.kind();
    }
    return outcome;
}

// Ручной затвор для удержания исполнителя
class Gate {
public:
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        condition_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool open_ = false;
};

} // namespace

void smokeTestCancellationToken() {
    CancellationSource source;
    auto token = source.token();
    std::atomic<int> calls{0};
    {
        auto registration = token.onCancel([&] { ++calls; });
        auto removed = token.onCancel([&] { calls += 100; });
        removed.reset();
        assert(!token.isCancelled());
        assert(!token.waitFor(10ms));
        source.cancel();
        source.cancel();
    }
    assert(calls == 1);
    assert(token.isCancelled());
    assert(token.waitFor(1000ms));

    // Регистрация после отмены не вызывает обработчик
    auto late = token.onCancel([&] { ++calls; });
    assert(calls == 1);

    CancellationToken never;
    assert(!never.isCancelled());
    assert(!never.waitFor(1ms));
    std::cout << "[OK] CancellationToken\n";
}

void smokeTestDeduplication() {
    std::atomic<int> invocations{0};
    Harness h("dedup", 1);
    auto executor = [&](const CancellationToken& token) {
        ++invocations;
        token.waitFor(100ms);
        return Payload::fromString("text/plain", "X");
    };

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::thread> callers;
    std::vector<Outcome> outcomes(5);
    for (size_t i = 0; i < outcomes.size(); ++i) {
        callers.emplace_back([&, i] { outcomes[i] = runEnqueue(*h.requestScheduler, makeRequest("jacket"), executor); });
    }
    for (auto& t : callers) t.join();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(invocations == 1);
    for (const auto& outcome : outcomes) {
        assert(outcome.value && *outcome.value == "X");
    }
    assert(elapsed < 400ms);

    auto totals = h.monitor->totals();
    assert(totals.requests == 5);
    assert(totals.deduplicated + totals.cacheHits == 4);
    assert(totals.successes == 1);
    std::cout << "[OK] RequestScheduler deduplication\n";
}

void smokeTestCacheHit() {
    std::atomic<int> invocations{0};
    Harness h("cache_hit", 3);
    auto executor = [&](const CancellationToken&) {
        ++invocations;
        return Payload::fromJson("application/json", {{"name", "boots"}, {"weight_kg", 1.2}});
    };

    auto first = h.requestScheduler->enqueue(makeRequest("boots"), executor);
    auto second = h.requestScheduler->enqueue(makeRequest("boots"), executor);
    assert(invocations == 1);
    assert(first == second);
    assert(second.asJson()["name"] == "boots");

    auto cached = h.requestScheduler->getCached(makeRequest("boots"));
    assert(cached && *cached == first);
    assert(!h.requestScheduler->getCached(makeRequest("tent")));
    assert(h.requestScheduler->stats().entryCount == 1);

    // Приоритет не влияет на отпечаток
    h.requestScheduler->enqueue(makeRequest("boots", RequestPriority::Urgent), executor);
    assert(invocations == 1);

    assert(h.requestScheduler->clearCategory(cache::CacheCategory::Identification) == 1);
    h.requestScheduler->enqueue(makeRequest("boots"), executor);
    assert(invocations == 2);
    std::cout << "[OK] RequestScheduler cache hit\n";
}

void smokeTestConcurrencyBound() {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    Harness h("bound", 2);
    auto executor = [&](const CancellationToken& token) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        token.waitFor(50ms);
        --running;
        return Payload::fromString("text/plain", "ok");
    };

    std::vector<std::thread> callers;
    std::atomic<int> successes{0};
    for (int i = 0; i < 6; ++i) {
        callers.emplace_back([&, i] {
            auto outcome = runEnqueue(*h.requestScheduler, makeRequest("item" + std::to_string(i)), executor);
            if (outcome.value) ++successes;
        });
    }
    for (auto& t : callers) t.join();

    assert(successes == 6);
    assert(peak >= 1 && peak <= 2);
    auto status = h.requestScheduler->getQueueStatus();
    assert(status.active == 0);
    assert(status.pending == 0);
    assert(status.limit == 2);
    std::cout << "[OK] RequestScheduler concurrency bound\n";
}

void smokeTestPriorityOrder() {
    Gate gate;
    std::mutex orderMutex;
    std::vector<std::string> order;
    Harness h("priority", 1);

    auto recording = [&](const std::string& name) {
        return [&, name](const CancellationToken&) {
            {
                std::lock_guard<std::mutex> lock(orderMutex);
                order.push_back(name);
            }
            if (name == "blocker") gate.wait();
            return Payload::fromString("text/plain", name);
        };
    };

    std::thread blocker([&] { runEnqueue(*h.requestScheduler, makeRequest("blocker"), recording("blocker")); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 1; }));

    std::vector<std::thread> callers;
    callers.emplace_back([&] { runEnqueue(*h.requestScheduler, makeRequest("L", RequestPriority::Low), recording("L")); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().pending == 1; }));
    callers.emplace_back([&] { runEnqueue(*h.requestScheduler, makeRequest("N", RequestPriority::Normal), recording("N")); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().pending == 2; }));
    callers.emplace_back([&] { runEnqueue(*h.requestScheduler, makeRequest("H", RequestPriority::High), recording("H")); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().pending == 3; }));

    gate.open();
    blocker.join();
    for (auto& t : callers) t.join();

    std::lock_guard<std::mutex> lock(orderMutex);
    assert((order == std::vector<std::string>{"blocker", "H", "N", "L"}));
    std::cout << "[OK] RequestScheduler priority order\n";
}

void smokeTestRetries() {
    std::mutex timesMutex;
    std::vector<std::chrono::steady_clock::time_point> attempts;
    std::atomic<int> authCalls{0};
    std::atomic<int> flakyCalls{0};
    Harness h("retry", 3);

    auto failing = [&](const CancellationToken&) -> Payload {
        std::lock_guard<std::mutex> lock(timesMutex);
        attempts.push_back(std::chrono::steady_clock::now());
        throw InferenceError(ErrorKind::NetworkTransient, "connection reset");
    };
    auto outcome = runEnqueue(*h.requestScheduler, makeRequest("flaky-network"), failing);
    assert(outcome.error && *outcome.error == ErrorKind::NetworkTransient);
    {
        std::lock_guard<std::mutex> lock(timesMutex);
        assert(attempts.size() == 3);
        assert(attempts[1] - attempts[0] >= 20ms);
        assert(attempts[2] - attempts[1] >= 40ms);
    }
    assert(h.monitor->totals().retries == 2);

    auto unauthorized = [&](const CancellationToken&) -> Payload {
        ++authCalls;
        throw InferenceError(ErrorKind::Authentication, "invalid api key");
    };
    outcome = runEnqueue(*h.requestScheduler, makeRequest("auth"), unauthorized);
    assert(outcome.error && *outcome.error == ErrorKind::Authentication);
    assert(authCalls == 1);

    // Исключение не из иерархии InferenceError считается Unknown и повторяется
    auto flaky = [&](const CancellationToken&) -> Payload {
        if (++flakyCalls == 1) {
            throw std::runtime_error("unexpected response");
        }
        return Payload::fromString("text/plain", "recovered");
    };
    outcome = runEnqueue(*h.requestScheduler, makeRequest("unknown"), flaky);
    assert(outcome.value && *outcome.value == "recovered");
    assert(flakyCalls == 2);

    // Неудачный результат не кэшируется
    assert(!h.requestScheduler->getCached(makeRequest("auth")));
    std::cout << "[OK] RequestScheduler retries\n";
}

void smokeTestTimeout() {
    std::atomic<bool> observedCancel{false};
    std::atomic<bool> finished{false};
    Harness h("timeout", 3, 100ms, fastRetry(1));

    assert(h.requestScheduler->computeTimeout(RequestKind::PhotoRecognition) >
           h.requestScheduler->computeTimeout(RequestKind::ItemIdentification));

    auto slow = [&](const CancellationToken& token) {
        observedCancel = token.waitFor(5000ms);
        finished = true;
        return Payload::fromString("text/plain", "late");
    };

    const auto started = std::chrono::steady_clock::now();
    auto outcome = runEnqueue(*h.requestScheduler, makeRequest("slow"), slow);
    assert(outcome.error && *outcome.error == ErrorKind::Timeout);
    assert(std::chrono::steady_clock::now() - started < 2000ms);

    assert(waitUntil([&] { return finished.load(); }));
    assert(observedCancel);
    // Поздний результат отброшен
    assert(!h.requestScheduler->getCached(makeRequest("slow")));
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 0; }));
    std::cout << "[OK] RequestScheduler timeout\n";
}

void smokeTestWaiterCancellation() {
    std::atomic<bool> sharedCancelled{false};
    std::atomic<bool> lonelyCancelled{false};
    Harness h("cancel", 1);

    // Один из двух ожидающих уходит: общий вызов продолжается
    auto shared = [&](const CancellationToken& token) {
        sharedCancelled = token.waitFor(300ms);
        return Payload::fromString("text/plain", "shared");
    };
    CancellationSource leaving;
    Outcome first;
    Outcome second;
    std::thread a([&] { first = runEnqueue(*h.requestScheduler, makeRequest("shared"), shared, leaving.token()); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().waiters == 1; }));
    std::thread b([&] { second = runEnqueue(*h.requestScheduler, makeRequest("shared"), shared); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().waiters == 2; }));

    leaving.cancel();
    a.join();
    b.join();
    assert(first.error && *first.error == ErrorKind::Cancelled);
    assert(second.value && *second.value == "shared");
    assert(!sharedCancelled);

    // Уход последнего ожидающего отменяет вызов
    std::atomic<bool> lonelyFinished{false};
    auto lonely = [&](const CancellationToken& token) {
        lonelyCancelled = token.waitFor(5000ms);
        lonelyFinished = true;
        return Payload::fromString("text/plain", "lonely");
    };
    CancellationSource source;
    Outcome outcome;
    std::thread c([&] { outcome = runEnqueue(*h.requestScheduler, makeRequest("lonely"), lonely, source.token()); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 1; }));
    source.cancel();
    c.join();
    assert(outcome.error && *outcome.error == ErrorKind::Cancelled);
    assert(waitUntil([&] { return lonelyFinished.load(); }));
    assert(lonelyCancelled);
    assert(!h.requestScheduler->getCached(makeRequest("lonely")));

    // Уже отменённый токен
    CancellationSource early;
    early.cancel();
    outcome = runEnqueue(*h.requestScheduler, makeRequest("early"), lonely, early.token());
    assert(outcome.error && *outcome.error == ErrorKind::Cancelled);
    std::cout << "[OK] RequestScheduler waiter cancellation\n";
}

void smokeTestCancelAllAndShutdown() {
    Harness h("cancel_all", 1);
    auto blocking = [](const CancellationToken& token) {
        token.waitFor(5000ms);
        return Payload::fromString("text/plain", "never");
    };

    Outcome originator;
    Outcome duplicate;
    std::thread a([&] { originator = runEnqueue(*h.requestScheduler, makeRequest("stuck"), blocking); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 1; }));
    std::thread b([&] { duplicate = runEnqueue(*h.requestScheduler, makeRequest("stuck"), blocking); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().waiters == 2; }));

    assert(h.requestScheduler->cancelAll() == 1);
    a.join();
    b.join();
    assert(originator.error && *originator.error == ErrorKind::Cancelled);
    assert(duplicate.error && *duplicate.error == ErrorKind::DuplicateInFlight);

    h.requestScheduler->shutdown();
    h.requestScheduler->shutdown();
    auto rejected = runEnqueue(*h.requestScheduler, makeRequest("late"), blocking);
    assert(rejected.error && *rejected.error == ErrorKind::Cancelled);
    std::cout << "[OK] RequestScheduler cancelAll and shutdown\n";
}

void smokeTestSharedFailure() {
    std::atomic<int> invocations{0};
    Gate gate;
    Harness h("shared_failure", 1);
    auto unauthorized = [&](const CancellationToken&) -> Payload {
        ++invocations;
        gate.wait();
        throw InferenceError(ErrorKind::Authentication, "invalid api key");
    };

    std::vector<std::thread> callers;
    std::vector<Outcome> outcomes(4);
    callers.emplace_back([&] { outcomes[0] = runEnqueue(*h.requestScheduler, makeRequest("denied"), unauthorized); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 1; }));
    for (size_t i = 1; i < outcomes.size(); ++i) {
        callers.emplace_back([&, i] { outcomes[i] = runEnqueue(*h.requestScheduler, makeRequest("denied"), unauthorized); });
    }
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().waiters == 4; }));
    gate.open();
    for (auto& t : callers) t.join();

    // Один вызов исполнителя, одна и та же ошибка у всех ожидающих
    assert(invocations == 1);
    for (const auto& outcome : outcomes) {
        assert(!outcome.value);
        assert(outcome.error && *outcome.error == ErrorKind::Authentication);
    }
    assert(!h.requestScheduler->getCached(makeRequest("denied")));
    assert(h.monitor->totals().retries == 0);
    std::cout << "[OK] RequestScheduler shared fatal failure\n";
}

void smokeTestFifoWithinPriority() {
    Gate gate;
    std::mutex orderMutex;
    std::vector<std::string> order;
    Harness h("fifo", 1);

    auto recording = [&](const std::string& name) {
        return [&, name](const CancellationToken&) {
            {
                std::lock_guard<std::mutex> lock(orderMutex);
                order.push_back(name);
            }
            if (name == "blocker") gate.wait();
            return Payload::fromString("text/plain", name);
        };
    };

    std::thread blocker([&] { runEnqueue(*h.requestScheduler, makeRequest("blocker"), recording("blocker")); });
    assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().active == 1; }));

    std::vector<std::thread> callers;
    const std::vector<std::string> names = {"A", "B", "C"};
    for (size_t i = 0; i < names.size(); ++i) {
        const auto name = names[i];
        callers.emplace_back([&, name] { runEnqueue(*h.requestScheduler, makeRequest(name), recording(name)); });
        assert(waitUntil([&] { return h.requestScheduler->getQueueStatus().pending == i + 1; }));
    }

    gate.open();
    blocker.join();
    for (auto& t : callers) t.join();

    std::lock_guard<std::mutex> lock(orderMutex);
    assert((order == std::vector<std::string>{"blocker", "A", "B", "C"}));
    std::cout << "[OK] RequestScheduler FIFO within priority\n";
}

void smokeTestNonStandardException() {
    std::atomic<int> calls{0};
    Harness h("foreign_throw", 3);

    // Значение, брошенное не как исключение, считается Unknown и повторяется
    auto throwsInt = [&](const CancellationToken&) -> Payload {
        if (++calls == 1) {
            throw 42;
        }
        return Payload::fromString("text/plain", "after int");
    };
    auto outcome = runEnqueue(*h.requestScheduler, makeRequest("int-once"), throwsInt);
    assert(outcome.value && *outcome.value == "after int");
    assert(calls == 2);

    Harness single("foreign_throw_single", 3, 30000ms, fastRetry(1));
    auto alwaysInt = [](const CancellationToken&) -> Payload { throw 42; };
    outcome = runEnqueue(*single.requestScheduler, makeRequest("int-always"), alwaysInt);
    assert(outcome.error && *outcome.error == ErrorKind::Unknown);
    assert(waitUntil([&] { return single.requestScheduler->getQueueStatus().active == 0; }));

    // Планировщик продолжает обслуживать запросы
    outcome = runEnqueue(*single.requestScheduler, makeRequest("after"),
        [](const CancellationToken&) { return Payload::fromString("text/plain", "fine"); });
    assert(outcome.value && *outcome.value == "fine");
    std::cout << "[OK] RequestScheduler non-standard exception\n";
}

int main() {
    smokeTestCancellationToken();
    smokeTestDeduplication();
    smokeTestCacheHit();
    smokeTestConcurrencyBound();
    smokeTestPriorityOrder();
    smokeTestRetries();
    smokeTestTimeout();
    smokeTestWaiterCancellation();
    smokeTestCancelAllAndShutdown();
    smokeTestSharedFailure();
    smokeTestFifoWithinPriority();
    smokeTestNonStandardException();
    std::cout << "All RequestScheduler tests passed!\n";
    return 0;
}

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include "core/thread/ThreadPool.hpp"

using namespace infercache::core;
using thread::ThreadPool;
using thread::ThreadPoolConfig;

void smokeTestExecution() {
    ThreadPoolConfig config;
    config.name = "test-pool";
    config.workerCount = 3;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&counter] { ++counter; });
    }
    pool.enqueue([] { throw std::runtime_error("task failure"); });
    pool.waitForCompletion();

    assert(counter == 50);
    auto metrics = pool.getMetrics();
    assert(metrics.totalThreads == 3);
    assert(metrics.completedTasks == 50);
    assert(metrics.failedTasks == 1);
    assert(metrics.queueSize == 0);
    assert(pool.getActiveThreadCount() == 0);
    std::cout << "[OK] ThreadPool execution\n";
}

void smokeTestNonStandardException() {
    ThreadPoolConfig config;
    config.name = "test-pool-int";
    config.workerCount = 1;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    pool.enqueue([] { throw 42; });
    pool.enqueue([&counter] { ++counter; });
    pool.waitForCompletion();

    // Рабочий поток переживает исключение любого типа
    assert(counter == 1);
    auto metrics = pool.getMetrics();
    assert(metrics.failedTasks == 1);
    assert(metrics.completedTasks == 1);
    assert(pool.getActiveThreadCount() == 0);
    std::cout << "[OK] ThreadPool non-standard exception\n";
}

void smokeTestQueueLimit() {
    ThreadPoolConfig config;
    config.name = "test-pool-limit";
    config.workerCount = 1;
    config.queueSize = 1;
    ThreadPool pool(config);

    std::atomic<bool> release{false};
    std::atomic<bool> started{false};
    pool.enqueue([&] {
        started = true;
        while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });
    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    pool.enqueue([] {});
    bool rejected = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    release = true;
    pool.stop();
    assert(pool.isStopped());
    // Задачи из очереди выполняются до остановки
    assert(pool.getMetrics().completedTasks == 2);

    rejected = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);
    std::cout << "[OK] ThreadPool queue limit and stop\n";
}

void smokeTestInvalidConfig() {
    ThreadPoolConfig config;
    config.workerCount = 0;
    bool thrown = false;
    try {
        ThreadPool pool(config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] ThreadPool invalid config\n";
}

int main() {
    smokeTestExecution();
    smokeTestNonStandardException();
    smokeTestQueueLimit();
    smokeTestInvalidConfig();
    std::cout << "All ThreadPool tests passed!\n";
    return 0;
}

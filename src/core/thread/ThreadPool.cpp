#include "core/thread/ThreadPool.hpp"
#include "core/common/Logging.hpp"
#include <stdexcept>

namespace infercache {
namespace core {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;              // Мьютекс для очереди
    std::condition_variable condition;          // Новая задача или остановка
    std::condition_variable idleCondition;      // Очередь опустела и потоки свободны
    bool stop = false;                          // Флаг остановки (под queueMutex)
    size_t activeThreads = 0;                   // Количество активных потоков (под queueMutex)
    std::atomic<size_t> completedTasks{0};
    std::atomic<size_t> failedTasks{0};
    ThreadPoolConfig config;                    // Конфигурация пула потоков
    std::shared_ptr<spdlog::logger> logger;
    
    explicit Impl(const ThreadPoolConfig& cfg)
        : config(cfg), logger(common::componentLogger(cfg.name)) {
        for (size_t i = 0; i < config.workerCount; ++i) {
            workers.emplace_back([this] {
                processTasks();
            });
        }
        
        logger->debug("Пул потоков '{}' инициализирован: {} потоков", config.name, workers.size());
    }
    
    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] {
                    return stop || !tasks.empty();
                });
                
                if (stop && tasks.empty()) {
                    return;
                }
                
                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }
            
            try {
                task();
                ++completedTasks;
            } catch (const std::exception& e) {
                ++failedTasks;
                logger->error("Ошибка выполнения задачи: {}", e.what());
            } catch (...) {
                ++failedTasks;
                logger->error("Ошибка выполнения задачи: исключение неизвестного типа");
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex);
                --activeThreads;
                if (tasks.empty() && activeThreads == 0) {
                    idleCondition.notify_all();
                }
            }
        }
    }

    void join() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            stop = true;
        }
        condition.notify_all();
        
        for (auto& worker : workers) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация пула потоков");
    }
    pImpl = std::make_unique<Impl>(config);
}

// Деструктор
ThreadPool::~ThreadPool() {
    pImpl->join();
}

// Добавление задачи в очередь
void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;
    
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    if (pImpl->stop) {
        throw std::runtime_error("Пул потоков остановлен");
    }
    
    // Проверка размера очереди
    if (pImpl->tasks.size() >= pImpl->config.queueSize) {
        pImpl->logger->error("Очередь задач переполнена: {}", pImpl->tasks.size());
        throw std::runtime_error("Очередь задач переполнена");
    }
    
    pImpl->tasks.push(std::move(task));
    pImpl->condition.notify_one();
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->activeThreads;
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idleCondition.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads == 0;
    });
}

// Остановка пула потоков
void ThreadPool::stop() {
    pImpl->join();
    pImpl->logger->debug("Пул потоков '{}' остановлен", pImpl->config.name);
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->stop;
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        metrics.activeThreads = pImpl->activeThreads;
        metrics.queueSize = pImpl->tasks.size();
    }
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks.load();
    metrics.failedTasks = pImpl->failedTasks.load();
    return metrics;
}

} // namespace thread
} // namespace core
} // namespace infercache

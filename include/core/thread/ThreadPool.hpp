#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace infercache {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество потоков, выполняющих задачу
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
    size_t completedTasks;   // Выполнено задач
    size_t failedTasks;      // Задач, завершившихся исключением
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    std::string name = "threadpool"; // Имя логгера
    size_t workerCount = 4;          // Количество рабочих потоков
    size_t queueSize = 1024;         // Максимальный размер очереди

    bool validate() const {
        if (workerCount == 0) return false;
        if (queueSize == 0) return false;
        if (name.empty()) return false;
        return true;
    }
};

// Пул потоков фиксированного размера
class ThreadPool {
public:
    // Конструктор с конфигурацией
    explicit ThreadPool(const ThreadPoolConfig& config);
    
    // Деструктор (останавливает пул, дожидаясь задач из очереди)
    ~ThreadPool();
    
    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    // Добавление задачи в очередь (std::runtime_error при переполнении или после stop())
    void enqueue(std::function<void()> task);
    
    // Получение количества активных потоков
    size_t getActiveThreadCount() const;
    
    // Получение размера очереди
    size_t getQueueSize() const;
    
    // Ожидание завершения всех задач
    void waitForCompletion();
    
    // Остановка пула потоков
    void stop();

    // Пул остановлен
    bool isStopped() const;
    
    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace core
} // namespace infercache

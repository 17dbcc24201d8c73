#include "core/maintenance/MaintenanceScheduler.hpp"
#include "core/common/Logging.hpp"

namespace infercache {
namespace core {
namespace maintenance {

MaintenanceScheduler::MaintenanceScheduler(const MaintenanceConfig& config,
                                           std::shared_ptr<const common::Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
    , logger_(common::componentLogger("maintenance")) {}

MaintenanceScheduler::~MaintenanceScheduler() {
    stop();
}

void MaintenanceScheduler::addTask(const std::string& name, std::chrono::seconds interval,
                                   std::function<void()> action) {
    std::lock_guard<std::mutex> lock(mutex_);
    Task task;
    task.name = name;
    task.interval = interval;
    task.action = std::move(action);
    task.nextRun = clock_->now() + interval;
    tasks_.push_back(std::move(task));
    logger_->debug("Задача обслуживания '{}' зарегистрирована, интервал {} с", name, interval.count());
}

void MaintenanceScheduler::registerCacheMaintenance(std::shared_ptr<cache::CacheStore> store) {
    addTask("cleanup", config_.cleanupInterval, [store, logger = logger_] {
        size_t expired = store->clearExpired();
        auto stats = store->stats();
        if (stats.totalSize > stats.maxSize) {
            store->runEviction();
        }
        logger->info("Обслуживание кэша: удалено просроченных {}, размер {} из {} байт",
            expired, store->totalSize(), stats.maxSize);
    });
    addTask("reconcile", config_.reconcileInterval, [store] {
        store->reconcile();
    });
}

size_t MaintenanceScheduler::runDue() {
    std::vector<std::pair<std::string, std::function<void()>>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        for (auto& task : tasks_) {
            if (task.nextRun <= now) {
                // Пропущенные периоды не наверстываются
                task.nextRun = now + task.interval;
                ++task.runs;
                due.emplace_back(task.name, task.action);
            }
        }
    }

    for (auto& item : due) {
        try {
            item.second();
        } catch (const std::exception& e) {
            logger_->error("Ошибка задачи обслуживания '{}': {}", item.first, e.what());
        }
    }
    return due.size();
}

bool MaintenanceScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || !config_.enabled) return false;
    running_ = true;
    worker_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(mutex_);
        while (running_) {
            lock.unlock();
            runDue();
            lock.lock();
            condition_.wait_for(lock, config_.pollInterval, [this] { return !running_; });
        }
    });
    logger_->info("Фоновое обслуживание запущено ({} задач)", tasks_.size());
    return true;
}

void MaintenanceScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    condition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    logger_->info("Фоновое обслуживание остановлено");
}

bool MaintenanceScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t MaintenanceScheduler::runCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& task : tasks_) {
        if (task.name == name) return task.runs;
    }
    return 0;
}

std::vector<std::string> MaintenanceScheduler::taskNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& task : tasks_) {
        names.push_back(task.name);
    }
    return names;
}

} // namespace maintenance
} // namespace core
} // namespace infercache

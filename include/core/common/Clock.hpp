#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace infercache {
namespace core {
namespace common {

/**
 * @brief Источник времени для TTL, вытеснения и плановых задач
 *
 * Используется системное (wall-clock) время, так как сроки жизни записей
 * сохраняются на диск и должны переживать перезапуск процесса.
 */
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    /// Текущее время
    virtual TimePoint now() const = 0;
};

// Реальные часы
class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Управляемые часы для тестов
 *
 * Время меняется только через advance()/set().
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now())
        : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
    }

    void set(TimePoint value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

// Миллисекунды с эпохи (формат хранения в индексе)
inline int64_t toEpochMillis(Clock::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline Clock::TimePoint fromEpochMillis(int64_t ms) {
    return Clock::TimePoint(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace common
} // namespace core
} // namespace infercache

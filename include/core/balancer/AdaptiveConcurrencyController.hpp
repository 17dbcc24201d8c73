#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/platform/ResourceProbe.hpp"

namespace infercache {
namespace core {
namespace balancer {

/**
 * @brief Качество сети по скользящему среднему времени ответа
 */
enum class NetworkQuality {
    Excellent,  ///< < 1 с
    Good,       ///< < 3 с
    Fair,       ///< < 8 с
    Poor        ///< остальное
};

// Класс устройства для множителя таймаута
enum class DeviceClass {
    High,
    Medium,
    Low
};

const char* toString(NetworkQuality quality);
const char* toString(DeviceClass deviceClass);

// Множители таймаута по состоянию системы
struct TimeoutMultipliers {
    // Excellent, Good, Fair, Poor
    std::array<double, 4> network{{0.7, 1.0, 1.5, 2.0}};
    // High, Medium, Low
    std::array<double, 3> device{{0.8, 1.0, 1.3}};
    double loadHigh = 1.2;      // active/limit > 0.8
    double loadMedium = 1.0;    // active/limit > 0.5
    double loadLow = 0.9;
};

// Конфигурация контроллера параллелизма
struct ConcurrencyConfig {
    size_t hardCap = 6;                         // Абсолютный потолок
    double initialRttSeconds = 2.0;             // Начальное значение среднего
    double rttSmoothing = 0.2;                  // Вес нового замера в EWMA
    // Границы уровней сети (с): Excellent, Good, Fair
    std::array<double, 3> tierThresholds{{1.0, 3.0, 8.0}};
    // Потолки по уровням сети: Excellent, Good, Fair, Poor
    std::array<size_t, 4> tierLimits{{5, 3, 2, 1}};
    TimeoutMultipliers multipliers;

    bool validate() const {
        if (hardCap == 0) return false;
        if (initialRttSeconds <= 0.0) return false;
        if (rttSmoothing <= 0.0 || rttSmoothing > 1.0) return false;
        if (!(tierThresholds[0] < tierThresholds[1] && tierThresholds[1] < tierThresholds[2])) return false;
        for (auto limit : tierLimits) {
            if (limit == 0) return false;
        }
        return true;
    }

    nlohmann::json toJson() const;
    static ConcurrencyConfig fromJson(const nlohmann::json& j) { return fromJson(j, ConcurrencyConfig{}); }
    static ConcurrencyConfig fromJson(const nlohmann::json& j, const ConcurrencyConfig& defaults);
};

// Снимок состояния контроллера
struct ConcurrencySnapshot {
    size_t limit = 1;
    size_t networkCeiling = 1;
    size_t deviceCeiling = 1;
    size_t memoryCeiling = 1;
    size_t activeCount = 0;
    double averageRttSeconds = 0.0;
    double memoryPressure = 0.0;
    NetworkQuality networkQuality = NetworkQuality::Good;
    DeviceClass deviceClass = DeviceClass::Medium;

    nlohmann::json toJson() const;
};

/**
 * @brief Адаптивный контроллер числа одновременных обращений к бэкенду
 *
 * Лимит равен минимуму трёх независимых потолков:
 * - по качеству сети (EWMA времени ответа);
 * - по характеристикам устройства (читаются один раз при создании);
 * - по давлению памяти (текущая доля резидентной памяти).
 * Дополнительно ограничен hardCap и не бывает меньше 1.
 *
 * @note Потокобезопасен
 */
class AdaptiveConcurrencyController {
public:
    AdaptiveConcurrencyController(const ConcurrencyConfig& config,
                                  std::shared_ptr<const platform::ResourceProbe> probe);

    // Текущий лимит одновременных вызовов
    size_t currentLimit() const;

    // Учёт времени ответа успешного вызова
    void observe(std::chrono::duration<double> roundTripTime);

    // Учёт текущего числа активных вызовов
    void observeLoad(size_t activeCount);

    // Произведение множителей сети, устройства и нагрузки
    double timeoutMultiplier() const;

    NetworkQuality networkQuality() const;
    DeviceClass deviceClass() const;
    double averageRttSeconds() const;

    ConcurrencySnapshot snapshot() const;

    // Потолки по отдельным сигналам (для диагностики и тестов)
    static size_t networkCeilingFor(double averageRttSeconds, const ConcurrencyConfig& config);
    static size_t deviceCeilingFor(const platform::DeviceProfile& profile);
    static size_t memoryCeilingFor(double memoryPressure);
    static DeviceClass deviceClassFor(const platform::DeviceProfile& profile);

private:
    NetworkQuality qualityLocked() const;
    size_t computeLimitLocked(ConcurrencySnapshot* details) const;

    ConcurrencyConfig config_;
    std::shared_ptr<const platform::ResourceProbe> probe_;
    platform::DeviceProfile device_;
    size_t deviceCeiling_;
    DeviceClass deviceClass_;

    mutable std::mutex mutex_;
    double averageRtt_;
    size_t activeCount_ = 0;
    mutable size_t lastLimit_ = 0;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace balancer
} // namespace core
} // namespace infercache

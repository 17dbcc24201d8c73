#pragma once

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheTypes.hpp"

namespace infercache {
namespace core {
namespace scheduler {

// Виды запросов к бэкенду
enum class RequestKind {
    ItemIdentification,
    PhotoRecognition,
    TravelSuggestions,
    PackingOptimization,
    Alternatives,
    AirlinePolicy,
    WeightPrediction,
    MissingItemsCheck
};

constexpr size_t kRequestKindCount = 8;

// Приоритет: больше значение = раньше допуск
enum class RequestPriority : int {
    Low = 0,
    Normal = 1,
    High = 2,
    Urgent = 3
};

const char* toString(RequestKind kind);
const char* toString(RequestPriority priority);
std::optional<RequestKind> requestKindFromString(const std::string& name);
std::vector<RequestKind> allRequestKinds();

// Категория кэша, в которую попадает результат запроса
cache::CacheCategory categoryFor(RequestKind kind);

/**
 * @brief Типизированный запрос к бэкенду
 *
 * Отпечаток вычисляется по виду запроса и параметрам; приоритет и ttl
 * на отпечаток не влияют.
 */
struct InferenceRequest {
    RequestKind kind = RequestKind::ItemIdentification;
    RequestPriority priority = RequestPriority::Normal;
    nlohmann::json parameters = nlohmann::json::object();
    std::optional<std::chrono::seconds> ttl;     // Переопределение TTL категории

    cache::CacheKey fingerprint() const;
    cache::CacheCategory category() const { return categoryFor(kind); }
};

// Таймауты: base * множитель вида * множитель состояния системы
struct TimeoutConfig {
    std::chrono::milliseconds baseTimeout{30000};
    std::array<double, kRequestKindCount> kindMultipliers = defaultKindMultipliers();

    double multiplierFor(RequestKind kind) const {
        return kindMultipliers[static_cast<size_t>(kind)];
    }

    bool validate() const {
        if (baseTimeout.count() <= 0) return false;
        for (double m : kindMultipliers) {
            if (m <= 0.0) return false;
        }
        return true;
    }

    nlohmann::json toJson() const;
    static TimeoutConfig fromJson(const nlohmann::json& j) { return fromJson(j, TimeoutConfig{}); }
    static TimeoutConfig fromJson(const nlohmann::json& j, const TimeoutConfig& defaults);

    static std::array<double, kRequestKindCount> defaultKindMultipliers() {
        std::array<double, kRequestKindCount> m;
        m[static_cast<size_t>(RequestKind::ItemIdentification)]  = 1.0;
        m[static_cast<size_t>(RequestKind::PhotoRecognition)]    = 2.0;
        m[static_cast<size_t>(RequestKind::TravelSuggestions)]   = 1.5;
        m[static_cast<size_t>(RequestKind::PackingOptimization)] = 1.5;
        m[static_cast<size_t>(RequestKind::Alternatives)]        = 1.0;
        m[static_cast<size_t>(RequestKind::AirlinePolicy)]       = 0.8;
        m[static_cast<size_t>(RequestKind::WeightPrediction)]    = 0.5;
        m[static_cast<size_t>(RequestKind::MissingItemsCheck)]   = 1.2;
        return m;
    }
};

// Состояние очереди
struct QueueStatus {
    size_t pending = 0;             // Ожидают слота или повтора
    size_t active = 0;              // Выполняются
    size_t waiters = 0;             // Вызывающих, ожидающих результата
    size_t limit = 1;
    size_t availableSlots = 0;
    std::string networkQuality;
    double averageRttSeconds = 0.0;

    nlohmann::json toJson() const {
        return {
            {"pending", pending},
            {"active", active},
            {"waiters", waiters},
            {"limit", limit},
            {"availableSlots", availableSlots},
            {"networkQuality", networkQuality},
            {"averageRttSeconds", averageRttSeconds}
        };
    }
};

} // namespace scheduler
} // namespace core
} // namespace infercache

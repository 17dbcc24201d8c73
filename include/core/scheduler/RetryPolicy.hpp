#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "core/common/InferenceError.hpp"

namespace infercache {
namespace core {
namespace scheduler {

// Параметры повторов
struct RetryConfig {
    size_t maxAttempts = 3;                         // Включая первую попытку
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{10000};

    bool validate() const {
        return maxAttempts > 0 && baseDelay.count() >= 0 && maxDelay >= baseDelay;
    }

    nlohmann::json toJson() const {
        return {
            {"max_attempts", maxAttempts},
            {"base_delay_ms", baseDelay.count()},
            {"max_delay_ms", maxDelay.count()}
        };
    }

    static RetryConfig fromJson(const nlohmann::json& j) { return fromJson(j, RetryConfig{}); }
    static RetryConfig fromJson(const nlohmann::json& j, const RetryConfig& defaults) {
        RetryConfig config = defaults;
        config.maxAttempts = j.value("max_attempts", defaults.maxAttempts);
        config.baseDelay = std::chrono::milliseconds(
            j.value("base_delay_ms", static_cast<int64_t>(defaults.baseDelay.count())));
        config.maxDelay = std::chrono::milliseconds(
            j.value("max_delay_ms", static_cast<int64_t>(defaults.maxDelay.count())));
        return config;
    }
};

/**
 * @brief Классификация ошибок и задержка между попытками
 *
 * Номер попытки отсчитывается с нуля: attempt = 0 означает, что
 * завершилась неудачей первая попытка.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(const RetryConfig& config = RetryConfig{}) : config_(config) {}

    // Повторять ли после неудачной попытки attempt
    bool shouldRetry(common::ErrorKind error, size_t attempt) const;

    // min(baseDelay * 2^attempt, maxDelay)
    std::chrono::milliseconds backoffDelay(size_t attempt) const;

    // Ошибки, которые в принципе допускают повтор
    static bool isRetryable(common::ErrorKind error);

    size_t maxAttempts() const { return config_.maxAttempts; }
    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
};

} // namespace scheduler
} // namespace core
} // namespace infercache

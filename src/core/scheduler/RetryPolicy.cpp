#include "core/scheduler/RetryPolicy.hpp"
#include <algorithm>

namespace infercache {
namespace core {
namespace scheduler {

using common::ErrorKind;

bool RetryPolicy::isRetryable(ErrorKind error) {
    switch (error) {
        case ErrorKind::NetworkTransient:
        case ErrorKind::Timeout:
        case ErrorKind::Unknown:
        case ErrorKind::InvalidResponse:
            return true;
        case ErrorKind::RateLimited:
        case ErrorKind::Authentication:
        case ErrorKind::Configuration:
        case ErrorKind::DuplicateInFlight:
        case ErrorKind::Cancelled:
        case ErrorKind::CacheCorruption:
        case ErrorKind::StorageUnavailable:
            return false;
    }
    return false;
}

bool RetryPolicy::shouldRetry(ErrorKind error, size_t attempt) const {
    if (attempt + 1 >= config_.maxAttempts) {
        return false;
    }
    if (!isRetryable(error)) {
        return false;
    }
    // Некорректный ответ повторяется только один раз
    if (error == ErrorKind::InvalidResponse) {
        return attempt < 1;
    }
    return true;
}

std::chrono::milliseconds RetryPolicy::backoffDelay(size_t attempt) const {
    const auto cap = config_.maxDelay.count();
    int64_t delay = config_.baseDelay.count();
    for (size_t i = 0; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<int64_t>(delay, cap));
}

} // namespace scheduler
} // namespace core
} // namespace infercache

#include "core/common/InferenceError.hpp"

namespace infercache {
namespace core {
namespace common {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CacheCorruption:    return "cache_corruption";
        case ErrorKind::StorageUnavailable: return "storage_unavailable";
        case ErrorKind::DuplicateInFlight:  return "duplicate_in_flight";
        case ErrorKind::Timeout:            return "timeout";
        case ErrorKind::RateLimited:        return "rate_limited";
        case ErrorKind::Authentication:     return "authentication";
        case ErrorKind::Configuration:      return "configuration";
        case ErrorKind::NetworkTransient:   return "network_transient";
        case ErrorKind::InvalidResponse:    return "invalid_response";
        case ErrorKind::Cancelled:          return "cancelled";
        case ErrorKind::Unknown:            return "unknown";
    }
    return "unknown";
}

} // namespace common
} // namespace core
} // namespace infercache

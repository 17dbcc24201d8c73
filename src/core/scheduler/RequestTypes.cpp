#include "core/scheduler/RequestTypes.hpp"
#include "core/cache/fingerprint/FingerprintGenerator.hpp"
#include <stdexcept>

namespace infercache {
namespace core {
namespace scheduler {

const char* toString(RequestKind kind) {
    switch (kind) {
        case RequestKind::ItemIdentification:  return "item-identification";
        case RequestKind::PhotoRecognition:    return "photo-recognition";
        case RequestKind::TravelSuggestions:   return "travel-suggestions";
        case RequestKind::PackingOptimization: return "packing-optimization";
        case RequestKind::Alternatives:        return "alternatives";
        case RequestKind::AirlinePolicy:       return "airline-policy";
        case RequestKind::WeightPrediction:    return "weight-prediction";
        case RequestKind::MissingItemsCheck:   return "missing-items-check";
    }
    return "item-identification";
}

const char* toString(RequestPriority priority) {
    switch (priority) {
        case RequestPriority::Low:    return "low";
        case RequestPriority::Normal: return "normal";
        case RequestPriority::High:   return "high";
        case RequestPriority::Urgent: return "urgent";
    }
    return "normal";
}

std::optional<RequestKind> requestKindFromString(const std::string& name) {
    for (auto kind : allRequestKinds()) {
        if (name == toString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::vector<RequestKind> allRequestKinds() {
    return {
        RequestKind::ItemIdentification,
        RequestKind::PhotoRecognition,
        RequestKind::TravelSuggestions,
        RequestKind::PackingOptimization,
        RequestKind::Alternatives,
        RequestKind::AirlinePolicy,
        RequestKind::WeightPrediction,
        RequestKind::MissingItemsCheck
    };
}

cache::CacheCategory categoryFor(RequestKind kind) {
    using cache::CacheCategory;
    switch (kind) {
        case RequestKind::ItemIdentification:  return CacheCategory::Identification;
        case RequestKind::PhotoRecognition:    return CacheCategory::PhotoRecognition;
        case RequestKind::TravelSuggestions:   return CacheCategory::Suggestions;
        case RequestKind::PackingOptimization: return CacheCategory::Optimization;
        case RequestKind::Alternatives:        return CacheCategory::Alternatives;
        case RequestKind::AirlinePolicy:       return CacheCategory::PolicyLookup;
        case RequestKind::WeightPrediction:    return CacheCategory::Optimization;
        case RequestKind::MissingItemsCheck:   return CacheCategory::Suggestions;
    }
    return CacheCategory::Identification;
}

cache::CacheKey InferenceRequest::fingerprint() const {
    return cache::FingerprintGenerator::fingerprint(toString(kind), parameters);
}

nlohmann::json TimeoutConfig::toJson() const {
    nlohmann::json kinds = nlohmann::json::object();
    for (auto kind : allRequestKinds()) {
        kinds[toString(kind)] = multiplierFor(kind);
    }
    return {
        {"base_timeout_ms", baseTimeout.count()},
        {"kind_multipliers", kinds}
    };
}

TimeoutConfig TimeoutConfig::fromJson(const nlohmann::json& j, const TimeoutConfig& defaults) {
    TimeoutConfig config = defaults;
    config.baseTimeout = std::chrono::milliseconds(
        j.value("base_timeout_ms", static_cast<int64_t>(defaults.baseTimeout.count())));
    if (j.contains("kind_multipliers")) {
        for (const auto& item : j.at("kind_multipliers").items()) {
            auto kind = requestKindFromString(item.key());
            if (!kind) {
                throw std::invalid_argument("неизвестный вид запроса: " + item.key());
            }
            config.kindMultipliers[static_cast<size_t>(*kind)] = item.value().get<double>();
        }
    }
    return config;
}

} // namespace scheduler
} // namespace core
} // namespace infercache

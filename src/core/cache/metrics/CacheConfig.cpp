#include "core/cache/metrics/CacheConfig.hpp"
#include <stdexcept>

namespace infercache {
namespace core {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    nlohmann::json categoriesJson = nlohmann::json::object();
    for (auto category : allCategories()) {
        const auto& p = policy(category);
        categoriesJson[toString(category)] = {
            {"ttl_seconds", p.ttl.count()},
            {"eviction_weight", p.evictionWeight}
        };
    }
    return {
        {"directory", directory},
        {"max_size_bytes", maxSizeBytes},
        {"eviction_target_fraction", evictionTargetFraction},
        {"compression_level", compressionLevel},
        {"lock_stripes", lockStripes},
        {"memory_max_bytes", memoryMaxBytes},
        {"memory_trim_fraction", memoryTrimFraction},
        {"weights", {
            {"expired_score", weights.expiredScore},
            {"per_day_of_age", weights.perDayOfAge},
            {"per_mib", weights.perMiB}
        }},
        {"categories", categoriesJson}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j, const CacheConfig& defaults) {
    CacheConfig config = defaults;
    config.directory = j.value("directory", defaults.directory);
    config.maxSizeBytes = j.value("max_size_bytes", defaults.maxSizeBytes);
    config.evictionTargetFraction = j.value("eviction_target_fraction", defaults.evictionTargetFraction);
    config.compressionLevel = j.value("compression_level", defaults.compressionLevel);
    config.lockStripes = j.value("lock_stripes", defaults.lockStripes);
    config.memoryMaxBytes = j.value("memory_max_bytes", defaults.memoryMaxBytes);
    config.memoryTrimFraction = j.value("memory_trim_fraction", defaults.memoryTrimFraction);

    if (j.contains("weights")) {
        const auto& w = j.at("weights");
        config.weights.expiredScore = w.value("expired_score", defaults.weights.expiredScore);
        config.weights.perDayOfAge = w.value("per_day_of_age", defaults.weights.perDayOfAge);
        config.weights.perMiB = w.value("per_mib", defaults.weights.perMiB);
    }

    if (j.contains("categories")) {
        for (const auto& item : j.at("categories").items()) {
            const auto& name = item.key();
            const auto& value = item.value();
            auto category = categoryFromString(name);
            if (!category) {
                throw std::invalid_argument("неизвестная категория кэша: " + name);
            }
            auto& p = config.policy(*category);
            p.ttl = std::chrono::seconds(value.value("ttl_seconds", static_cast<int64_t>(p.ttl.count())));
            p.evictionWeight = value.value("eviction_weight", p.evictionWeight);
        }
    }
    return config;
}

} // namespace cache
} // namespace core
} // namespace infercache

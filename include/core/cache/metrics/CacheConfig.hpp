#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/CacheTypes.hpp"

namespace infercache {
namespace core {
namespace cache {

// Политика категории: срок жизни и вес при вытеснении
struct CategoryPolicy {
    std::chrono::seconds ttl{24 * 60 * 60};
    double evictionWeight = 1.0;   // Больше = вытесняется раньше
};

// Веса сигналов оценки вытеснения
struct EvictionWeights {
    double expiredScore = 1.0e9;   // Просроченные записи вытесняются первыми
    double perDayOfAge = 1.0;      // За каждые сутки с момента записи
    double perMiB = 1.0;           // За каждый мегабайт размера
};

// Унифицированная конфигурация кэша
struct CacheConfig {
    std::string directory = "cache";
    size_t maxSizeBytes = 50 * 1024 * 1024;     // Бюджет хранилища
    double evictionTargetFraction = 0.8;        // Цель вытеснения относительно бюджета
    int compressionLevel = 6;                   // Уровень zlib (1..9)
    size_t lockStripes = 64;                    // Число блокировок по ключам
    size_t memoryMaxBytes = 8 * 1024 * 1024;    // Уровень памяти (0 = отключён)
    double memoryTrimFraction = 0.75;           // Цель сокращения уровня памяти
    EvictionWeights weights;
    std::array<CategoryPolicy, kCategoryCount> categories = defaultCategoryPolicies();

    const CategoryPolicy& policy(CacheCategory category) const {
        return categories[static_cast<size_t>(category)];
    }
    CategoryPolicy& policy(CacheCategory category) {
        return categories[static_cast<size_t>(category)];
    }

    bool validate() const {
        if (directory.empty()) return false;
        if (maxSizeBytes == 0) return false;
        if (evictionTargetFraction < 0.0 || evictionTargetFraction > 1.0) return false;
        if (compressionLevel < 1 || compressionLevel > 9) return false;
        if (lockStripes == 0) return false;
        if (memoryTrimFraction <= 0.0 || memoryTrimFraction > 1.0) return false;
        for (const auto& p : categories) {
            if (p.ttl.count() <= 0 || p.evictionWeight < 0.0) return false;
        }
        return true;
    }

    nlohmann::json toJson() const;
    // Отсутствующие поля берутся из defaults
    static CacheConfig fromJson(const nlohmann::json& j) { return fromJson(j, CacheConfig{}); }
    static CacheConfig fromJson(const nlohmann::json& j, const CacheConfig& defaults);

    static std::array<CategoryPolicy, kCategoryCount> defaultCategoryPolicies() {
        using std::chrono::hours;
        using std::chrono::duration_cast;
        using std::chrono::seconds;
        std::array<CategoryPolicy, kCategoryCount> p;
        p[static_cast<size_t>(CacheCategory::Identification)]   = {duration_cast<seconds>(hours(24)), 1.5};
        p[static_cast<size_t>(CacheCategory::PhotoRecognition)] = {duration_cast<seconds>(hours(24 * 7)), 0.5};
        p[static_cast<size_t>(CacheCategory::Suggestions)]      = {duration_cast<seconds>(hours(24)), 2.0};
        p[static_cast<size_t>(CacheCategory::Optimization)]     = {duration_cast<seconds>(hours(12)), 2.5};
        p[static_cast<size_t>(CacheCategory::Alternatives)]     = {duration_cast<seconds>(hours(24)), 2.0};
        p[static_cast<size_t>(CacheCategory::PolicyLookup)]     = {duration_cast<seconds>(hours(24 * 7)), 1.0};
        return p;
    }
};

} // namespace cache
} // namespace core
} // namespace infercache

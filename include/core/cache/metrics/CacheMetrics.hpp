#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace infercache {
namespace core {
namespace cache {

// Статистика хранилища, вычисляется только по метаданным
struct CacheStatistics {
    size_t totalSize = 0;           // Суммарный размер полезной нагрузки (байт, после сжатия)
    size_t maxSize = 0;             // Бюджет (байт)
    size_t entryCount = 0;          // Количество записей
    size_t expiredCount = 0;        // Из них просрочено
    std::map<std::string, size_t> perCategoryCounts;
    std::map<std::string, size_t> perCategorySize;
    size_t hits = 0;
    size_t misses = 0;
    size_t memoryHits = 0;          // Из hits: обслужено уровнем памяти
    size_t memoryEntries = 0;
    size_t memoryBytes = 0;
    size_t writes = 0;
    size_t evictions = 0;           // Удалено менеджером вытеснения
    size_t corruptions = 0;         // Повреждённых записей удалено
    size_t storageErrors = 0;       // Ошибок ввода-вывода
    bool degraded = false;          // Хранилище недоступно, работа без кэша

    double hitRate() const {
        size_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }

    double usagePercentage() const {
        return maxSize > 0 ? static_cast<double>(totalSize) / maxSize * 100.0 : 0.0;
    }

    nlohmann::json toJson() const {
        return {
            {"totalSize", totalSize},
            {"maxSize", maxSize},
            {"entryCount", entryCount},
            {"expiredCount", expiredCount},
            {"perCategoryCounts", perCategoryCounts},
            {"perCategorySize", perCategorySize},
            {"hits", hits},
            {"misses", misses},
            {"memoryHits", memoryHits},
            {"memoryEntries", memoryEntries},
            {"memoryBytes", memoryBytes},
            {"hitRate", hitRate()},
            {"writes", writes},
            {"evictions", evictions},
            {"corruptions", corruptions},
            {"storageErrors", storageErrors},
            {"usagePercentage", usagePercentage()},
            {"degraded", degraded}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace infercache

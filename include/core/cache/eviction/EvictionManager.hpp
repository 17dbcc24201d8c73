#pragma once

#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/CacheTypes.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/common/Clock.hpp"

namespace infercache {
namespace core {
namespace cache {

/**
 * @brief Хранилище, из которого можно вытеснять записи
 *
 * Реализуется CacheStore; в тестах подменяется фиктивным хранилищем.
 */
class EvictableStore {
public:
    virtual ~EvictableStore() = default;

    virtual std::vector<CacheMetadata> metadataSnapshot() const = 0;
    // true, если запись существовала и удалена
    virtual bool removeEntry(CacheCategory category, const CacheKey& key) = 0;
    virtual size_t totalSize() const = 0;
    virtual size_t maxSize() const = 0;
};

// Результат прохода вытеснения
struct EvictionReport {
    size_t removedEntries = 0;
    size_t removedExpired = 0;
    size_t freedBytes = 0;
    size_t sizeBefore = 0;
    size_t sizeAfter = 0;
};

/**
 * @brief Менеджер вытеснения
 *
 * @details Оценка записи складывается из сигналов:
 *  - просроченность (weights.expiredScore);
 *  - возраст в сутках (weights.perDayOfAge);
 *  - размер в МиБ (weights.perMiB);
 *  - вес категории (CategoryPolicy::evictionWeight).
 * Записи удаляются в порядке убывания оценки, при равенстве раньше
 * удаляется более старая. Просроченные удаляются всегда.
 */
class EvictionManager {
public:
    EvictionManager(const CacheConfig& config, std::shared_ptr<const common::Clock> clock);

    double score(const CacheMetadata& metadata, common::Clock::TimePoint now) const;

    // Порядок вытеснения: первый элемент удаляется первым
    std::vector<CacheMetadata> rank(std::vector<CacheMetadata> entries,
                                    common::Clock::TimePoint now) const;

    /**
     * @brief Вытеснение до targetFraction * maxSize
     * @details Повторный вызов без новых записей ничего не удаляет
     */
    EvictionReport evictToTarget(EvictableStore& store, double targetFraction) const;

    // Вытеснение до цели из конфигурации
    EvictionReport evict(EvictableStore& store) const;

private:
    CacheConfig config_;
    std::shared_ptr<const common::Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace infercache

#pragma once

#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "core/cache/CacheTypes.hpp"
#include "core/common/Clock.hpp"

namespace infercache {
namespace core {
namespace cache {

/**
 * @brief Ограниченный по объёму кэш горячих записей в памяти перед диском
 * @details Ключ: составной ключ записи (`<category>_<key>`). Размер записи
 * считается по несжатой полезной нагрузке и тегу типа. Если вставка превышает
 * бюджет, вытесняются записи с наименьшей оценкой «обращения / давность
 * последнего обращения» до trimFraction от бюджета. При равной оценке первой
 * уходит давно не использованная запись (LRU).
 *
 * Синхронизация внешних операций (put/erase одного ключа) обеспечивается
 * блокировкой ключа в CacheStore; собственный mutex защищает только структуру.
 */
class MemoryTier {
public:
    // maxBytes == 0 отключает уровень
    MemoryTier(size_t maxBytes, double trimFraction);

    // Запись, если она есть и не просрочена на момент now
    std::optional<CacheEntry> get(const std::string& compositeKey, common::Clock::TimePoint now);

    // Вставка или замена; запись больше всего бюджета не хранится
    void put(const std::string& compositeKey, const CacheEntry& entry, common::Clock::TimePoint now);

    void erase(const std::string& compositeKey);
    void clear();

    size_t size() const;
    size_t bytes() const;
    size_t maxBytes() const { return maxBytes_; }
    bool enabled() const { return maxBytes_ > 0; }

private:
    struct Slot {
        CacheEntry entry;
        size_t sizeBytes = 0;
        size_t accessCount = 0;
        common::Clock::TimePoint lastAccess;
    };

    using LruList = std::list<std::string>;

    void eraseLocked(const std::string& compositeKey);
    // Вытеснение до target байт; вызывающий держит mutex_
    size_t trimLocked(size_t target, common::Clock::TimePoint now);

    size_t maxBytes_;
    double trimFraction_;
    size_t bytes_ = 0;
    std::unordered_map<std::string, std::pair<LruList::iterator, Slot>> entries_;
    LruList lruList_;                       // front = последнее обращение
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cache
} // namespace core
} // namespace infercache

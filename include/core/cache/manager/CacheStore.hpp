#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>
#include "core/cache/CacheTypes.hpp"
#include "core/cache/eviction/EvictionManager.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"
#include "core/cache/storage/StorageBackend.hpp"
#include "core/common/Clock.hpp"

namespace infercache {
namespace core {
namespace cache {

// Имя файла индекса метаданных в области хранения
constexpr const char* kIndexFileName = "cache_index.json";

/**
 * @brief Постоянное хранилище результатов с TTL и сжатием
 *
 * @details Каждая запись хранится отдельным файлом `<category>_<key>.bin`
 * (CBOR-конверт, сжатый zlib). Метаданные всех записей хранятся в едином
 * индексе `cache_index.json`, по которому считается статистика без чтения
 * полезной нагрузки. Горячие записи дополнительно держатся в MemoryTier:
 * get() сначала проверяет индекс, затем память, затем диск, и поднимает
 * прочитанную с диска запись в память. Любое удаление записи из индекса
 * удаляет её и из памяти.
 *
 * Запись сериализуется блокировкой по ключу (striped mutex), независимые
 * ключи пишутся параллельно. Порядок блокировок: ключ, затем индекс.
 *
 * Ошибки хранилища и повреждённые данные никогда не выходят наружу:
 * get() возвращает промах, put() возвращает false.
 */
class CacheStore : public EvictableStore {
public:
    CacheStore(const CacheConfig& config,
               std::shared_ptr<storage::StorageBackend> backend,
               std::shared_ptr<const common::Clock> clock);

    // Хранилище на локальной файловой системе в config.directory
    CacheStore(const CacheConfig& config, std::shared_ptr<const common::Clock> clock);

    ~CacheStore() override;

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    /**
     * @brief Подготовка каталога, загрузка индекса и сверка с файлами
     * @return false при некорректной конфигурации или недоступном хранилище
     *         (в этом случае кэш работает в обходном режиме)
     */
    bool initialize();

    // Запись с TTL категории или явным ttl
    bool put(CacheCategory category, const CacheKey& key, const Payload& payload,
             std::optional<std::chrono::seconds> ttl = std::nullopt);

    // std::nullopt: нет записи, запись просрочена или повреждена
    std::optional<CacheEntry> get(CacheCategory category, const CacheKey& key);

    // Идемпотентное удаление
    bool remove(CacheCategory category, const CacheKey& key);
    size_t removeCategory(CacheCategory category);
    size_t clearAll();
    size_t clearExpired();

    /**
     * @brief Сверка индекса с файлами
     * @details Удаляет файлы без метаданных и метаданные без файлов,
     *          исправляет расхождение размеров, удаляет брошенные временные
     *          файлы. Безопасна параллельно с put(): файл без метаданных
     *          удаляется только под блокировкой его ключа
     * @return Количество исправленных расхождений
     */
    size_t reconcile();

    CacheStatistics stats() const;

    // Синхронный проход вытеснения до цели из конфигурации
    EvictionReport runEviction();

    // Ожидание фоновых задач (вытеснения)
    void waitForBackgroundTasks();

    bool isDegraded() const;
    const CacheConfig& config() const;

    // EvictableStore
    std::vector<CacheMetadata> metadataSnapshot() const override;
    bool removeEntry(CacheCategory category, const CacheKey& key) override;
    size_t totalSize() const override;
    size_t maxSize() const override;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace infercache

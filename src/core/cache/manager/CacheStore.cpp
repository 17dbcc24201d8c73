#include "core/cache/manager/CacheStore.hpp"
#include "core/cache/memory/MemoryTier.hpp"
#include "core/cache/storage/Compression.hpp"
#include "core/common/InferenceError.hpp"
#include "core/common/Logging.hpp"
#include "core/thread/ThreadPool.hpp"
#include <atomic>
#include <cstring>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

namespace infercache {
namespace core {
namespace cache {

using common::ErrorKind;
using common::InferenceError;

namespace {

constexpr const char* kPayloadSuffix = ".bin";
// Временные файлы моложе этого возраста могут принадлежать незавершённой записи
constexpr std::chrono::minutes kStaleTempAge{10};

bool isPayloadFile(const std::string& name) {
    const std::string suffix = kPayloadSuffix;
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// CBOR-конверт записи, сжатый zlib
std::vector<uint8_t> encodeEnvelope(const CacheMetadata& meta, const Payload& payload, int level) {
    nlohmann::json envelope = {
        {"key", meta.key},
        {"category", toString(meta.category)},
        {"type", payload.typeTag},
        {"created_at", common::toEpochMillis(meta.createdAt)},
        {"expires_at", common::toEpochMillis(meta.expiresAt)},
        {"data", nlohmann::json::binary(payload.bytes)}
    };
    auto bytes = nlohmann::json::to_cbor(envelope);
    if (!storage::compressData(bytes, level)) {
        throw InferenceError(ErrorKind::StorageUnavailable, "Ошибка сжатия записи " + meta.key);
    }
    return bytes;
}

CacheEntry decodeEnvelope(std::vector<uint8_t> bytes, CacheCategory category, const CacheKey& key) {
    if (!storage::decompressData(bytes)) {
        throw InferenceError(ErrorKind::CacheCorruption, "Не удалось распаковать запись " + key);
    }

    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::from_cbor(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw InferenceError(ErrorKind::CacheCorruption, std::string("Некорректный CBOR: ") + e.what());
    }

    if (!envelope.is_object() || !envelope.contains("data") || !envelope["data"].is_binary()) {
        throw InferenceError(ErrorKind::CacheCorruption, "Неполный конверт записи " + key);
    }
    if (envelope.value("key", std::string()) != key ||
        envelope.value("category", std::string()) != toString(category)) {
        throw InferenceError(ErrorKind::CacheCorruption, "Конверт не соответствует ключу " + key);
    }

    try {
        CacheEntry entry;
        entry.category = category;
        entry.payload.typeTag = envelope.at("type").get<std::string>();
        const auto& data = envelope["data"].get_binary();
        entry.payload.bytes.assign(data.begin(), data.end());
        entry.createdAt = common::fromEpochMillis(envelope.at("created_at").get<int64_t>());
        entry.expiresAt = common::fromEpochMillis(envelope.at("expires_at").get<int64_t>());
        return entry;
    } catch (const nlohmann::json::exception& e) {
        throw InferenceError(ErrorKind::CacheCorruption, std::string("Некорректные поля конверта: ") + e.what());
    }
}

} // namespace

// Реализация PIMPL
struct CacheStore::Impl {
    CacheConfig config;
    std::shared_ptr<storage::StorageBackend> backend;
    std::shared_ptr<const common::Clock> clock;
    std::shared_ptr<spdlog::logger> logger;
    EvictionManager evictor;
    MemoryTier memory;

    std::vector<std::mutex> stripes;                        // Блокировки по ключам
    mutable std::shared_mutex indexMutex;                   // Защита индекса
    std::unordered_map<std::string, CacheMetadata> index;   // compositeKey -> метаданные
    size_t totalSize = 0;                                   // Под indexMutex
    std::mutex indexFileMutex;                              // Сериализация записи индекса на диск
    std::mutex evictionMutex;                               // Один проход вытеснения за раз

    std::atomic<bool> initialized{false};
    std::atomic<bool> degraded{false};
    std::atomic<bool> evictionScheduled{false};
    std::atomic<size_t> hits{0};
    std::atomic<size_t> memoryHits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> writes{0};
    std::atomic<size_t> evictions{0};
    std::atomic<size_t> corruptions{0};
    std::atomic<size_t> storageErrors{0};

    std::unique_ptr<thread::ThreadPool> background;

    Impl(const CacheConfig& cfg,
         std::shared_ptr<storage::StorageBackend> storage,
         std::shared_ptr<const common::Clock> clk)
        : config(cfg)
        , backend(std::move(storage))
        , clock(std::move(clk))
        , logger(common::componentLogger("cachestore"))
        , evictor(cfg, clock)
        , memory(cfg.memoryMaxBytes, cfg.memoryTrimFraction)
        , stripes(cfg.lockStripes > 0 ? cfg.lockStripes : 1) {
        thread::ThreadPoolConfig poolConfig;
        poolConfig.name = "cachestore-bg";
        poolConfig.workerCount = 1;
        poolConfig.queueSize = 16;
        background = std::make_unique<thread::ThreadPool>(poolConfig);
    }

    std::mutex& stripeFor(const std::string& compositeKey) {
        return stripes[std::hash<std::string>{}(compositeKey) % stripes.size()];
    }

    void storageFailure(const char* operation, const std::exception& e) {
        ++storageErrors;
        degraded = true;
        logger->warn("Хранилище недоступно ({}): {}", operation, e.what());
    }

    // Запись индекса на диск; ошибки только логируются
    void persistIndex() {
        std::lock_guard<std::mutex> fileLock(indexFileMutex);
        nlohmann::json j = nlohmann::json::object();
        {
            std::shared_lock<std::shared_mutex> lock(indexMutex);
            for (const auto& item : index) {
                j[item.first] = item.second.toJson();
            }
        }
        try {
            auto text = j.dump();
            backend->writeFile(kIndexFileName, std::vector<uint8_t>(text.begin(), text.end()));
            degraded = false;
        } catch (const InferenceError& e) {
            storageFailure("index", e);
        }
    }

    void loadIndex() {
        auto bytes = backend->readFile(kIndexFileName);
        if (!bytes) {
            logger->info("Индекс кэша не найден, создаётся новый");
            return;
        }

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(bytes->begin(), bytes->end());
        } catch (const nlohmann::json::parse_error& e) {
            logger->warn("Индекс кэша повреждён, будет перестроен: {}", e.what());
            return;
        }
        if (!j.is_object()) {
            logger->warn("Индекс кэша имеет неверный формат");
            return;
        }

        std::unique_lock<std::shared_mutex> lock(indexMutex);
        index.clear();
        totalSize = 0;
        for (const auto& item : j.items()) {
            try {
                auto meta = CacheMetadata::fromJson(item.value());
                totalSize += meta.sizeBytes;
                index[meta.compositeKey()] = std::move(meta);
            } catch (const std::exception& e) {
                ++corruptions;
                logger->warn("Пропущена запись индекса {}: {}", item.key(), e.what());
            }
        }
    }

    // Удаление записи; вызывающий держит блокировку ключа
    bool eraseLocked(const std::string& compositeKey, const std::string& fileName) {
        memory.erase(compositeKey);
        try {
            backend->deleteFile(fileName);
        } catch (const InferenceError& e) {
            storageFailure("delete", e);
        }
        std::unique_lock<std::shared_mutex> lock(indexMutex);
        auto it = index.find(compositeKey);
        if (it == index.end()) {
            return false;
        }
        totalSize -= it->second.sizeBytes;
        index.erase(it);
        return true;
    }

    // Файл без записи в индексе удаляется под блокировкой своего ключа:
    // put() держит её между записью файла и обновлением индекса
    bool removeOrphan(const std::string& fileName) {
        auto composite = fileName.substr(0, fileName.size() - std::strlen(kPayloadSuffix));
        std::lock_guard<std::mutex> keyLock(stripeFor(composite));
        {
            std::shared_lock<std::shared_mutex> lock(indexMutex);
            if (index.count(composite)) {
                return false;
            }
        }
        backend->deleteFile(fileName);
        return true;
    }

    // Запись в индексе не менялась с момента снимка
    bool unchangedSince(const CacheMetadata& seen) const {
        std::shared_lock<std::shared_mutex> lock(indexMutex);
        auto it = index.find(seen.compositeKey());
        return it != index.end() &&
               it->second.createdAt == seen.createdAt &&
               it->second.expiresAt == seen.expiresAt &&
               it->second.sizeBytes == seen.sizeBytes;
    }

    size_t removeAll(const std::vector<CacheMetadata>& entries) {
        size_t removed = 0;
        for (const auto& meta : entries) {
            auto composite = meta.compositeKey();
            std::lock_guard<std::mutex> keyLock(stripeFor(composite));
            if (eraseLocked(composite, meta.fileName())) {
                ++removed;
            }
        }
        if (!entries.empty()) {
            persistIndex();
        }
        return removed;
    }

    std::vector<CacheMetadata> snapshot(const std::function<bool(const CacheMetadata&)>& filter) const {
        std::vector<CacheMetadata> result;
        std::shared_lock<std::shared_mutex> lock(indexMutex);
        for (const auto& item : index) {
            if (!filter || filter(item.second)) {
                result.push_back(item.second);
            }
        }
        return result;
    }
};

CacheStore::CacheStore(const CacheConfig& config,
                       std::shared_ptr<storage::StorageBackend> backend,
                       std::shared_ptr<const common::Clock> clock)
    : pImpl(std::make_unique<Impl>(config, std::move(backend), std::move(clock))) {}

CacheStore::CacheStore(const CacheConfig& config, std::shared_ptr<const common::Clock> clock)
    : CacheStore(config, std::make_shared<storage::FileSystemStorage>(config.directory), std::move(clock)) {}

CacheStore::~CacheStore() {
    // Фоновые задачи обращаются к pImpl
    pImpl->background->stop();
}

bool CacheStore::initialize() {
    if (pImpl->initialized) return true;

    if (!pImpl->config.validate()) {
        pImpl->logger->error("Некорректная конфигурация кэша");
        return false;
    }

    try {
        pImpl->backend->prepare();
        pImpl->loadIndex();
    } catch (const InferenceError& e) {
        pImpl->storageFailure("initialize", e);
        pImpl->logger->error("Кэш работает без хранилища: {}", e.what());
        return false;
    }

    pImpl->initialized = true;
    size_t fixed = reconcile();

    auto current = totalSize();
    pImpl->logger->info("CacheStore инициализирован: {} записей, {} байт, исправлено расхождений: {}",
        metadataSnapshot().size(), current, fixed);
    if (current > pImpl->config.maxSizeBytes) {
        runEviction();
    }
    return true;
}

bool CacheStore::put(CacheCategory category, const CacheKey& key, const Payload& payload,
                     std::optional<std::chrono::seconds> ttl) {
    if (!pImpl->initialized) return false;

    CacheMetadata meta;
    meta.key = key;
    meta.category = category;
    meta.createdAt = pImpl->clock->now();
    auto lifetime = ttl ? *ttl : pImpl->config.policy(category).ttl;
    if (lifetime.count() < 0) {
        lifetime = std::chrono::seconds(0);
    }
    meta.expiresAt = meta.createdAt + lifetime;

    std::vector<uint8_t> bytes;
    try {
        bytes = encodeEnvelope(meta, payload, pImpl->config.compressionLevel);
    } catch (const std::exception& e) {
        pImpl->logger->error("Ошибка сериализации записи {}: {}", key, e.what());
        return false;
    }
    meta.sizeBytes = bytes.size();

    if (meta.sizeBytes > pImpl->config.maxSizeBytes) {
        pImpl->logger->warn("Запись {} ({} байт) больше бюджета кэша ({} байт), не сохраняется",
            meta.compositeKey(), meta.sizeBytes, pImpl->config.maxSizeBytes);
        return false;
    }

    auto composite = meta.compositeKey();
    size_t sizeAfter = 0;
    {
        std::lock_guard<std::mutex> keyLock(pImpl->stripeFor(composite));
        try {
            pImpl->backend->writeFile(meta.fileName(), bytes);
        } catch (const InferenceError& e) {
            pImpl->storageFailure("write", e);
            return false;
        }

        {
            std::unique_lock<std::shared_mutex> lock(pImpl->indexMutex);
            auto it = pImpl->index.find(composite);
            if (it != pImpl->index.end()) {
                pImpl->totalSize -= it->second.sizeBytes;
            }
            pImpl->totalSize += meta.sizeBytes;
            pImpl->index[composite] = meta;
            sizeAfter = pImpl->totalSize;
        }
        pImpl->persistIndex();

        CacheEntry entry;
        entry.payload = payload;
        entry.category = category;
        entry.createdAt = meta.createdAt;
        entry.expiresAt = meta.expiresAt;
        pImpl->memory.put(composite, entry, meta.createdAt);
    }

    ++pImpl->writes;
    pImpl->logger->debug("Запись сохранена: {} ({} байт сжато из {})", composite, meta.sizeBytes, payload.size());

    if (sizeAfter > pImpl->config.maxSizeBytes && !pImpl->evictionScheduled.exchange(true)) {
        try {
            pImpl->background->enqueue([this] {
                pImpl->evictionScheduled = false;
                runEviction();
            });
        } catch (const std::runtime_error& e) {
            pImpl->evictionScheduled = false;
            pImpl->logger->warn("Не удалось запланировать вытеснение: {}", e.what());
        }
    }
    return true;
}

std::optional<CacheEntry> CacheStore::get(CacheCategory category, const CacheKey& key) {
    if (!pImpl->initialized) {
        ++pImpl->misses;
        return std::nullopt;
    }

    const auto fileName = payloadFileName(category, key);
    const auto composite = std::string(toString(category)) + "_" + key;
    const auto now = pImpl->clock->now();

    std::lock_guard<std::mutex> keyLock(pImpl->stripeFor(composite));

    std::optional<CacheMetadata> meta;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->indexMutex);
        auto it = pImpl->index.find(composite);
        if (it != pImpl->index.end()) {
            meta = it->second;
        }
    }

    if (!meta) {
        ++pImpl->misses;
        return std::nullopt;
    }

    if (meta->isExpired(now)) {
        pImpl->logger->debug("Запись просрочена: {}", composite);
        pImpl->eraseLocked(composite, fileName);
        pImpl->persistIndex();
        ++pImpl->misses;
        return std::nullopt;
    }

    if (auto cached = pImpl->memory.get(composite, now)) {
        ++pImpl->hits;
        ++pImpl->memoryHits;
        pImpl->logger->debug("Попадание в памяти: {}", composite);
        return cached;
    }

    try {
        auto bytes = pImpl->backend->readFile(fileName);
        if (!bytes) {
            throw InferenceError(ErrorKind::CacheCorruption, "Отсутствует файл " + fileName);
        }
        auto entry = decodeEnvelope(std::move(*bytes), category, key);
        // Время жизни определяется индексом
        entry.createdAt = meta->createdAt;
        entry.expiresAt = meta->expiresAt;
        ++pImpl->hits;
        pImpl->logger->debug("Кэш-попадание: {}", composite);
        pImpl->memory.put(composite, entry, now);
        return entry;
    } catch (const InferenceError& e) {
        if (e.kind() == ErrorKind::CacheCorruption) {
            ++pImpl->corruptions;
            pImpl->logger->warn("Повреждённая запись удалена: {}", e.what());
            pImpl->eraseLocked(composite, fileName);
            pImpl->persistIndex();
        } else {
            pImpl->storageFailure("read", e);
        }
    }
    ++pImpl->misses;
    return std::nullopt;
}

bool CacheStore::remove(CacheCategory category, const CacheKey& key) {
    if (!pImpl->initialized) return false;

    const auto composite = std::string(toString(category)) + "_" + key;
    bool removed;
    {
        std::lock_guard<std::mutex> keyLock(pImpl->stripeFor(composite));
        removed = pImpl->eraseLocked(composite, payloadFileName(category, key));
    }
    if (removed) {
        pImpl->persistIndex();
    }
    return removed;
}

size_t CacheStore::removeCategory(CacheCategory category) {
    if (!pImpl->initialized) return 0;

    auto entries = pImpl->snapshot([category](const CacheMetadata& m) { return m.category == category; });
    size_t removed = pImpl->removeAll(entries);
    pImpl->logger->info("Очищена категория {}: {} записей", toString(category), removed);
    return removed;
}

size_t CacheStore::clearAll() {
    if (!pImpl->initialized) return 0;

    size_t removed = pImpl->removeAll(pImpl->snapshot(nullptr));

    // Файлы, не попавшие в индекс; параллельная запись сохраняется
    try {
        for (const auto& file : pImpl->backend->listFiles()) {
            if (isPayloadFile(file.name)) {
                pImpl->removeOrphan(file.name);
            }
        }
    } catch (const InferenceError& e) {
        pImpl->storageFailure("clear", e);
    }
    pImpl->persistIndex();

    pImpl->logger->info("Кэш очищен: {} записей", removed);
    return removed;
}

size_t CacheStore::clearExpired() {
    if (!pImpl->initialized) return 0;

    const auto now = pImpl->clock->now();
    auto expired = pImpl->snapshot([now](const CacheMetadata& m) { return m.isExpired(now); });
    size_t removed = pImpl->removeAll(expired);
    if (removed > 0) {
        pImpl->logger->info("Удалено просроченных записей: {}", removed);
    }
    return removed;
}

size_t CacheStore::reconcile() {
    if (!pImpl->initialized) return 0;

    // Снимок индекса до листинга: записи, изменённые позже, не трогаются
    const auto indexed = metadataSnapshot();

    std::vector<storage::StoredFile> files;
    try {
        files = pImpl->backend->listFiles();
    } catch (const InferenceError& e) {
        pImpl->storageFailure("list", e);
        return 0;
    }

    std::unordered_map<std::string, size_t> fileSizes;
    for (const auto& file : files) {
        if (isPayloadFile(file.name)) {
            fileSizes[file.name] = file.sizeBytes;
        }
    }

    size_t fixed = 0;
    try {
        size_t purged = pImpl->backend->purgeTemporaryFiles(kStaleTempAge);
        if (purged > 0) {
            pImpl->logger->info("Удалено брошенных временных файлов: {}", purged);
            fixed += purged;
        }
    } catch (const InferenceError& e) {
        pImpl->storageFailure("purge", e);
    }

    std::unordered_set<std::string> known;
    for (const auto& meta : indexed) {
        auto composite = meta.compositeKey();
        auto fileName = meta.fileName();
        known.insert(fileName);

        std::lock_guard<std::mutex> keyLock(pImpl->stripeFor(composite));
        if (!pImpl->unchangedSince(meta)) continue;

        auto it = fileSizes.find(fileName);
        if (it == fileSizes.end()) {
            // Метаданные без полезной нагрузки
            bool present = false;
            try {
                present = pImpl->backend->exists(fileName);
            } catch (const InferenceError& e) {
                pImpl->storageFailure("exists", e);
                continue;
            }
            if (!present && pImpl->eraseLocked(composite, fileName)) {
                ++pImpl->corruptions;
                ++fixed;
            }
            continue;
        }
        std::unique_lock<std::shared_mutex> lock(pImpl->indexMutex);
        auto current = pImpl->index.find(composite);
        if (current != pImpl->index.end() && current->second.sizeBytes != it->second) {
            pImpl->totalSize = pImpl->totalSize - current->second.sizeBytes + it->second;
            current->second.sizeBytes = it->second;
            ++fixed;
        }
    }

    // Полезная нагрузка без метаданных
    for (const auto& file : fileSizes) {
        if (known.count(file.first)) continue;
        try {
            if (pImpl->removeOrphan(file.first)) {
                ++fixed;
            }
        } catch (const InferenceError& e) {
            pImpl->storageFailure("delete", e);
        }
    }

    if (fixed > 0) {
        pImpl->persistIndex();
        pImpl->logger->info("Сверка индекса: исправлено {} расхождений", fixed);
    }
    return fixed;
}

CacheStatistics CacheStore::stats() const {
    CacheStatistics s;
    s.maxSize = pImpl->config.maxSizeBytes;
    for (auto category : allCategories()) {
        s.perCategoryCounts[toString(category)] = 0;
        s.perCategorySize[toString(category)] = 0;
    }

    const auto now = pImpl->clock->now();
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->indexMutex);
        s.totalSize = pImpl->totalSize;
        s.entryCount = pImpl->index.size();
        for (const auto& item : pImpl->index) {
            const auto& meta = item.second;
            const char* name = toString(meta.category);
            ++s.perCategoryCounts[name];
            s.perCategorySize[name] += meta.sizeBytes;
            if (meta.isExpired(now)) {
                ++s.expiredCount;
            }
        }
    }

    s.hits = pImpl->hits;
    s.memoryHits = pImpl->memoryHits;
    s.memoryEntries = pImpl->memory.size();
    s.memoryBytes = pImpl->memory.bytes();
    s.misses = pImpl->misses;
    s.writes = pImpl->writes;
    s.evictions = pImpl->evictions;
    s.corruptions = pImpl->corruptions;
    s.storageErrors = pImpl->storageErrors;
    s.degraded = pImpl->degraded;
    return s;
}

EvictionReport CacheStore::runEviction() {
    std::lock_guard<std::mutex> lock(pImpl->evictionMutex);
    return pImpl->evictor.evict(*this);
}

void CacheStore::waitForBackgroundTasks() {
    pImpl->background->waitForCompletion();
}

bool CacheStore::isDegraded() const {
    return pImpl->degraded;
}

const CacheConfig& CacheStore::config() const {
    return pImpl->config;
}

std::vector<CacheMetadata> CacheStore::metadataSnapshot() const {
    return pImpl->snapshot(nullptr);
}

bool CacheStore::removeEntry(CacheCategory category, const CacheKey& key) {
    const auto composite = std::string(toString(category)) + "_" + key;
    bool removed;
    {
        std::lock_guard<std::mutex> keyLock(pImpl->stripeFor(composite));
        removed = pImpl->eraseLocked(composite, payloadFileName(category, key));
    }
    if (removed) {
        ++pImpl->evictions;
        pImpl->persistIndex();
    }
    return removed;
}

size_t CacheStore::totalSize() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->indexMutex);
    return pImpl->totalSize;
}

size_t CacheStore::maxSize() const {
    return pImpl->config.maxSizeBytes;
}

} // namespace cache
} // namespace core
} // namespace infercache

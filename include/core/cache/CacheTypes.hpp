#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/common/Clock.hpp"

namespace infercache {
namespace core {
namespace cache {

// Ключ кэша: hex SHA-256 от канонического представления запроса
using CacheKey = std::string;

// Категории кэшируемых результатов (закрытое множество)
enum class CacheCategory {
    Identification,
    PhotoRecognition,
    Suggestions,
    Optimization,
    Alternatives,
    PolicyLookup
};

constexpr size_t kCategoryCount = 6;

const char* toString(CacheCategory category);
std::optional<CacheCategory> categoryFromString(const std::string& name);
std::vector<CacheCategory> allCategories();

/**
 * @brief Сериализованное значение с тегом типа
 *
 * Кэш хранит только байты. Преобразование в конкретный тип выполняется
 * явно на стороне вызывающего кода и может завершиться ошибкой.
 */
struct Payload {
    std::string typeTag;
    std::vector<uint8_t> bytes;

    static Payload fromString(const std::string& typeTag, const std::string& text);
    static Payload fromJson(const std::string& typeTag, const nlohmann::json& value);

    std::string asString() const;
    // Бросает nlohmann::json::parse_error, если байты не являются JSON
    nlohmann::json asJson() const;

    size_t size() const { return bytes.size(); }

    bool operator==(const Payload& other) const {
        return typeTag == other.typeTag && bytes == other.bytes;
    }
    bool operator!=(const Payload& other) const { return !(*this == other); }
};

// Запись кэша
struct CacheEntry {
    Payload payload;
    common::Clock::TimePoint createdAt;
    common::Clock::TimePoint expiresAt;   // createdAt <= expiresAt
    CacheCategory category;

    bool isExpired(common::Clock::TimePoint now) const { return now >= expiresAt; }
};

// Метаданные записи: единственный источник для агрегатной статистики
struct CacheMetadata {
    CacheKey key;
    size_t sizeBytes = 0;
    common::Clock::TimePoint createdAt;
    common::Clock::TimePoint expiresAt;
    CacheCategory category = CacheCategory::Identification;

    bool isExpired(common::Clock::TimePoint now) const { return now >= expiresAt; }

    // Составной ключ индекса и имя файла полезной нагрузки
    std::string compositeKey() const;
    std::string fileName() const;

    nlohmann::json toJson() const;
    // Бросает nlohmann::json::exception или std::invalid_argument при неполной
    // записи, неизвестной категории или expires_at < created_at
    static CacheMetadata fromJson(const nlohmann::json& j);
};

// Имя файла полезной нагрузки для категории и ключа
std::string payloadFileName(CacheCategory category, const CacheKey& key);

} // namespace cache
} // namespace core
} // namespace infercache

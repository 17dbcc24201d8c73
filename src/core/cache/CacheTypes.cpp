#include "core/cache/CacheTypes.hpp"
#include <stdexcept>

namespace infercache {
namespace core {
namespace cache {

const char* toString(CacheCategory category) {
    switch (category) {
        case CacheCategory::Identification:   return "identification";
        case CacheCategory::PhotoRecognition: return "photo-recognition";
        case CacheCategory::Suggestions:      return "suggestions";
        case CacheCategory::Optimization:     return "optimization";
        case CacheCategory::Alternatives:     return "alternatives";
        case CacheCategory::PolicyLookup:     return "policy-lookup";
    }
    return "identification";
}

std::optional<CacheCategory> categoryFromString(const std::string& name) {
    for (auto category : allCategories()) {
        if (name == toString(category)) {
            return category;
        }
    }
    return std::nullopt;
}

std::vector<CacheCategory> allCategories() {
    return {
        CacheCategory::Identification,
        CacheCategory::PhotoRecognition,
        CacheCategory::Suggestions,
        CacheCategory::Optimization,
        CacheCategory::Alternatives,
        CacheCategory::PolicyLookup
    };
}

Payload Payload::fromString(const std::string& typeTag, const std::string& text) {
    return Payload{typeTag, std::vector<uint8_t>(text.begin(), text.end())};
}

Payload Payload::fromJson(const std::string& typeTag, const nlohmann::json& value) {
    return fromString(typeTag, value.dump());
}

std::string Payload::asString() const {
    return std::string(bytes.begin(), bytes.end());
}

nlohmann::json Payload::asJson() const {
    return nlohmann::json::parse(bytes.begin(), bytes.end());
}

std::string payloadFileName(CacheCategory category, const CacheKey& key) {
    return std::string(toString(category)) + "_" + key + ".bin";
}

std::string CacheMetadata::compositeKey() const {
    return std::string(toString(category)) + "_" + key;
}

std::string CacheMetadata::fileName() const {
    return payloadFileName(category, key);
}

nlohmann::json CacheMetadata::toJson() const {
    return {
        {"key", key},
        {"size", sizeBytes},
        {"created_at", common::toEpochMillis(createdAt)},
        {"expires_at", common::toEpochMillis(expiresAt)},
        {"category", toString(category)}
    };
}

CacheMetadata CacheMetadata::fromJson(const nlohmann::json& j) {
    CacheMetadata meta;
    meta.key = j.at("key").get<std::string>();
    meta.sizeBytes = j.at("size").get<size_t>();
    meta.createdAt = common::fromEpochMillis(j.at("created_at").get<int64_t>());
    meta.expiresAt = common::fromEpochMillis(j.at("expires_at").get<int64_t>());
    if (meta.expiresAt < meta.createdAt) {
        throw std::invalid_argument("срок жизни записи " + meta.key + " истекает раньше её создания");
    }
    auto category = categoryFromString(j.at("category").get<std::string>());
    if (!category) {
        throw std::invalid_argument("неизвестная категория: " + j.at("category").get<std::string>());
    }
    meta.category = *category;
    return meta;
}

} // namespace cache
} // namespace core
} // namespace infercache

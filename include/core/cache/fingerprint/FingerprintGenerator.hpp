#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/CacheTypes.hpp"

namespace infercache {
namespace core {
namespace cache {

/**
 * @brief Детерминированный ключ кэша для запроса
 *
 * Параметры канонизируются (ключи объектов упорядочены по имени на всех
 * уровнях вложенности), после чего от строки `operation + '\n' + params`
 * берётся SHA-256. Результат: 64 hex-символа независимо от размера входа.
 */
class FingerprintGenerator {
public:
    static CacheKey fingerprint(const std::string& operation, const nlohmann::json& params);

    // Каноническое представление (используется для хэширования)
    static std::string canonicalize(const std::string& operation, const nlohmann::json& params);

    // SHA-256 произвольных байтов в hex
    static std::string sha256Hex(const std::string& data);
};

} // namespace cache
} // namespace core
} // namespace infercache

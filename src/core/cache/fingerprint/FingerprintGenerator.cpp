#include "core/cache/fingerprint/FingerprintGenerator.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace infercache {
namespace core {
namespace cache {

CacheKey FingerprintGenerator::fingerprint(const std::string& operation, const nlohmann::json& params) {
    return sha256Hex(canonicalize(operation, params));
}

std::string FingerprintGenerator::canonicalize(const std::string& operation, const nlohmann::json& params) {
    // nlohmann::json хранит объекты в std::map: dump() выводит ключи отсортированными
    const nlohmann::json& normalized = params.is_null() ? nlohmann::json::object() : params;
    return operation + "\n" + normalized.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

std::string FingerprintGenerator::sha256Hex(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(SHA-256) завершился ошибкой");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace cache
} // namespace core
} // namespace infercache

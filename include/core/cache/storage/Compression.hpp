#pragma once

#include <cstdint>
#include <vector>

namespace infercache {
namespace core {
namespace cache {
namespace storage {

// Верхняя граница размера распакованных данных (защита от повреждённого заголовка)
constexpr uint64_t kMaxDecompressedSize = 256ull * 1024 * 1024;

/**
 * @brief Сжатие буфера на месте (zlib)
 * @details Формат: 8 байт исходной длины (little-endian) + поток deflate
 * @return false при ошибке zlib; буфер в этом случае не изменяется
 */
bool compressData(std::vector<uint8_t>& data, int level);

/**
 * @brief Распаковка буфера, полученного compressData
 * @return false для усечённых или повреждённых данных
 */
bool decompressData(std::vector<uint8_t>& data);

} // namespace storage
} // namespace cache
} // namespace core
} // namespace infercache

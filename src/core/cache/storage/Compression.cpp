#include "core/cache/storage/Compression.hpp"
#include <zlib.h>

namespace infercache {
namespace core {
namespace cache {
namespace storage {

namespace {

constexpr size_t kHeaderSize = 8;

void writeLength(std::vector<uint8_t>& out, uint64_t length) {
    for (size_t i = 0; i < kHeaderSize; ++i) {
        out[i] = static_cast<uint8_t>((length >> (8 * i)) & 0xFF);
    }
}

uint64_t readLength(const std::vector<uint8_t>& in) {
    uint64_t length = 0;
    for (size_t i = 0; i < kHeaderSize; ++i) {
        length |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return length;
}

} // namespace

bool compressData(std::vector<uint8_t>& data, int level) {
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(kHeaderSize + bound);
    writeLength(out, data.size());

    int rc = compress2(out.data() + kHeaderSize, &bound,
                       data.data(), static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        return false;
    }
    out.resize(kHeaderSize + bound);
    data.swap(out);
    return true;
}

bool decompressData(std::vector<uint8_t>& data) {
    if (data.size() < kHeaderSize) {
        return false;
    }
    uint64_t length = readLength(data);
    if (length > kMaxDecompressedSize) {
        return false;
    }

    std::vector<uint8_t> out(static_cast<size_t>(length));
    uLongf outLength = static_cast<uLongf>(length);
    // Для пустого буфера zlib требует ненулевой указатель
    uint8_t dummy = 0;
    int rc = uncompress(length ? out.data() : &dummy, &outLength,
                        data.data() + kHeaderSize, static_cast<uLong>(data.size() - kHeaderSize));
    if (rc != Z_OK || outLength != length) {
        return false;
    }
    data.swap(out);
    return true;
}

} // namespace storage
} // namespace cache
} // namespace core
} // namespace infercache

#include "diyanet/compression.h"
#include "diyanet/errors.h"
#include "diyanet/logger.h"
#include <miniz.h>
#include <limits>

namespace diyanet {

namespace {
constexpr size_t SIZE_PREFIX_LEN = 4;
// deflate cannot expand input by more than this factor
constexpr uint64_t MAX_INFLATE_RATIO = 1032;
}

std::vector<uint8_t> compress_data(const std::string& data, int level) {
    auto& logger = Logger::instance();

    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        throw CacheError("Cache contents too large to store");
    }

    // Ensure compression level is within valid range
    if (level < 0) level = 0;
    if (level > 10) level = 10;

    // Estimate the maximum compressed size (worst case)
    mz_ulong max_compressed_size = mz_compressBound(static_cast<mz_ulong>(data.size()));
    std::vector<uint8_t> frame(SIZE_PREFIX_LEN + max_compressed_size);

    const uint32_t size = static_cast<uint32_t>(data.size());
    frame[0] = static_cast<uint8_t>(size & 0xFF);
    frame[1] = static_cast<uint8_t>((size >> 8) & 0xFF);
    frame[2] = static_cast<uint8_t>((size >> 16) & 0xFF);
    frame[3] = static_cast<uint8_t>((size >> 24) & 0xFF);

    mz_ulong compressed_size = max_compressed_size;
    int status = mz_compress2(
        frame.data() + SIZE_PREFIX_LEN,
        &compressed_size,
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<mz_ulong>(data.size()),
        level
    );

    if (status != MZ_OK) {
        logger.errorf("Compression failed with status %d", status);
        throw CacheError("Compression failed");
    }

    frame.resize(SIZE_PREFIX_LEN + compressed_size);
    logger.debugf("Compressed %zu bytes to %zu bytes", data.size(), static_cast<size_t>(compressed_size));
    return frame;
}

std::string decompress_data(const std::vector<uint8_t>& frame) {
    auto& logger = Logger::instance();

    if (frame.size() < SIZE_PREFIX_LEN) {
        throw CacheError("Compressed frame too small");
    }
    const uint32_t size = frame[0] | (frame[1] << 8) | (frame[2] << 16) |
                          (static_cast<uint32_t>(frame[3]) << 24);
    if (size == 0) {
        return {};
    }
    if (size > (frame.size() - SIZE_PREFIX_LEN) * MAX_INFLATE_RATIO) {
        throw CacheError("Compressed frame declares an impossible size");
    }

    std::string data(size, '\0');
    mz_ulong actual_size = size;
    int status = mz_uncompress(
        reinterpret_cast<unsigned char*>(&data[0]),
        &actual_size,
        frame.data() + SIZE_PREFIX_LEN,
        static_cast<mz_ulong>(frame.size() - SIZE_PREFIX_LEN)
    );

    if (status != MZ_OK || actual_size != size) {
        logger.errorf("Decompression failed with status %d", status);
        throw CacheError("Decompression failed");
    }

    logger.debugf("Decompressed %zu bytes to %zu bytes", frame.size(), static_cast<size_t>(actual_size));
    return data;
}

} // namespace diyanet

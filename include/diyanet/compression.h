#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace diyanet {

// zlib stream prefixed with the uncompressed size as a little-endian u32.
std::vector<uint8_t> compress_data(const std::string& data, int level = 6);

// Inverse of compress_data. Throws CacheError on a truncated or corrupt frame.
std::string decompress_data(const std::vector<uint8_t>& frame);

} // namespace diyanet

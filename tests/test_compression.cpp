#include <gtest/gtest.h>
#include <string>
#include "diyanet/compression.h"
#include "diyanet/errors.h"

using namespace diyanet;

TEST(CompressionTest, RestoresOriginalText) {
    std::string text;
    for (int i = 0; i < 200; ++i) {
        text += "<div class=\"tpt-time\">05:12</div>\n";
    }
    std::vector<uint8_t> frame = compress_data(text);
    EXPECT_LT(frame.size(), text.size());
    EXPECT_EQ(decompress_data(frame), text);
}

TEST(CompressionTest, RejectsTruncatedFrame) {
    std::vector<uint8_t> frame = compress_data(std::string(1000, 'x'));
    frame.resize(frame.size() / 2);
    EXPECT_THROW(decompress_data(frame), CacheError);
    EXPECT_THROW(decompress_data({1, 2}), CacheError);
}

TEST(CompressionTest, RejectsGarbage) {
    std::vector<uint8_t> garbage = {10, 0, 0, 0, 'n', 'o', 't', ' ', 'z', 'l', 'i', 'b'};
    EXPECT_THROW(decompress_data(garbage), CacheError);
}

TEST(CompressionTest, RejectsImpossibleSizePrefix) {
    std::vector<uint8_t> frame = {0xFF, 0xFF, 0xFF, 0x7F, 0x78, 0x9C, 0x03, 0x00};
    EXPECT_THROW(decompress_data(frame), CacheError);
}

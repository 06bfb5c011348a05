#include <gtest/gtest.h>

#include "image_codec.hpp"
#include "test_helpers.hpp"

#include <cstring>

TEST(EncodePngTest, WritesPngSignatureAndPreservesPixels) {
    PixelBuffer buf;
    buf.resize(3, 2, OPAQUE_WHITE);
    buf.at(0, 0) = pack_rgba(255, 0, 0);
    buf.at(2, 1) = pack_rgba(0, 0, 255);

    std::vector<uint8_t> png;
    ASSERT_TRUE(encode_png(buf, png).empty());

    static const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(std::memcmp(png.data(), signature, 8), 0);

    PixelBuffer decoded;
    ASSERT_TRUE(decode_image(png, decoded).empty());
    EXPECT_EQ(decoded.width, 3);
    EXPECT_EQ(decoded.height, 2);
    EXPECT_EQ(decoded.pixels, buf.pixels);
}

TEST(EncodePngTest, EmptyBufferIsAnError) {
    std::vector<uint8_t> png{1, 2, 3};
    EXPECT_FALSE(encode_png(PixelBuffer{}, png).empty());
    EXPECT_TRUE(png.empty());
}

TEST(EncodePngTest, InconsistentBufferIsAnError) {
    PixelBuffer buf;
    buf.resize(4, 4);
    buf.pixels.pop_back();

    std::vector<uint8_t> png;
    EXPECT_FALSE(encode_png(buf, png).empty());
    EXPECT_TRUE(png.empty());
}

TEST(DecodeImageTest, RejectsGarbage) {
    PixelBuffer out;
    EXPECT_FALSE(decode_image({}, out).empty());
    EXPECT_FALSE(decode_image({'G', 'I', 'F', '8', '9', 'a', 0, 0}, out).empty());
}

TEST(DecodeImageTest, RejectsTruncatedStream) {
    PixelBuffer buf;
    buf.resize(32, 32, pack_rgba(1, 2, 3));
    std::vector<uint8_t> png;
    ASSERT_TRUE(encode_png(buf, png).empty());

    png.resize(png.size() / 2);
    PixelBuffer out;
    EXPECT_FALSE(decode_image(png, out).empty());
}

TEST(DecodeImageTest, ReadsNonPngFormats) {
    PixelBuffer out;
    ASSERT_TRUE(decode_image(bmp_of(5, 3, pack_rgba(200, 100, 50)), out).empty());
    EXPECT_EQ(out.width, 5);
    EXPECT_EQ(out.height, 3);
    const auto colors = distinct_colors(out);
    ASSERT_EQ(colors.size(), 1u);
    EXPECT_EQ(*colors.begin(), pack_rgba(200, 100, 50));
}

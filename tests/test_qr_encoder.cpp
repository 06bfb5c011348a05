#include <gtest/gtest.h>

#include "image_codec.hpp"
#include "qr_encoder.hpp"
#include "render_service.hpp"
#include "test_helpers.hpp"

#include <string>

TEST(QrencodeEncoderTest, ProducesRequestedSize) {
    QrencodeEncoder enc;
    MonoBitmap bm;
    ASSERT_TRUE(enc.encode("https://example.com", 256, bm).empty());
    EXPECT_EQ(bm.width, 256);
    EXPECT_EQ(bm.height, 256);
}

TEST(QrencodeEncoderTest, QuietZoneIsLightAndFinderIsDark) {
    QrencodeEncoder enc;
    MonoBitmap bm;
    ASSERT_TRUE(enc.encode("https://example.com", 290, bm).empty());

    // Corners are quiet zone.
    EXPECT_FALSE(bm.is_dark(0, 0));
    EXPECT_FALSE(bm.is_dark(289, 0));
    EXPECT_FALSE(bm.is_dark(0, 289));
    EXPECT_FALSE(bm.is_dark(289, 289));

    // Top-left finder pattern: its outer ring starts right after the quiet
    // zone. Scan the diagonal for the first dark pixel.
    int first_dark = -1;
    for (int i = 0; i < 145; ++i) {
        if (bm.is_dark(i, i)) { first_dark = i; break; }
    }
    ASSERT_GT(first_dark, 0);
    EXPECT_TRUE(bm.is_dark(first_dark + 1, first_dark));
}

TEST(QrencodeEncoderTest, RejectsEmptyAndOversizedContent) {
    QrencodeEncoder enc;
    MonoBitmap bm;
    EXPECT_FALSE(enc.encode("", 256, bm).empty());
    EXPECT_FALSE(enc.encode(std::string(8000, 'x'), 256, bm).empty());
}

TEST(QrencodeEncoderTest, EndToEndRenderIsBlackOnWhite) {
    ServiceConfig    cfg;
    FingerprintCache cache(cfg.cache);
    QrencodeEncoder  enc;
    RenderService    service(cfg, cache, enc, nullptr);

    RenderRequest req;
    req.content = "https://example.com";
    req.size    = 256;
    const RenderResult r = service.render(req);
    ASSERT_EQ(r.status, RenderStatus::Ok) << r.error;

    PixelBuffer img;
    ASSERT_TRUE(decode_image(*r.png, img).empty());
    EXPECT_EQ(img.width, 256);
    EXPECT_EQ(img.height, 256);
    const auto colors = distinct_colors(img);
    EXPECT_EQ(colors, (std::set<uint32_t>{OPAQUE_BLACK, OPAQUE_WHITE}));
}

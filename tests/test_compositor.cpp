#include <gtest/gtest.h>

#include "compositor.hpp"
#include "test_helpers.hpp"

namespace {

const uint32_t MODULE_RED = pack_rgba(200, 0, 0);

PixelBuffer solid(int w, int h, uint32_t color)
{
    PixelBuffer b;
    b.resize(w, h, color);
    return b;
}

bool inside(int x, int y, int x0, int y0, int x1, int y1)
{
    return x >= x0 && x < x1 && y >= y0 && y < y1;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// blend_over
// ─────────────────────────────────────────────────────────────────────────────

TEST(BlendOverTest, OpaqueSourceReplaces) {
    EXPECT_EQ(blend_over(OPAQUE_WHITE, pack_rgba(1, 2, 3, 255)), pack_rgba(1, 2, 3, 255));
}

TEST(BlendOverTest, HalfAlphaOnWhite) {
    EXPECT_EQ(blend_over(OPAQUE_WHITE, pack_rgba(0, 0, 0, 128)), pack_rgba(127, 127, 127, 255));
}

TEST(BlendOverTest, RoundsToNearest) {
    // 1/255 of 255 is exactly 1; truncation of a float just below would give 0.
    EXPECT_EQ(red_of(blend_over(OPAQUE_BLACK, pack_rgba(255, 255, 255, 1))), 1);
    // 0.4 * 100 + 0.6 * 0 = 40 ; a = 102/255 = 0.4
    EXPECT_EQ(red_of(blend_over(pack_rgba(0, 0, 0), pack_rgba(100, 0, 0, 102))), 40);
}

TEST(BlendOverTest, ResultIsOpaque) {
    EXPECT_EQ(alpha_of(blend_over(pack_rgba(9, 9, 9, 40), pack_rgba(1, 1, 1, 3))), 255);
}

// ─────────────────────────────────────────────────────────────────────────────
// composite_logo
// ─────────────────────────────────────────────────────────────────────────────

TEST(CompositeLogoTest, BackdropCoversZonePlusMargin) {
    PixelBuffer buf = solid(64, 64, MODULE_RED);
    const SafeZone zone = safe_zone_for(64);                // (24, 24, 16, 16)
    const PixelBuffer logo = solid(16, 16, pack_rgba(0, 0, 0, 0));

    composite_logo(buf, zone, logo, 4);

    for (int y = 0; y < 64; ++y) {
        for (int x = 0; x < 64; ++x) {
            const bool in_backdrop = inside(x, y, 20, 20, 44, 44);
            EXPECT_EQ(buf.at(x, y), in_backdrop ? OPAQUE_WHITE : MODULE_RED)
                << "at " << x << "," << y;
        }
    }
}

TEST(CompositeLogoTest, OpaqueLogoFillsZoneExactly) {
    PixelBuffer buf = solid(64, 64, MODULE_RED);
    const SafeZone zone = safe_zone_for(64);
    const uint32_t blue = pack_rgba(0, 0, 255);

    // Smaller than the zone: the compositor scales it up to fit exactly.
    composite_logo(buf, zone, solid(5, 5, blue), 4);

    for (int y = 0; y < 64; ++y) {
        for (int x = 0; x < 64; ++x) {
            if (inside(x, y, 24, 24, 40, 40))
                EXPECT_EQ(buf.at(x, y), blue) << "at " << x << "," << y;
            else if (inside(x, y, 20, 20, 44, 44))
                EXPECT_EQ(buf.at(x, y), OPAQUE_WHITE) << "at " << x << "," << y;
        }
    }
}

TEST(CompositeLogoTest, TranslucentLogoBlendsOverWhiteBackdrop) {
    PixelBuffer buf = solid(32, 32, OPAQUE_BLACK);
    const SafeZone zone = safe_zone_for(32);                // (12, 12, 8, 8)

    composite_logo(buf, zone, solid(8, 8, pack_rgba(0, 0, 0, 128)), 4);

    EXPECT_EQ(buf.at(12, 12), pack_rgba(127, 127, 127, 255));
    EXPECT_EQ(buf.at(19, 19), pack_rgba(127, 127, 127, 255));
    EXPECT_EQ(buf.at(8, 8), OPAQUE_WHITE);
    EXPECT_EQ(buf.at(7, 7), OPAQUE_BLACK);
}

TEST(CompositeLogoTest, SmallBufferStaysInBounds) {
    PixelBuffer buf = solid(16, 16, MODULE_RED);
    const SafeZone zone = safe_zone_for(16);                // (6, 6, 4, 4)

    composite_logo(buf, zone, solid(4, 4, pack_rgba(0, 255, 0)), 4);

    ASSERT_EQ(buf.width, 16);
    ASSERT_EQ(buf.height, 16);
    ASSERT_EQ(buf.pixels.size(), 256u);
    EXPECT_EQ(buf.at(6, 6), pack_rgba(0, 255, 0));
    EXPECT_EQ(buf.at(2, 2), OPAQUE_WHITE);
    EXPECT_EQ(buf.at(1, 1), MODULE_RED);
    EXPECT_EQ(buf.at(15, 15), MODULE_RED);
}

TEST(CompositeLogoTest, OverflowingGeometryIsClipped) {
    PixelBuffer buf = solid(16, 16, MODULE_RED);

    // Zone hangs off the bottom-right corner and the margin exceeds the buffer.
    const SafeZone zone{12, 12, 8, 8};
    composite_logo(buf, zone, solid(8, 8, pack_rgba(0, 0, 255)), 20);

    ASSERT_EQ(buf.pixels.size(), 256u);
    EXPECT_EQ(buf.at(0, 0), OPAQUE_WHITE);
    EXPECT_EQ(buf.at(11, 11), OPAQUE_WHITE);
    EXPECT_EQ(buf.at(12, 12), pack_rgba(0, 0, 255));
    EXPECT_EQ(buf.at(15, 15), pack_rgba(0, 0, 255));
}

TEST(CompositeLogoTest, EmptyLogoOrZoneLeavesBufferUntouched) {
    PixelBuffer buf = solid(16, 16, MODULE_RED);

    composite_logo(buf, safe_zone_for(16), PixelBuffer{}, 4);
    composite_logo(buf, safe_zone_for(3), solid(2, 2, OPAQUE_BLACK), 4);

    EXPECT_EQ(distinct_colors(buf).size(), 1u);
    EXPECT_EQ(buf.at(8, 8), MODULE_RED);
}

#include <gtest/gtest.h>

#include "safe_zone.hpp"

TEST(SafeZoneTest, Size512) {
    const SafeZone z = safe_zone_for(512);
    EXPECT_EQ(z.x, 192);
    EXPECT_EQ(z.y, 192);
    EXPECT_EQ(z.width, 128);
    EXPECT_EQ(z.height, 128);
}

TEST(SafeZoneTest, QuarterSideAndCentered) {
    for (int size : {16, 17, 100, 256, 257, 1000, 4096}) {
        const SafeZone z = safe_zone_for(size);
        EXPECT_EQ(z.width, size / 4) << "size " << size;
        EXPECT_EQ(z.height, z.width);
        EXPECT_EQ(z.x, (size - z.width) / 2);
        EXPECT_EQ(z.y, z.x);
        EXPECT_LE(z.x + z.width, size);
        // Left and right gaps differ by at most one pixel.
        EXPECT_LE((size - z.x - z.width) - z.x, 1);
    }
}

TEST(SafeZoneTest, TinySizesAreEmpty) {
    EXPECT_TRUE(safe_zone_for(0).empty());
    EXPECT_TRUE(safe_zone_for(3).empty());
    EXPECT_TRUE(safe_zone_for(-8).empty());
    EXPECT_FALSE(safe_zone_for(4).empty());
}

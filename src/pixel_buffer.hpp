#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Pixel buffer: RGBA, little-endian packed as 0xAABBGGRR
struct PixelBuffer {
    std::vector<uint32_t> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h, uint32_t fill = 0xFF000000u)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), fill);
    }

    bool in_bounds(int x, int y) const
    {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    uint32_t  at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    uint32_t& at(int x, int y)       { return pixels[static_cast<size_t>(y) * width + x]; }

    bool empty() const { return width <= 0 || height <= 0; }
};

// Monochrome QR raster: one byte per pixel, non-zero = dark module.
struct MonoBitmap {
    std::vector<uint8_t> dark;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        dark.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0);
    }

    bool is_dark(int x, int y) const { return dark[static_cast<size_t>(y) * width + x] != 0; }
};

static constexpr uint32_t OPAQUE_BLACK = 0xFF000000u;
static constexpr uint32_t OPAQUE_WHITE = 0xFFFFFFFFu;

inline uint32_t pack_rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
    return (static_cast<uint32_t>(a) << 24)
         | (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(g) <<  8)
         |  static_cast<uint32_t>(r);
}

inline uint8_t red_of  (uint32_t p) { return static_cast<uint8_t>( p        & 0xFFu); }
inline uint8_t green_of(uint32_t p) { return static_cast<uint8_t>((p >>  8) & 0xFFu); }
inline uint8_t blue_of (uint32_t p) { return static_cast<uint8_t>((p >> 16) & 0xFFu); }
inline uint8_t alpha_of(uint32_t p) { return static_cast<uint8_t>((p >> 24) & 0xFFu); }

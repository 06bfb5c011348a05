#pragma once

#include "pixel_buffer.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct ColorPair {
    uint32_t fg = OPAQUE_BLACK;
    uint32_t bg = OPAQUE_WHITE;
};

// "#RRGGBB" -> opaque packed pixel. Anything else (wrong length, missing '#',
// non-hex digit) yields nullopt.
std::optional<uint32_t> parse_hex_color(const std::string& hex);

// Each slot falls back to its default independently when absent or invalid.
ColorPair resolve_colors(const std::optional<std::string>& fg,
                         const std::optional<std::string>& bg);

// Dark modules -> colors.fg, light modules -> colors.bg.
// buf is resized to the bitmap's dimensions.
void map_colors(const MonoBitmap& bitmap, const ColorPair& colors, PixelBuffer& buf);

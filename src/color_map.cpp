#include "color_map.hpp"

#include <spdlog/spdlog.h>

static int hex_digit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<uint32_t> parse_hex_color(const std::string& hex)
{
    if (hex.size() != 7 || hex[0] != '#')
        return std::nullopt;

    uint8_t channel[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[1 + 2 * i]);
        const int lo = hex_digit(hex[2 + 2 * i]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        channel[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return pack_rgba(channel[0], channel[1], channel[2]);
}

static uint32_t resolve_one(const std::optional<std::string>& value, uint32_t fallback,
                            const char* slot)
{
    if (!value)
        return fallback;
    if (const auto parsed = parse_hex_color(*value))
        return *parsed;
    spdlog::debug("[ColorMapper] Invalid {} color '{}', using default", slot, *value);
    return fallback;
}

ColorPair resolve_colors(const std::optional<std::string>& fg,
                         const std::optional<std::string>& bg)
{
    ColorPair colors;
    colors.fg = resolve_one(fg, OPAQUE_BLACK, "foreground");
    colors.bg = resolve_one(bg, OPAQUE_WHITE, "background");
    return colors;
}

void map_colors(const MonoBitmap& bitmap, const ColorPair& colors, PixelBuffer& buf)
{
    buf.resize(bitmap.width, bitmap.height);

    const size_t n = bitmap.dark.size();
    for (size_t i = 0; i < n; ++i)
        buf.pixels[i] = bitmap.dark[i] ? colors.fg : colors.bg;
}

#include "compositor.hpp"
#include "resample.hpp"

#include <algorithm>
#include <cmath>

static uint8_t blend_channel(uint8_t dst, uint8_t src, float a)
{
    const float v = (1.0f - a) * static_cast<float>(dst) + a * static_cast<float>(src);
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
}

uint32_t blend_over(uint32_t dst, uint32_t src)
{
    const float a = static_cast<float>(alpha_of(src)) / 255.0f;
    return pack_rgba(blend_channel(red_of(dst),   red_of(src),   a),
                     blend_channel(green_of(dst), green_of(src), a),
                     blend_channel(blue_of(dst),  blue_of(src),  a),
                     255);
}

void composite_logo(PixelBuffer& buf, const SafeZone& zone, const PixelBuffer& logo, int margin)
{
    if (buf.empty() || zone.empty() || logo.empty())
        return;
    margin = std::max(margin, 0);

    const PixelBuffer fitted = resize_lanczos3(logo, zone.width, zone.height);

    // --- Backdrop: zone + margin, clipped ---
    const int bx0 = std::max(zone.x - margin, 0);
    const int by0 = std::max(zone.y - margin, 0);
    const int bx1 = std::min(zone.x + zone.width  + margin, buf.width);
    const int by1 = std::min(zone.y + zone.height + margin, buf.height);
    for (int y = by0; y < by1; ++y)
        for (int x = bx0; x < bx1; ++x)
            buf.at(x, y) = OPAQUE_WHITE;

    // --- Logo overlay ---
    for (int ly = 0; ly < fitted.height; ++ly) {
        const int ty = zone.y + ly;
        for (int lx = 0; lx < fitted.width; ++lx) {
            const int tx = zone.x + lx;
            if (!buf.in_bounds(tx, ty)) continue;

            const uint32_t p = fitted.at(lx, ly);
            if (alpha_of(p) == 0) continue;   // backdrop shows through
            buf.at(tx, ty) = blend_over(buf.at(tx, ty), p);
        }
    }
}

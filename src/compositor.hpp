#pragma once

#include "pixel_buffer.hpp"
#include "safe_zone.hpp"

static constexpr int DEFAULT_LOGO_MARGIN = 4;

// Overlay `logo` on the safe zone of `buf`:
//   1. resize the logo to exactly zone.width x zone.height
//   2. paint an opaque white backdrop over the zone grown by `margin`
//   3. alpha-blend every non-transparent logo pixel onto the backdrop
// Geometry is clipped to the buffer; nothing outside it is written.
void composite_logo(PixelBuffer& buf, const SafeZone& zone, const PixelBuffer& logo,
                    int margin = DEFAULT_LOGO_MARGIN);

// out = (1 - a) * dst + a * src per RGB channel, rounded; alpha forced opaque.
uint32_t blend_over(uint32_t dst, uint32_t src);

#pragma once

#include "pixel_buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

static constexpr const char* PNG_CONTENT_TYPE = "image/png";

// Returns empty string on success, or an error message on failure.
// On failure `out` is left empty.
std::string encode_png(const PixelBuffer& buf, std::vector<uint8_t>& out);

// Decodes PNG, JPEG, GIF (first frame), BMP and the other formats stb_image
// reads, to 8-bit RGBA. Returns empty string on success, or an error message
// on failure. On failure `out` is left empty.
std::string decode_image(const std::vector<uint8_t>& bytes, PixelBuffer& out);

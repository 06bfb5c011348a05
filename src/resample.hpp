#pragma once

#include "pixel_buffer.hpp"

// Lanczos-3 resize of an RGBA raster (stb_image_resize2, clamped edges).
// Returns an empty buffer when either target dimension is not positive, the
// source is empty, or the resizer fails.
PixelBuffer resize_lanczos3(const PixelBuffer& src, int new_w, int new_h);

// Largest dimensions with the source aspect ratio that fit inside
// max_w x max_h. Each result dimension is at least 1.
void fit_dimensions(int src_w, int src_h, int max_w, int max_h, int& out_w, int& out_h);

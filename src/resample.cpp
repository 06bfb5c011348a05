#include "resample.hpp"

#include <algorithm>
#include <cmath>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"
#pragma GCC diagnostic ignored "-Wunused-parameter"
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>
#pragma GCC diagnostic pop

static constexpr float LANCZOS_SUPPORT = 3.0f;
static constexpr float PI_F            = 3.14159265358979323846f;

// ---------------------------------------------------------------------------
// Lanczos-3 kernel for stbir. stbir stretches the kernel itself when
// shrinking, so both callbacks ignore the scale.
// ---------------------------------------------------------------------------
static float sinc(float x)
{
    if (x == 0.0f) return 1.0f;
    const float a = x * PI_F;
    return std::sin(a) / a;
}

static float lanczos3_kernel(float x, float /*scale*/, void* /*user_data*/)
{
    x = std::fabs(x);
    if (x >= LANCZOS_SUPPORT) return 0.0f;
    return sinc(x) * sinc(x / LANCZOS_SUPPORT);
}

static float lanczos3_support(float /*scale*/, void* /*user_data*/)
{
    return LANCZOS_SUPPORT;
}

// Pixel layout: 0xAABBGGRR words are [R, G, B, A] bytes in memory, which is
// STBIR_RGBA (straight alpha; stbir weights color by alpha internally).
PixelBuffer resize_lanczos3(const PixelBuffer& src, int new_w, int new_h)
{
    PixelBuffer dst;
    if (src.empty() || new_w <= 0 || new_h <= 0)
        return dst;

    if (new_w == src.width && new_h == src.height)
        return src;

    dst.resize(new_w, new_h, 0);

    STBIR_RESIZE resize;
    stbir_resize_init(&resize,
                      src.pixels.data(), src.width, src.height, src.width * 4,
                      dst.pixels.data(), new_w, new_h, new_w * 4,
                      STBIR_RGBA, STBIR_TYPE_UINT8);
    stbir_set_edgemodes(&resize, STBIR_EDGE_CLAMP, STBIR_EDGE_CLAMP);
    stbir_set_filter_callbacks(&resize,
                               lanczos3_kernel, lanczos3_support,
                               lanczos3_kernel, lanczos3_support);
    if (!stbir_resize_extended(&resize))
        return PixelBuffer{};
    return dst;
}

void fit_dimensions(int src_w, int src_h, int max_w, int max_h, int& out_w, int& out_h)
{
    if (src_w <= 0 || src_h <= 0) {
        out_w = std::max(max_w, 1);
        out_h = std::max(max_h, 1);
        return;
    }
    const double ratio = std::min(static_cast<double>(max_w) / src_w,
                                  static_cast<double>(max_h) / src_h);
    out_w = std::max(static_cast<int>(std::lround(src_w * ratio)), 1);
    out_h = std::max(static_cast<int>(std::lround(src_h * ratio)), 1);
}

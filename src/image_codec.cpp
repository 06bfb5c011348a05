#include "image_codec.hpp"

#include <png.h>
#include <cstring>
#include <limits>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wsign-compare"
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#pragma GCC diagnostic pop

// Decoded logos larger than this are rejected before allocation.
static constexpr unsigned long long MAX_DECODE_PIXELS = 1ull << 26;

// ---------------------------------------------------------------------------
// PNG encode (in memory)
//
// Pixel layout: each uint32_t stores 0xAA BB GG RR.
// On a little-endian machine the bytes in memory are [R, G, B, A], which is
// exactly what PNG_COLOR_TYPE_RGBA expects; no conversion needed.
// ---------------------------------------------------------------------------
static void png_write_to_vector(png_structp png, png_bytep data, png_size_t length)
{
    auto* out = static_cast<std::vector<uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

static void png_flush_noop(png_structp) {}

std::string encode_png(const PixelBuffer& buf, std::vector<uint8_t>& out)
{
    out.clear();
    if (buf.empty())
        return "cannot encode an empty pixel buffer";
    if (buf.pixels.size() != static_cast<size_t>(buf.width) * static_cast<size_t>(buf.height))
        return "pixel buffer dimensions do not match its storage";

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return "png_create_write_struct failed";

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        out.clear();
        return "PNG write error (libpng longjmp)";
    }

    png_set_write_fn(png, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row =
            reinterpret_cast<png_const_bytep>(buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return {};  // success
}

// ---------------------------------------------------------------------------
// Image decode (in memory, stb_image: PNG, JPEG, GIF, BMP, TGA, PSD, PNM, HDR)
// ---------------------------------------------------------------------------
std::string decode_image(const std::vector<uint8_t>& bytes, PixelBuffer& out)
{
    out = PixelBuffer{};
    if (bytes.empty())
        return "empty image payload";
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
        return "image payload too large";

    const int len = static_cast<int>(bytes.size());
    int w = 0, h = 0, channels = 0;
    if (!stbi_info_from_memory(bytes.data(), len, &w, &h, &channels))
        return std::string("image decode failed: ") + stbi_failure_reason();

    const unsigned long long n = static_cast<unsigned long long>(w) * static_cast<unsigned long long>(h);
    if (w <= 0 || h <= 0 || n > MAX_DECODE_PIXELS)
        return "image dimensions out of range";

    stbi_uc* pixels = stbi_load_from_memory(bytes.data(), len, &w, &h, &channels, 4);
    if (!pixels)
        return std::string("image decode failed: ") + stbi_failure_reason();

    // Four bytes per pixel in R, G, B, A order: the in-memory layout of 0xAABBGGRR.
    out.resize(w, h, 0);
    std::memcpy(out.pixels.data(), pixels, static_cast<size_t>(n) * 4);
    stbi_image_free(pixels);
    return {};  // success
}

#pragma once

#include "pixel_buffer.hpp"

#include <string>

// Turns text into a size x size monochrome QR raster.
// Returns empty string on success, or an error message on failure.
class IQrEncoder {
public:
    virtual ~IQrEncoder() = default;
    virtual std::string encode(const std::string& text, int size, MonoBitmap& out) = 0;
};

#ifdef HAVE_QRENCODE
// libqrencode backend: byte mode, medium error correction, 4-module quiet
// zone, modules sampled nearest-neighbour onto the pixel grid.
class QrencodeEncoder : public IQrEncoder {
public:
    static constexpr int QUIET_ZONE = 4;

    std::string encode(const std::string& text, int size, MonoBitmap& out) override;
};
#endif

// True when compiled with libqrencode support.
inline bool qrencode_available()
{
#ifdef HAVE_QRENCODE
    return true;
#else
    return false;
#endif
}

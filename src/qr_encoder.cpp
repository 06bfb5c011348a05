#include "qr_encoder.hpp"

#ifdef HAVE_QRENCODE
#include <qrencode.h>

#include <cerrno>
#include <cstring>

std::string QrencodeEncoder::encode(const std::string& text, int size, MonoBitmap& out)
{
    if (text.empty()) return "QR content is empty";
    if (size <= 0)    return "QR size must be positive";

    QRcode* code = QRcode_encodeString(text.c_str(), 0, QR_ECLEVEL_M, QR_MODE_8, 1);
    if (!code) {
        if (errno == ERANGE)
            return "content too long for a QR symbol";
        return std::string("QRcode_encodeString failed: ") + std::strerror(errno);
    }

    const int modules = code->width;
    const int total   = modules + 2 * QUIET_ZONE;

    out.resize(size, size);
    for (int py = 0; py < size; ++py) {
        const int my = static_cast<int>(static_cast<long long>(py) * total / size) - QUIET_ZONE;
        if (my < 0 || my >= modules) continue;
        const unsigned char* row = code->data + static_cast<size_t>(my) * modules;
        uint8_t* dst = out.dark.data() + static_cast<size_t>(py) * size;
        for (int px = 0; px < size; ++px) {
            const int mx = static_cast<int>(static_cast<long long>(px) * total / size) - QUIET_ZONE;
            if (mx < 0 || mx >= modules) continue;
            dst[px] = (row[mx] & 1) ? 1 : 0;
        }
    }

    QRcode_free(code);
    return {};  // success
}
#endif  // HAVE_QRENCODE

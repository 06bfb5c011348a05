#pragma once

#include "pixel_buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Fetches a remote logo and scales it to fit a quarter of the QR side.
// Returns empty string on success, or an error message on failure.
// A failure only means "no logo"; callers carry on with the plain QR.
class ILogoFetcher {
public:
    virtual ~ILogoFetcher() = default;
    virtual std::string fetch(const std::string& url, int qr_size, PixelBuffer& out) = 0;
};

// Decode `bytes` and resize (Lanczos-3, aspect preserved) to fit inside
// qr_size/4 x qr_size/4.
std::string prepare_logo(const std::vector<uint8_t>& bytes, int qr_size, PixelBuffer& out);

// libcurl backend. One attempt, no retries; redirects are followed.
class CurlLogoFetcher : public ILogoFetcher {
public:
    // timeout_s = 0 leaves libcurl's defaults in place.
    explicit CurlLogoFetcher(long timeout_s = 0, size_t max_bytes = 16u << 20);

    std::string fetch(const std::string& url, int qr_size, PixelBuffer& out) override;

    // GET `url` into `body`; non-2xx responses are errors.
    std::string fetch_bytes(const std::string& url, std::vector<uint8_t>& body);

private:
    long   timeout_s;
    size_t max_bytes;
};

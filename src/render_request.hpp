#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

static constexpr int DEFAULT_QR_SIZE = 512;

struct RenderRequest {
    std::string                content;
    int                        size = DEFAULT_QR_SIZE;
    std::optional<std::string> fg_color;
    std::optional<std::string> bg_color;
    std::optional<std::string> logo_url;
};

// Cache key for a request. Built from content, size and both colors;
// logo_url does not take part, so requests that differ only in their logo
// share a cache entry.
struct Fingerprint {
    std::string key;

    bool operator==(const Fingerprint& other) const { return key == other.key; }
    bool operator!=(const Fingerprint& other) const { return key != other.key; }
};

struct FingerprintHash {
    size_t operator()(const Fingerprint& fp) const noexcept
    {
        return std::hash<std::string>{}(fp.key);
    }
};

Fingerprint make_fingerprint(const RenderRequest& req);

// Returns empty string when the request may be composed.
std::string validate_request(const RenderRequest& req, int max_size);

// Parses "content=...&size=...&fg_color=...&bg_color=...&logo_url=...".
// Values are percent-decoded ('+' is a space); unknown keys are ignored.
// `out.size` starts at `default_size` when the query carries no size.
// Returns empty string on success, or an error message on failure.
std::string parse_query(const std::string& query, RenderRequest& out,
                        int default_size = DEFAULT_QR_SIZE);

std::string url_decode(const std::string& s);

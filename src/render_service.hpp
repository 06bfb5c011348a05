#pragma once

#include "fingerprint_cache.hpp"
#include "logo_fetcher.hpp"
#include "pixel_buffer.hpp"
#include "qr_encoder.hpp"
#include "render_request.hpp"
#include "service_config.hpp"

#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

enum class RenderStatus {
    Ok,
    InvalidRequest,   // rejected before composition
    InternalError,    // QR or PNG encoding failed, no output exists
};

const char* status_name(RenderStatus s);

struct RenderResult {
    RenderStatus           status = RenderStatus::Ok;
    FingerprintCache::Bytes png;        // set when status == Ok
    std::string            error;
    bool                   cache_hit  = false;
    bool                   logo_drawn = false;
};

// Cache lookup -> compose -> encode -> cache insert.
//
// The cache is shared by every request and outlives the service; encoder and
// fetcher must be safe to call from several threads at once. A null fetcher
// renders every request without a logo.
class RenderService {
public:
    RenderService(const ServiceConfig& cfg, FingerprintCache& cache,
                  IQrEncoder& encoder, ILogoFetcher* fetcher);

    RenderResult render(const RenderRequest& req);

    // Compose the pixels for `req` without touching the cache.
    std::string compose(const RenderRequest& req, PixelBuffer& buf, bool& logo_drawn);

private:
    RenderResult render_miss(const RenderRequest& req);

    ServiceConfig    cfg;
    FingerprintCache& cache;
    IQrEncoder&      encoder;
    ILogoFetcher*    fetcher;

    std::mutex inflight_mtx;
    std::unordered_map<Fingerprint, std::shared_future<RenderResult>, FingerprintHash> inflight;
};

#include "render_service.hpp"
#include "color_map.hpp"
#include "compositor.hpp"
#include "image_codec.hpp"
#include "safe_zone.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

const char* status_name(RenderStatus s)
{
    switch (s) {
        case RenderStatus::Ok:             return "ok";
        case RenderStatus::InvalidRequest: return "invalid request";
        case RenderStatus::InternalError:  return "internal error";
    }
    return "unknown";
}

RenderService::RenderService(const ServiceConfig& cfg, FingerprintCache& cache,
                             IQrEncoder& encoder, ILogoFetcher* fetcher)
    : cfg(cfg), cache(cache), encoder(encoder), fetcher(fetcher)
{
}

// -----------------------------------------------------------------------
// Pixel composition: QR bitmap -> colors -> optional logo
// -----------------------------------------------------------------------
std::string RenderService::compose(const RenderRequest& req, PixelBuffer& buf, bool& logo_drawn)
{
    logo_drawn = false;

    MonoBitmap bitmap;
    const std::string err = encoder.encode(req.content, req.size, bitmap);
    if (!err.empty())
        return "QR encoding failed: " + err;
    if (bitmap.width != req.size || bitmap.height != req.size)
        return "QR encoder produced " + std::to_string(bitmap.width) + "x"
             + std::to_string(bitmap.height) + ", expected "
             + std::to_string(req.size) + "x" + std::to_string(req.size);

    map_colors(bitmap, resolve_colors(req.fg_color, req.bg_color), buf);

    if (!req.logo_url || !fetcher)
        return {};

    const SafeZone zone = safe_zone_for(req.size);
    if (zone.empty()) {
        spdlog::warn("[RenderService] Size {} leaves no room for a logo", req.size);
        return {};
    }

    PixelBuffer logo;
    const std::string logo_err = fetcher->fetch(*req.logo_url, req.size, logo);
    if (!logo_err.empty()) {
        spdlog::warn("[RenderService] Logo omitted ({}): {}", *req.logo_url, logo_err);
        return {};
    }

    composite_logo(buf, zone, logo, cfg.logo_margin);
    logo_drawn = true;
    return {};
}

RenderResult RenderService::render_miss(const RenderRequest& req)
{
    RenderResult result;

    PixelBuffer buf;
    std::string err = compose(req, buf, result.logo_drawn);
    if (err.empty()) {
        std::vector<uint8_t> png;
        err = encode_png(buf, png);
        if (err.empty()) {
            result.png = std::make_shared<const std::vector<uint8_t>>(std::move(png));
            cache.insert(make_fingerprint(req), result.png);
            spdlog::debug("[RenderService] Rendered {}x{} ({} bytes)",
                          req.size, req.size, result.png->size());
            return result;
        }
    }

    spdlog::error("[RenderService] Render failed: {}", err);
    result.status = RenderStatus::InternalError;
    result.error  = std::move(err);
    return result;
}

// -----------------------------------------------------------------------
// Entry point
// -----------------------------------------------------------------------
RenderResult RenderService::render(const RenderRequest& req)
{
    const std::string invalid = validate_request(req, cfg.max_size);
    if (!invalid.empty()) {
        spdlog::warn("[RenderService] Rejected request: {}", invalid);
        RenderResult r;
        r.status = RenderStatus::InvalidRequest;
        r.error  = invalid;
        return r;
    }

    const Fingerprint fp = make_fingerprint(req);
    if (auto hit = cache.lookup(fp)) {
        spdlog::debug("[RenderService] Cache hit ({} bytes)", hit->size());
        RenderResult r;
        r.png       = std::move(hit);
        r.cache_hit = true;
        return r;
    }
    spdlog::debug("[RenderService] Cache miss");

    if (!cfg.coalesce_misses)
        return render_miss(req);

    // Single-flight: the first miss renders, later identical misses wait on it.
    std::promise<RenderResult> promise;
    {
        std::unique_lock<std::mutex> lock(inflight_mtx);
        auto it = inflight.find(fp);
        if (it != inflight.end()) {
            std::shared_future<RenderResult> pending = it->second;
            lock.unlock();
            spdlog::debug("[RenderService] Joining in-flight render");
            return pending.get();
        }
        inflight.emplace(fp, promise.get_future().share());
    }

    RenderResult result;
    try {
        result = render_miss(req);
    } catch (const std::exception& e) {
        spdlog::error("[RenderService] Render threw: {}", e.what());
        result        = RenderResult{};
        result.status = RenderStatus::InternalError;
        result.error  = e.what();
    } catch (...) {
        // Waiters get the same exception; the entry must not outlive it.
        promise.set_exception(std::current_exception());
        std::lock_guard<std::mutex> lock(inflight_mtx);
        inflight.erase(fp);
        throw;
    }
    promise.set_value(result);

    std::lock_guard<std::mutex> lock(inflight_mtx);
    inflight.erase(fp);
    return result;
}

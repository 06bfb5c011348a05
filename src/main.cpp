#include "batch_runner.hpp"
#include "fingerprint_cache.hpp"
#include "image_codec.hpp"
#include "logo_fetcher.hpp"
#include "qr_encoder.hpp"
#include "render_request.hpp"
#include "render_service.hpp"
#include "service_config.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <string>
#include <vector>

// Log to stderr: stdout may carry the PNG.
static void init_logging(const ServiceConfig& cfg)
{
    spdlog::set_default_logger(spdlog::stderr_color_mt("qrforge"));
    spdlog::set_level(spdlog::level::info);
    spdlog::cfg::load_env_levels();
    if (!cfg.log_level.empty())
        spdlog::set_level(spdlog::level::from_str(cfg.log_level));
}

static int render_single(RenderService& service, const ServiceConfig& cfg,
                         const std::string& query)
{
    RenderRequest req;
    const std::string err = parse_query(query, req, cfg.default_size);
    if (!err.empty()) {
        spdlog::error("Bad query: {}", err);
        return 1;
    }

    const RenderResult result = service.render(req);
    if (result.status != RenderStatus::Ok) {
        spdlog::error("Render failed ({}): {}", status_name(result.status), result.error);
        return 1;
    }

    const std::string werr = write_bytes(cfg.out_path, *result.png);
    if (!werr.empty()) {
        spdlog::error("{}", werr);
        return 1;
    }
    spdlog::info("Wrote {} bytes of {} ({}x{}{})", result.png->size(), PNG_CONTENT_TYPE,
                 req.size, req.size, result.logo_drawn ? ", with logo" : "");
    return 0;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    ServiceConfig            cfg;
    std::vector<std::string> positional;
    const std::string err = parse_args(argc, argv, cfg, positional);
    if (!err.empty()) {
        fprintf(stderr, "qrforge: %s\n\n%s", err.c_str(), usage_text());
        return 1;
    }
    if (cfg.show_help) {
        fputs(usage_text(), stdout);
        return 0;
    }
    if (cfg.batch_file.empty() && positional.size() != 1) {
        fputs(usage_text(), stderr);
        return 1;
    }

    init_logging(cfg);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::error("curl_global_init failed");
        return 1;
    }

    // One cache for the whole process, shared by every request.
    FingerprintCache cache(cfg.cache);
    QrencodeEncoder  encoder;
    CurlLogoFetcher  fetcher(cfg.fetch_timeout_s);
    RenderService    service(cfg, cache, encoder, &fetcher);

    const int rc = cfg.batch_file.empty()
        ? render_single(service, cfg, positional.front())
        : run_batch(service, cfg);

    curl_global_cleanup();
    return rc;
}

#pragma once

#include "fingerprint_cache.hpp"
#include "render_request.hpp"

#include <string>
#include <vector>

struct ServiceConfig {
    int         default_size     = DEFAULT_QR_SIZE;
    int         max_size         = 4096;   // 0 = unlimited
    int         logo_margin      = 4;      // white border around the logo, pixels
    long        fetch_timeout_s  = 0;      // 0 = libcurl default
    int         threads          = 0;      // batch workers, 0 = hardware concurrency
    bool        coalesce_misses  = true;   // single-flight identical cache misses
    std::string log_level;                 // "" = SPDLOG_LEVEL, else info

    FingerprintCache::Options cache;

    // CLI front end
    std::string out_path;                  // "" or "-" = stdout
    std::string out_dir          = ".";
    std::string batch_file;
    bool        show_help        = false;
};

// Parses "--key=value" / "--key value" flags into `cfg`; other arguments
// land in `positional`. Returns empty string on success, or an error message.
std::string parse_args(int argc, const char* const* argv, ServiceConfig& cfg,
                       std::vector<std::string>& positional);

const char* usage_text();

#include "service_config.hpp"

#include <spdlog/common.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

const char* usage_text()
{
    return
        "usage: qrforge [flags] \"content=...&size=...&fg_color=%23RRGGBB&...\"\n"
        "       qrforge [flags] --batch FILE\n"
        "\n"
        "  --out PATH            output file for a single render (default stdout)\n"
        "  --out-dir DIR         output directory for --batch (default .)\n"
        "  --batch FILE          one query per line; '#' starts a comment\n"
        "  --size N              size used when a query has none (default 512)\n"
        "  --max-size N          largest accepted size, 0 = unlimited (default 4096)\n"
        "  --logo-margin N       white border around the logo in pixels (default 4)\n"
        "  --fetch-timeout S     logo fetch timeout in seconds, 0 = none (default 0)\n"
        "  --threads N           batch workers, 0 = all cores (default 0)\n"
        "  --no-coalesce         let concurrent identical misses render separately\n"
        "  --cache-capacity N    cache entries (default 1000)\n"
        "  --cache-ttl S         time-to-live in seconds (default 3600)\n"
        "  --cache-tti S         time-to-idle in seconds (default 1800)\n"
        "  --cache-shards N      independently locked cache shards (default 8)\n"
        "  --log-level LEVEL     trace|debug|info|warn|error|off (default info)\n"
        "  --help\n";
}

static bool parse_long(const std::string& text, long long lo, long long hi, long long& out)
{
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v < lo || v > hi) return false;
    out = v;
    return true;
}

static std::string bad_value(const std::string& flag, const std::string& value)
{
    return "invalid value '" + value + "' for " + flag;
}

std::string parse_args(int argc, const char* const* argv, ServiceConfig& cfg,
                       std::vector<std::string>& positional)
{
    constexpr long long INT_HI = std::numeric_limits<int>::max();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--help")        { cfg.show_help = true;        continue; }
        if (arg == "--no-coalesce") { cfg.coalesce_misses = false; continue; }

        std::string flag  = arg;
        std::string value;
        const size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            flag  = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        } else {
            if (i + 1 >= argc)
                return "missing value for " + flag;
            value = argv[++i];
        }

        long long n = 0;
        if (flag == "--out") {
            cfg.out_path = value;
        } else if (flag == "--out-dir") {
            cfg.out_dir = value;
        } else if (flag == "--batch") {
            cfg.batch_file = value;
        } else if (flag == "--log-level") {
            // from_str maps unknown names to off.
            if (value != "off" && spdlog::level::from_str(value) == spdlog::level::off)
                return bad_value(flag, value);
            cfg.log_level = value;
        } else if (flag == "--size") {
            if (!parse_long(value, 1, INT_HI, n)) return bad_value(flag, value);
            cfg.default_size = static_cast<int>(n);
        } else if (flag == "--max-size") {
            if (!parse_long(value, 0, INT_HI, n)) return bad_value(flag, value);
            cfg.max_size = static_cast<int>(n);
        } else if (flag == "--logo-margin") {
            if (!parse_long(value, 0, INT_HI, n)) return bad_value(flag, value);
            cfg.logo_margin = static_cast<int>(n);
        } else if (flag == "--fetch-timeout") {
            if (!parse_long(value, 0, INT_HI, n)) return bad_value(flag, value);
            cfg.fetch_timeout_s = static_cast<long>(n);
        } else if (flag == "--threads") {
            if (!parse_long(value, 0, 1024, n)) return bad_value(flag, value);
            cfg.threads = static_cast<int>(n);
        } else if (flag == "--cache-capacity") {
            if (!parse_long(value, 1, INT_HI, n)) return bad_value(flag, value);
            cfg.cache.capacity = static_cast<size_t>(n);
        } else if (flag == "--cache-ttl") {
            if (!parse_long(value, 1, INT_HI, n)) return bad_value(flag, value);
            cfg.cache.time_to_live = std::chrono::seconds(n);
        } else if (flag == "--cache-tti") {
            if (!parse_long(value, 1, INT_HI, n)) return bad_value(flag, value);
            cfg.cache.time_to_idle = std::chrono::seconds(n);
        } else if (flag == "--cache-shards") {
            if (!parse_long(value, 1, 1024, n)) return bad_value(flag, value);
            cfg.cache.shards = static_cast<int>(n);
        } else {
            return "unknown flag " + flag;
        }
    }
    return {};  // success
}

#pragma once

#include "render_service.hpp"
#include "service_config.hpp"
#include "thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

// Returns empty string on success, or an error message on failure.
inline std::string write_bytes(const std::string& path, const std::vector<uint8_t>& bytes)
{
    const bool to_stdout = path.empty() || path == "-";
    FILE* fp = to_stdout ? stdout : std::fopen(path.c_str(), "wb");
    if (!fp)
        return "Cannot open file for writing: " + path;

    const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), fp);
    const bool   ok = (n == bytes.size()) && std::fflush(fp) == 0;
    if (!to_stdout && std::fclose(fp) != 0)
        return "Error closing " + path;
    if (!ok)
        return "Short write to " + (to_stdout ? std::string("stdout") : path);
    return {};  // success
}

// Renders every query line of cfg.batch_file on a worker pool, all sharing
// the service's cache, and prints one summary row per line.
inline int run_batch(RenderService& service, const ServiceConfig& cfg)
{
    std::ifstream in(cfg.batch_file);
    if (!in) {
        spdlog::error("[Batch] Cannot open {}", cfg.batch_file);
        return 1;
    }

    struct Job {
        std::string  query;
        RenderResult result;
        std::string  error;
        std::string  path;
        double       ms = 0.0;
    };

    std::vector<Job> jobs;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        Job j;
        j.query = line;
        j.error = "render did not complete";
        j.path  = cfg.out_dir + "/qr_" + std::to_string(jobs.size() + 1) + ".png";
        jobs.push_back(std::move(j));
    }

    ThreadPool pool(cfg.threads);
    spdlog::info("[Batch] {} requests on {} workers", jobs.size(), pool.size());

    using clock = std::chrono::steady_clock;
    for (auto& job : jobs) {
        pool.submit([&service, &cfg, &job] {
            const auto t0 = clock::now();
            RenderRequest req;
            job.error = parse_query(job.query, req, cfg.default_size);
            if (!job.error.empty()) {
                job.result.status = RenderStatus::InvalidRequest;
            } else {
                job.result = service.render(req);
                if (job.result.status != RenderStatus::Ok)
                    job.error = job.result.error;
                else
                    job.error = write_bytes(job.path, *job.result.png);
            }
            job.ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        });
    }
    pool.wait();
    if (pool.failed() > 0)
        spdlog::error("[Batch] {} jobs aborted with an exception", pool.failed());

    printf("%-4s %-16s %-8s %10s %9s  %s\n", "#", "Status", "Cache", "Bytes", "ms", "Output");
    printf("------------------------------------------------------------------\n");
    int failed = 0;
    for (size_t i = 0; i < jobs.size(); ++i) {
        const Job& j = jobs[i];
        const bool ok = j.error.empty();
        if (!ok) ++failed;
        printf("%-4zu %-16s %-8s %10zu %9.2f  %s\n",
               i + 1,
               ok ? "ok" : (j.result.status == RenderStatus::Ok ? "write error"
                                                               : status_name(j.result.status)),
               j.result.cache_hit ? "hit" : "miss",
               j.result.png ? j.result.png->size() : size_t{0},
               j.ms,
               ok ? j.path.c_str() : j.error.c_str());
    }
    return failed == 0 ? 0 : 1;
}

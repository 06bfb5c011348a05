#include "logo_fetcher.hpp"
#include "image_codec.hpp"
#include "resample.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

std::string prepare_logo(const std::vector<uint8_t>& bytes, int qr_size, PixelBuffer& out)
{
    const int footprint = qr_size / 4;
    if (footprint <= 0)
        return "logo footprint is empty";

    PixelBuffer decoded;
    const std::string err = decode_image(bytes, decoded);
    if (!err.empty())
        return err;

    int w = 0, h = 0;
    fit_dimensions(decoded.width, decoded.height, footprint, footprint, w, h);
    out = resize_lanczos3(decoded, w, h);
    if (out.empty())
        return "logo resize produced an empty image";
    return {};  // success
}

// ---------------------------------------------------------------------------
// libcurl transport
// ---------------------------------------------------------------------------
struct BodySink {
    std::vector<uint8_t>* body;
    size_t                limit;
    bool                  overflow = false;
};

static size_t write_body(char* data, size_t size, size_t nmemb, void* userdata)
{
    auto* sink = static_cast<BodySink*>(userdata);
    const size_t n = size * nmemb;
    if (sink->body->size() + n > sink->limit) {
        sink->overflow = true;
        return 0;   // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->body->insert(sink->body->end(), data, data + n);
    return n;
}

CurlLogoFetcher::CurlLogoFetcher(long timeout_s, size_t max_bytes)
    : timeout_s(timeout_s), max_bytes(max_bytes)
{
}

std::string CurlLogoFetcher::fetch_bytes(const std::string& url, std::vector<uint8_t>& body)
{
    body.clear();

    CURL* curl = curl_easy_init();
    if (!curl)
        return "curl_easy_init failed";

    char errbuf[CURL_ERROR_SIZE] = {};
    BodySink sink{&body, max_bytes};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    if (timeout_s > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);

    const CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (sink.overflow)
        return "logo payload exceeds " + std::to_string(max_bytes) + " bytes";
    if (rc != CURLE_OK)
        return std::string("logo request failed: ") + (errbuf[0] ? errbuf : curl_easy_strerror(rc));
    if (status < 200 || status >= 300)
        return "logo request returned HTTP " + std::to_string(status);
    if (body.empty())
        return "logo response body is empty";
    return {};  // success
}

std::string CurlLogoFetcher::fetch(const std::string& url, int qr_size, PixelBuffer& out)
{
    std::vector<uint8_t> body;
    std::string err = fetch_bytes(url, body);
    if (err.empty())
        err = prepare_logo(body, qr_size, out);
    if (!err.empty())
        spdlog::debug("[LogoFetcher] {}: {}", url, err);
    return err;
}

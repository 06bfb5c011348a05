#include "render_request.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <utility>

// Optional fields are tagged so that "absent" and "empty" never collide;
// content goes last and is length-prefixed.
static void append_field(std::string& key, const std::optional<std::string>& v)
{
    if (v) {
        key += 'S';
        key += std::to_string(v->size());
        key += ':';
        key += *v;
    } else {
        key += 'N';
    }
    key += '|';
}

Fingerprint make_fingerprint(const RenderRequest& req)
{
    Fingerprint fp;
    fp.key.reserve(req.content.size() + 48);
    fp.key += std::to_string(req.size);
    fp.key += '|';
    append_field(fp.key, req.fg_color);
    append_field(fp.key, req.bg_color);
    fp.key += std::to_string(req.content.size());
    fp.key += ':';
    fp.key += req.content;
    return fp;
}

std::string validate_request(const RenderRequest& req, int max_size)
{
    if (req.content.empty())
        return "content must not be empty";
    if (req.size <= 0)
        return "size must be a positive integer";
    if (max_size > 0 && req.size > max_size)
        return "size " + std::to_string(req.size) + " exceeds the maximum of "
             + std::to_string(max_size);
    return {};
}

static int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < s.size()
                   && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            out += c;   // malformed escapes pass through verbatim
        }
    }
    return out;
}

static bool parse_size(const std::string& text, int& out)
{
    if (text.empty()) return false;
    for (char c : text)
        if (c < '0' || c > '9') return false;

    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v > static_cast<unsigned long long>(std::numeric_limits<int>::max()))
        return false;
    out = static_cast<int>(v);
    return true;
}

std::string parse_query(const std::string& query, RenderRequest& out, int default_size)
{
    RenderRequest req;
    req.size = default_size;
    bool have_content = false;

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;

        const size_t eq = pair.find('=');
        const std::string name  = url_decode(pair.substr(0, eq));
        const std::string value = (eq == std::string::npos) ? std::string()
                                                            : url_decode(pair.substr(eq + 1));

        if (name == "content") {
            req.content  = value;
            have_content = true;
        } else if (name == "size") {
            if (!parse_size(value, req.size))
                return "size must be a non-negative integer, got '" + value + "'";
        } else if (name == "fg_color") {
            req.fg_color = value;
        } else if (name == "bg_color") {
            req.bg_color = value;
        } else if (name == "logo_url") {
            req.logo_url = value;
        }
    }

    if (!have_content)
        return "missing required parameter 'content'";

    out = std::move(req);
    return {};  // success
}

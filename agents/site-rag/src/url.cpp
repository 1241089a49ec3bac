#include "../include/url.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace {
struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
using CurlUrl = std::unique_ptr<CURLU, CurlUrlDeleter>;

std::string get_part(CURLU* h, CURLUPart part) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, 0) != CURLUE_OK || !value) return {};
    std::string out(value);
    curl_free(value);
    return out;
}

std::string encode_spaces(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == ' ') out += "%20";
        else out.push_back(c);
    }
    return out;
}

std::optional<UrlParts> parts_of(CURLU* h) {
    UrlParts p;
    p.scheme = to_lower(get_part(h, CURLUPART_SCHEME));
    if (p.scheme != "http" && p.scheme != "https") return std::nullopt;
    p.host = to_lower(get_part(h, CURLUPART_HOST));
    if (p.host.empty()) return std::nullopt;
    p.port = get_part(h, CURLUPART_PORT);
    p.path = get_part(h, CURLUPART_PATH);
    if (p.path.empty()) p.path = "/";
    p.query = get_part(h, CURLUPART_QUERY);
    return p;
}
}

std::string UrlParts::str() const {
    std::string out = scheme + "://" + netloc() + path;
    if (!query.empty()) out += "?" + query;
    return out;
}

std::optional<UrlParts> parse_url(const std::string& url) {
    CurlUrl h(curl_url());
    if (!h) return std::nullopt;
    if (curl_url_set(h.get(), CURLUPART_URL, encode_spaces(trim(url)).c_str(), 0) != CURLUE_OK) return std::nullopt;
    return parts_of(h.get());
}

std::optional<std::string> resolve_url(const std::string& base, const std::string& href) {
    std::string ref = trim(href);
    ref = ref.substr(0, ref.find('#'));
    // mailto:, javascript:, tel: and friends
    std::string scheme = to_lower(ref.substr(0, ref.find(':')));
    if (scheme.size() < ref.size() && !scheme.empty() &&
        std::all_of(scheme.begin(), scheme.end(), [](char c) { return std::isalnum((unsigned char)c) || c == '+' || c == '-' || c == '.'; }) &&
        scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    CurlUrl h(curl_url());
    if (!h) return std::nullopt;
    if (curl_url_set(h.get(), CURLUPART_URL, encode_spaces(trim(base)).c_str(), 0) != CURLUE_OK) return std::nullopt;
    // With a URL already set, curl resolves a relative one against it.
    if (!ref.empty() &&
        curl_url_set(h.get(), CURLUPART_URL, encode_spaces(ref).c_str(), 0) != CURLUE_OK) return std::nullopt;
    auto parts = parts_of(h.get());
    if (!parts) return std::nullopt;
    return parts->str();
}

std::string url_filename(const std::string& url) {
    auto parts = parse_url(url);
    std::string path = parts ? parts->path : url;
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

#include "../include/fetcher.hpp"
#include "../include/http.hpp"
#include <iostream>
#include <vector>

namespace {
const std::vector<std::string>& browser_headers() {
    static const std::vector<std::string> headers = {
        "User-Agent: Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36",
        "Accept: text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8",
        "Accept-Language: en-US,en;q=0.5",
        "Connection: keep-alive"
    };
    return headers;
}
}

FetchResult CurlFetcher::get(const std::string& uri, long timeout_ms) {
    auto r = http_get(uri, timeout_ms, browser_headers());
    return FetchResult{r.status, std::move(r.body)};
}

std::optional<std::string> CurlFetcher::download(const std::string& uri, long timeout_ms) {
    try {
        auto r = http_get(uri, timeout_ms, browser_headers());
        if (r.status != 200) {
            std::cerr << "[pdf] Download failed: " << uri << " (status " << r.status << ")" << std::endl;
            return std::nullopt;
        }
        return std::move(r.body);
    } catch (const std::exception& e) {
        std::cerr << "[pdf] Download error " << uri << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

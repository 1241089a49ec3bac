#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Both calls throw std::runtime_error when the transfer itself fails
// (DNS, connect, timeout). Any HTTP status is returned as-is.
HttpResponse http_get(const std::string& url, long timeout_ms,
                      const std::vector<std::string>& headers = {});
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);

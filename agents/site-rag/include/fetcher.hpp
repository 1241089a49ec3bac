#pragma once
#include <string>
#include <optional>

struct FetchResult {
    long status{0};
    std::string body;
};

class Fetcher {
public:
    virtual ~Fetcher() = default;
    // Throws std::runtime_error on transport failure or timeout.
    virtual FetchResult get(const std::string& uri, long timeout_ms) = 0;
    // File bytes on HTTP 200; no value on any failure.
    virtual std::optional<std::string> download(const std::string& uri, long timeout_ms) = 0;
};

class CurlFetcher : public Fetcher {
public:
    FetchResult get(const std::string& uri, long timeout_ms) override;
    std::optional<std::string> download(const std::string& uri, long timeout_ms) override;
};

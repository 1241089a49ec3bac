#pragma once
#include <string>
#include <optional>

struct UrlParts {
    std::string scheme;
    std::string host; // lowercased
    std::string port; // empty unless explicit
    std::string path;
    std::string query;

    std::string netloc() const { return port.empty() ? host : host + ":" + port; }
    // scheme://netloc/path[?query], fragment dropped
    std::string str() const;
};

// Parses an absolute http(s) URL. No value for anything else.
std::optional<UrlParts> parse_url(const std::string& url);

// Resolves href against base (absolute or relative href) and normalizes the
// result. No value when the result is not an http(s) URL.
std::optional<std::string> resolve_url(const std::string& base, const std::string& href);

// Last path segment, empty when the path ends in '/'.
std::string url_filename(const std::string& url);

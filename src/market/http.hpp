#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace market::http {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct Url {
    bool tls = false;
    std::string host;
    std::string port; // "80" / "443" unless given
    std::string target = "/";
};

// http:// and https:// only
std::optional<Url> parse_url(std::string_view url);

std::string url_escape(std::string_view s);
std::string build_url(const std::string& base, const QueryParams& params);

// Blocking GET that follows redirects. Throws TransportError on connection
// failures, timeouts and HTTP status >= 400. timeout_sec bounds each
// connect, handshake, write and read step.
std::string get(const std::string& url, long timeout_sec);

} // namespace market::http

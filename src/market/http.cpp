#include "market/http.hpp"
#include "market/errors.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <utility>

namespace market::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

using Response = bhttp::response<bhttp::string_body>;

static constexpr const char* kUserAgent = "tickerboard/1.0";
static constexpr int kMaxRedirects = 5;

static TransportError make_error(const std::string& url, const std::string& what)
{
    return TransportError("GET " + url + " failed: " + what);
}

std::optional<Url> parse_url(std::string_view url)
{
    Url u;
    std::string_view rest;
    if (url.rfind("https://", 0) == 0) {
        u.tls = true;
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    }
    else {
        return std::nullopt;
    }

    const auto slash = rest.find('/');
    std::string_view authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) u.target = std::string(rest.substr(slash));

    const auto colon = authority.find(':');
    if (colon != std::string_view::npos) {
        u.port = std::string(authority.substr(colon + 1));
        authority = authority.substr(0, colon);
        if (u.port.empty()) return std::nullopt;
    }
    else {
        u.port = u.tls ? "443" : "80";
    }

    if (authority.empty()) return std::nullopt;
    u.host = std::string(authority);
    return u;
}

std::string url_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(ch);
            continue;
        }
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%%%02X", c);
        out += buf;
    }
    return out;
}

std::string build_url(const std::string& base, const QueryParams& params)
{
    std::string url = base;
    char sep = '?';
    for (const auto& [key, value] : params) {
        url.push_back(sep);
        url += url_escape(key);
        url.push_back('=');
        url += url_escape(value);
        sep = '&';
    }
    return url;
}

// *
// **
// ***
// ****
// ***** TRANSPORT

// Runs one async operation to completion. The tcp_stream expiry closes the
// socket when it passes, which completes the operation with error::timeout.
template <class Initiate>
static beast::error_code run_io(net::io_context& ioc, Initiate&& initiate)
{
    beast::error_code result = net::error::operation_aborted;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

template <class Stream>
static Response exchange(net::io_context& ioc,
                         Stream& stream,
                         beast::tcp_stream& socket,
                         const Url& u,
                         const std::string& url,
                         long timeout_sec)
{
    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, u.target, 11};
    req.set(bhttp::field::host, u.host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::connection, "close");

    socket.expires_after(std::chrono::seconds(timeout_sec));
    auto ec = run_io(ioc, [&](auto handler) {
        bhttp::async_write(stream, req, std::move(handler));
    });
    if (ec) throw make_error(url, "write: " + ec.message());

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(16 * 1024 * 1024);
    socket.expires_after(std::chrono::seconds(timeout_sec));
    ec = run_io(ioc, [&](auto handler) {
        bhttp::async_read(stream, buffer, parser, std::move(handler));
    });
    if (ec) throw make_error(url, "read: " + ec.message());

    return parser.release();
}

static Response fetch_once(const Url& u, const std::string& url, long timeout_sec)
{
    net::io_context ioc;
    net::ip::tcp::resolver resolver(ioc);

    // name lookup is bounded by the system resolver's own timeout
    beast::error_code ec;
    const auto results = resolver.resolve(u.host, u.port, ec);
    if (ec) throw make_error(url, "resolve: " + ec.message());

    if (!u.tls) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(std::chrono::seconds(timeout_sec));
        ec = run_io(ioc, [&](auto handler) {
            stream.async_connect(results, std::move(handler));
        });
        if (ec) throw make_error(url, "connect: " + ec.message());

        Response res = exchange(ioc, stream, stream, u, url, timeout_sec);
        stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        return res;
    }

    ssl::context ctx(ssl::context::tls_client);
    ctx.set_default_verify_paths(ec);
    if (ec) spdlog::warn("no default CA paths: {}", ec.message());
    ctx.set_verify_mode(ssl::verify_peer);

    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
        throw make_error(url, "cannot set SNI host name");
    }

    auto& socket = beast::get_lowest_layer(stream);
    socket.expires_after(std::chrono::seconds(timeout_sec));
    ec = run_io(ioc, [&](auto handler) {
        socket.async_connect(results, std::move(handler));
    });
    if (ec) throw make_error(url, "connect: " + ec.message());

    socket.expires_after(std::chrono::seconds(timeout_sec));
    ec = run_io(ioc, [&](auto handler) {
        stream.async_handshake(ssl::stream_base::client, std::move(handler));
    });
    if (ec) throw make_error(url, "tls handshake: " + ec.message());

    Response res = exchange(ioc, stream, socket, u, url, timeout_sec);

    // peers often skip close_notify; the body is already complete
    socket.expires_after(std::chrono::seconds(timeout_sec));
    ec = run_io(ioc, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
    if (ec && ec != net::ssl::error::stream_truncated) {
        spdlog::debug("tls shutdown {}: {}", url, ec.message());
    }
    return res;
}

std::string get(const std::string& url, long timeout_sec)
{
    std::string current = url;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        spdlog::debug("GET {}", current);

        auto u = parse_url(current);
        if (!u) throw make_error(current, "unsupported url");

        Response res = fetch_once(*u, current, timeout_sec);
        const unsigned status = res.result_int();

        if (status >= 300 && status < 400) {
            const auto loc = res[bhttp::field::location];
            if (loc.empty()) throw make_error(current, "redirect without Location");

            std::string next(loc.data(), loc.size());
            if (next.front() == '/') {
                next = (u->tls ? "https://" : "http://") + u->host + ":" + u->port + next;
            }
            current = std::move(next);
            continue;
        }

        if (status >= 400) {
            std::ostringstream oss;
            oss << "GET " << current << " returned HTTP " << status;
            throw TransportError(oss.str());
        }

        return std::move(res.body());
    }

    throw make_error(url, "too many redirects");
}

} // namespace market::http

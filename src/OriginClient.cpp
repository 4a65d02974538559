#include "OriginClient.hpp"
#include "ProxyError.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/lexical_cast.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

bool hasScheme(const std::string & value) {
    return boost::istarts_with(value, "http://") || boost::istarts_with(value, "https://");
}

// send req, then read responses until a final one
template <class Stream>
http::response<http::string_body> exchange(Stream & stream, http::request<http::string_body> & req, bool head) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    while (true) {
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        // origin headers are stored verbatim, whatever their size
        parser.header_limit(std::numeric_limits<std::uint32_t>::max());
        if (head) {
            parser.skip(true);
        }
        http::read(stream, buffer, parser);
        int status = parser.get().result_int();
        // interim 1xx responses carry no payload, the real answer follows
        if (status >= 100 && status < 200 && status != 101) {
            continue;
        }
        return parser.release();
    }
}

}

OriginClient::OriginClient() : ssl_ctx(asio::ssl::context::tls_client) {
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(asio::ssl::verify_peer);
}

std::string OriginClient::resolveUrl(const Request & request) {
    std::string target = request.getUrl();
    if (hasScheme(target)) {
        return target;
    }
    std::string host = request.getHeader("Host");
    // "http://origin/" + "/path" would double the slash
    if (!host.empty() && host.back() == '/' && !target.empty() && target.front() == '/') {
        host.pop_back();
    }
    if (hasScheme(host)) {
        return host + target;
    }
    return "http://" + host + target;
}

OriginUrl OriginClient::parseUrl(const std::string & url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ForwardingError("malformed URL \"" + url + "\": no scheme");
    }
    OriginUrl parsed;
    parsed.scheme = boost::to_lower_copy(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw ForwardingError("unsupported scheme in \"" + url + "\"");
    }

    std::string rest = url.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_start);
    std::string target = path_start == std::string::npos ? "" : rest.substr(path_start);

    size_t fragment = target.find('#');
    if (fragment != std::string::npos) {
        target.erase(fragment);
    }
    if (target.empty() || target.front() != '/') {
        target = "/" + target;
    }
    parsed.target = target;

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    parsed.authority = authority;

    std::string port_str;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw ForwardingError("malformed IPv6 host in \"" + url + "\"");
        }
        parsed.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw ForwardingError("malformed authority in \"" + url + "\"");
            }
            port_str = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        parsed.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_str = authority.substr(colon + 1);
        }
    }
    if (parsed.host.empty()) {
        throw ForwardingError("malformed URL \"" + url + "\": no host");
    }

    parsed.port = parsed.scheme == "https" ? 443 : 80;
    if (!port_str.empty()) {
        bool digits = std::all_of(port_str.begin(), port_str.end(),
                                  [](unsigned char c) { return std::isdigit(c); });
        if (!digits || !boost::conversion::try_lexical_convert(port_str, parsed.port) ||
            parsed.port <= 0 || parsed.port > 65535) {
            throw ForwardingError("bad port in \"" + url + "\"");
        }
    }
    return parsed;
}

bool OriginClient::isExcludedHeader(const std::string & name) {
    return beast::iequals(name, "Host") ||
           beast::iequals(name, "Connection") ||
           beast::iequals(name, "Proxy-Connection");
}

http::request<http::string_body> OriginClient::buildRequest(const Request & request, const OriginUrl & url) const {
    http::request<http::string_body> req;
    req.method_string(request.getMethod());
    req.target(url.target);
    req.version(11);

    for (const auto & name : distinctHeaderNames(request.getHeaders())) {
        if (isExcludedHeader(name)) {
            continue;
        }
        // framing is recomputed from the body we actually send
        if (beast::iequals(name, "Content-Length") || beast::iequals(name, "Transfer-Encoding")) {
            continue;
        }
        req.insert(name, joinHeaderValues(request.getHeaders(), name));
    }
    req.set(http::field::host, url.authority);

    if (request.hasBody()) {
        req.body() = request.getBody();
    }
    req.prepare_payload();
    return req;
}

CacheEntry OriginClient::toEntry(const Request & request, http::response<http::string_body> & response) const {
    std::string reason = response.reason().to_string();
    if (reason.empty()) {
        reason = http::obsolete_reason(response.result()).to_string();
    }
    std::string response_line = request.getVersion() + " " +
                                std::to_string(response.result_int()) + " " + reason;

    // the body below is already de-chunked, so chunked framing is replaced
    // by the decoded length. A HEAD response has no body to measure.
    bool dechunked = false;
    http::fields headers;
    for (const auto & field : response.base()) {
        if (beast::iequals(field.name_string(), "Transfer-Encoding")) {
            dechunked = true;
            continue;
        }
        headers.insert(field.name_string(), field.value());
    }
    if (dechunked && !request.isHead()) {
        headers.erase(http::field::content_length);
        headers.insert("Content-Length", std::to_string(response.body().size()));
    }
    return CacheEntry(response_line, headers, response.body());
}

CacheEntry OriginClient::fetch(const Request & request) {
    std::string url = resolveUrl(request);
    OriginUrl origin = parseUrl(url);
    logger.info(request.getId(), "Requesting \"" + request.getMethod() + " " + origin.target + "\" from " +
                origin.scheme + "://" + origin.authority);

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(origin.host, std::to_string(origin.port));
        http::request<http::string_body> req = buildRequest(request, origin);
        http::response<http::string_body> res;

        if (origin.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), origin.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            stream.set_verify_callback(asio::ssl::host_name_verification(origin.host));
            beast::get_lowest_layer(stream).connect(endpoints);
            stream.handshake(asio::ssl::stream_base::client);
            res = exchange(stream, req, request.isHead());

            beast::error_code ec;
            stream.shutdown(ec);
            // many servers close without close_notify once the response is done
            if (ec && ec != asio::ssl::error::stream_truncated && ec != asio::error::eof) {
                logger.debug(request.getId(), "TLS shutdown: " + ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.connect(endpoints);
            res = exchange(stream, req, request.isHead());

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                logger.debug(request.getId(), "socket shutdown: " + ec.message());
            }
        }

        logger.info(request.getId(), "Received \"" + std::to_string(res.result_int()) + "\" from " +
                    origin.authority + " bodyLen(" + std::to_string(res.body().size()) + ")");
        return toEntry(request, res);
    }
    catch (const boost::system::system_error & e) {
        throw ForwardingError(url + ": " + e.what());
    }
}

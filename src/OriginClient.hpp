#ifndef ORIGINCLIENT_HPP
#define ORIGINCLIENT_HPP

#include <string>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include "CacheEntry.hpp"
#include "Logger.hpp"
#include "Request.hpp"

namespace asio = boost::asio;

// absolute http(s) URL split into what a connection needs
struct OriginUrl {
    std::string scheme;     // "http" or "https"
    std::string host;       // without brackets for IPv6 literals
    int port;
    std::string authority;  // host[:port] as written, used for the Host header
    std::string target;     // path and query, at least "/"
};

// Forwards one request to its origin over a fresh connection and captures
// the whole response. A single attempt: any failure is a ForwardingError.
class OriginClient {
    public:
        OriginClient();
        virtual ~OriginClient() = default;

        OriginClient(const OriginClient&) = delete;
        OriginClient& operator=(const OriginClient&) = delete;

        virtual CacheEntry fetch(const Request & request);

        // absolute URL the request goes to: an absolute target as-is,
        // otherwise Host + target, with "http://" added when Host has no scheme
        static std::string resolveUrl(const Request & request);

        // throws ForwardingError for anything that is not an http(s) URL
        static OriginUrl parseUrl(const std::string & url);

        // hop-specific request headers that are never forwarded
        static bool isExcludedHeader(const std::string & name);

        http::request<http::string_body> buildRequest(const Request & request, const OriginUrl & url) const;

        CacheEntry toEntry(const Request & request, http::response<http::string_body> & response) const;

    private:
        asio::ssl::context ssl_ctx;
        static inline Logger & logger = Logger::getInstance();
};

#endif

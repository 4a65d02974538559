#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <string>
#include <boost/beast/http/fields.hpp>

namespace http = boost::beast::http;

// One origin response as it is replayed to clients: the status line built
// with the client's protocol version, the origin headers in order, and the
// body bytes. An empty body also stands for "no body".
class CacheEntry {

    private:
        std::string response_line;
        http::fields response_headers;
        std::string response_body;

    public:
        CacheEntry() = default;
        CacheEntry(const std::string & response_line,
                   const http::fields & response_headers,
                   const std::string & response_body);

        const std::string & getResponseLine() const { return response_line; }
        const http::fields & getResponseHeaders() const { return response_headers; }
        const std::string & getResponseBody() const { return response_body; }
        bool hasBody() const { return !response_body.empty(); }

        // status code parsed from the response line, -1 if it has none
        int getStatusCode() const;

        // first value of the header, "" when absent
        std::string getHeader(const std::string & name) const;

        // same line, same header entries in the same order, same body
        bool operator==(const CacheEntry & other) const;
        bool operator!=(const CacheEntry & other) const { return !(*this == other); }
};


#endif

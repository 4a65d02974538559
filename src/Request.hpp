#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <string>
#include <vector>
#include <atomic>
#include <boost/beast/http/fields.hpp>
#include "Logger.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;


class Request {
private:
    static std::atomic<int> next_id;
    int id;
    std::string method;
    std::string url;
    std::string version;
    http::fields headers;
    std::string body;

public:
    Request() : id(-1){}
    Request(const std::string & method, const std::string & url, const std::string & version)
        : id(next_id++), method(method), url(url), version(version) {}

    int getId() const { return id; }

    std::string getMethod() const { return method; }
    // request target as sent, origin-form path or absolute URL
    std::string getUrl() const { return url; }
    void setUrl(const std::string & target) { url = target; }
    // protocol version token, e.g. "HTTP/1.1"
    std::string getVersion() const { return version; }

    // first value of the header, "" when absent
    std::string getHeader(const std::string& key) const;
    std::vector<std::string> getHeaderValues(const std::string& key) const;
    bool hasHeader(const std::string& key) const;

    // replace every entry of key with values, keeping the casing of key
    void setHeader(const std::string& key, const std::vector<std::string>& values);

    bool isConnect() const { return method == "CONNECT"; }
    bool isHead() const { return method == "HEAD"; }

    const http::fields & getHeaders() const { return headers; }
    bool hasBody() const { return !body.empty(); }
    const std::string & getBody() const { return body; }
    void setBody(std::string data) { body = std::move(data); }
};

// Header names of fields in first-seen order, one per case-insensitive name.
std::vector<std::string> distinctHeaderNames(const http::fields & headers);

// all values of name joined with ", "
std::string joinHeaderValues(const http::fields & headers, const std::string & name);

#endif

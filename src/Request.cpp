#include "Request.hpp"
#include <algorithm>
#include <boost/beast/core/string.hpp>

std::atomic<int> Request::next_id(0);


std::string Request::getHeader(const std::string& key) const {
    auto it = headers.find(key);
    return (it != headers.end()) ? it->value().to_string() : "";
}

std::vector<std::string> Request::getHeaderValues(const std::string& key) const {
    std::vector<std::string> values;
    auto range = headers.equal_range(key);
    for (auto it = range.first; it != range.second; ++it) {
        values.push_back(it->value().to_string());
    }
    return values;
}

bool Request::hasHeader(const std::string& key) const {
    return headers.count(key) > 0;
}

void Request::setHeader(const std::string& key, const std::vector<std::string>& values) {
    headers.erase(key);
    for (const auto & value : values) {
        headers.insert(key, value);
    }
}

std::vector<std::string> distinctHeaderNames(const http::fields & headers) {
    std::vector<std::string> names;
    for (const auto & field : headers) {
        std::string name = field.name_string().to_string();
        bool seen = std::any_of(names.begin(), names.end(), [&name](const std::string & other) {
            return beast::iequals(other, name);
        });
        if (!seen) {
            names.push_back(name);
        }
    }
    return names;
}

std::string joinHeaderValues(const http::fields & headers, const std::string & name) {
    std::string joined;
    bool first = true;
    auto range = headers.equal_range(name);
    for (auto it = range.first; it != range.second; ++it) {
        if (!first) {
            joined += ", ";
        }
        joined += it->value().to_string();
        first = false;
    }
    return joined;
}

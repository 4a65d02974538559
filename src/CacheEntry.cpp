#include "CacheEntry.hpp"
#include <cstdlib>

CacheEntry::CacheEntry(const std::string & response_line,
    const http::fields & response_headers,
    const std::string & response_body
    )
:   response_line(response_line),
    response_headers(response_headers),
    response_body(response_body) {}

int CacheEntry::getStatusCode() const {
    size_t first_space = response_line.find(' ');
    if (first_space == std::string::npos) {
        return -1;
    }
    const char * start = response_line.c_str() + first_space + 1;
    char * end = nullptr;
    long code = std::strtol(start, &end, 10);
    if (end == start) {
        return -1;
    }
    return static_cast<int>(code);
}

std::string CacheEntry::getHeader(const std::string & name) const {
    auto it = response_headers.find(name);
    return (it != response_headers.end()) ? it->value().to_string() : "";
}

bool CacheEntry::operator==(const CacheEntry & other) const {
    if (response_line != other.response_line || response_body != other.response_body) {
        return false;
    }
    auto a = response_headers.begin();
    auto b = other.response_headers.begin();
    for (; a != response_headers.end() && b != other.response_headers.end(); ++a, ++b) {
        if (a->name_string() != b->name_string() || a->value() != b->value()) {
            return false;
        }
    }
    return a == response_headers.end() && b == other.response_headers.end();
}

#ifndef PROXYERROR_HPP
#define PROXYERROR_HPP

#include <stdexcept>
#include <string>

// Base of every connection-local failure. The connection handler catches
// these, logs them and closes the client socket without a response.
class ProxyError : public std::runtime_error {
    public:
        explicit ProxyError(const std::string & message) : std::runtime_error(message) {}
};

// request line could not be split into method, target and version
class ParseError : public ProxyError {
    public:
        explicit ParseError(const std::string & message) : ProxyError("parse error: " + message) {}
};

class MissingHostError : public ProxyError {
    public:
        MissingHostError() : ProxyError("request has no Host header") {}
};

// corrupt record on disk, or failure to persist one
class StoreError : public ProxyError {
    public:
        explicit StoreError(const std::string & message) : ProxyError("store error: " + message) {}
};

// origin unreachable, bad resolved URL, or I/O failure talking to it
class ForwardingError : public ProxyError {
    public:
        explicit ForwardingError(const std::string & message) : ProxyError("forwarding error: " + message) {}
};

class TunnelError : public ProxyError {
    public:
        explicit TunnelError(const std::string & message) : ProxyError("tunnel error: " + message) {}
};

// bad command line; main prints usage and exits non-zero
class UsageError : public std::runtime_error {
    public:
        explicit UsageError(const std::string & message) : std::runtime_error(message) {}
};

#endif

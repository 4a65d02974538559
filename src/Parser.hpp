#ifndef PARSER_HPP
#define PARSER_HPP

#include <optional>
#include <string>
#include "Logger.hpp"
#include "Request.hpp"
#include "Socket.hpp"

// Reads one request off a client connection.
//
// The header algorithm is deliberately simple: a line is split at its first
// colon, the value is split on ", " into a value list, and a repeated name
// replaces the earlier one. Callers only see the Request, so the algorithm
// can be tightened here without touching them.
class Parser{
    public:
        // fixed_origin: when set, the Host header is replaced with it and an
        // absolute-form target is cut down to its path and query
        explicit Parser(std::optional<std::string> fixed_origin = std::nullopt);

        // nullopt when the client sent no request line at all,
        // throws ParseError for a malformed request
        std::optional<Request> parseRequest(SocketReader & reader);

        static std::vector<std::string> splitValues(const std::string & value);

        // "http://h:1/a?b" -> "/a?b", other targets unchanged
        static std::string originForm(const std::string & target);

    private:
        // name/value split at the first colon, false when the line has none
        static bool parseHeaderLine(const std::string & line, std::string & name, std::string & value);

        void readBody(SocketReader & reader, Request & request);

        std::optional<std::string> fixed_origin;
        static inline Logger & logger = Logger::getInstance();

};

#endif

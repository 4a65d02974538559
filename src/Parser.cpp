#include "Parser.hpp"
#include "ProxyError.hpp"
#include <algorithm>
#include <cctype>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/finder.hpp>
#include <boost/algorithm/string/iter_find.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/lexical_cast.hpp>

Parser::Parser(std::optional<std::string> fixed_origin) : fixed_origin(std::move(fixed_origin)) {}

std::optional<Request> Parser::parseRequest(SocketReader & reader){

    std::optional<std::string> request_line = reader.readLine();
    if (!request_line || request_line->empty()) {
        logger.debug("no request line on fd " + to_string(reader.fd()));
        return std::nullopt;
    }

    std::vector<std::string> parts;
    boost::split(parts, *request_line, boost::is_any_of(" "));
    if (parts.size() < 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) {
        throw ParseError("malformed request line \"" + *request_line + "\"");
    }
    Request request(parts[0], parts[1], parts[2]);

    // headers until the blank line
    while (true) {
        std::optional<std::string> line = reader.readLine();
        if (!line || line->empty()) {
            break;
        }
        std::string name;
        std::string value;
        if (!parseHeaderLine(*line, name, value)) {
            logger.debug(request.getId(), "ignoring header line without colon");
            continue;
        }
        request.setHeader(name, splitValues(value));
    }

    if (fixed_origin) {
        request.setHeader("Host", {*fixed_origin});
        request.setUrl(originForm(request.getUrl()));
    }

    readBody(reader, request);

    logger.debug(request.getId(), "parsed request method(" + request.getMethod() + ") target(" +
                 request.getUrl() + ") bodyLen(" + to_string(request.getBody().size()) + ")");
    return request;
}

bool Parser::parseHeaderLine(const std::string & line, std::string & name, std::string & value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    name = boost::trim_copy(line.substr(0, colon));
    value = boost::trim_copy(line.substr(colon + 1));
    return !name.empty();
}

std::vector<std::string> Parser::splitValues(const std::string & value) {
    std::vector<std::string> values;
    boost::iter_split(values, value, boost::first_finder(", "));
    return values;
}

std::string Parser::originForm(const std::string & target) {
    if (!boost::istarts_with(target, "http://") && !boost::istarts_with(target, "https://")) {
        return target;
    }
    size_t path_start = target.find_first_of("/?#", target.find("://") + 3);
    if (path_start == std::string::npos) {
        return "/";
    }
    std::string path = target.substr(path_start);
    size_t fragment = path.find('#');
    if (fragment != std::string::npos) {
        path.erase(fragment);
    }
    if (path.empty() || path.front() != '/') {
        path = "/" + path;
    }
    return path;
}

void Parser::readBody(SocketReader & reader, Request & request) {
    bool may_have_body = beast::iequals(request.getMethod(), "POST") ||
                         beast::iequals(request.getMethod(), "PUT");
    if (!may_have_body || !request.hasHeader("Content-Length")) {
        return;
    }

    std::string length_str = request.getHeader("Content-Length");
    bool digits = !length_str.empty() &&
                  std::all_of(length_str.begin(), length_str.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    size_t content_length = 0;
    if (!digits || !boost::conversion::try_lexical_convert(length_str, content_length)) {
        throw ParseError("bad Content-Length \"" + length_str + "\"");
    }
    if (content_length == 0) {
        return;
    }

    std::optional<std::string> body = reader.readExact(content_length);
    if (!body) {
        throw ParseError("connection closed before " + to_string(content_length) + " body bytes");
    }
    request.setBody(std::move(*body));
}

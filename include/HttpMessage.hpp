#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

constexpr std::uint32_t MAX_HEADER_BYTES = 16 * 1024;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

enum class ParseStatus
{
    Complete,
    Incomplete,
    Invalid,
    TooLarge
};

struct ParseResult
{
    ParseStatus status = ParseStatus::Incomplete;
    std::size_t consumed = 0; // Bytes of the buffer used by the message.
    std::string error;
};

// Parses one request from the front of buffer. Only origin-form targets
// are accepted.
ParseResult parse_http_request(const std::string &buffer, std::size_t maxBody, HttpRequest &out);
// Parses one response from the front of buffer (client side).
ParseResult parse_http_response(const std::string &buffer, std::size_t maxBody, HttpResponse &out);

// Target without its query string.
std::string request_path(const HttpRequest &request);

// Returns a header value as a std::string, or "" when absent.
template <bool isRequest>
std::string header_value(const http::message<isRequest, http::string_body> &message, beast::string_view name)
{
    auto value = message[name];
    return std::string(value.data(), value.size());
}

// Fixes Content-Length from the body and writes the message out.
std::string serialize_response(HttpResponse response);
std::string serialize_request(HttpRequest request);

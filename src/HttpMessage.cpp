#include "HttpMessage.hpp"

#include <sstream>

#include <boost/asio/buffer.hpp>

namespace
{
    // Feeds the buffer to a fresh parser until one message is done.
    template <bool isRequest>
    ParseResult run_parser(http::parser<isRequest, http::string_body> &parser, const std::string &buffer,
                           std::size_t maxBody)
    {
        parser.header_limit(MAX_HEADER_BYTES);
        parser.body_limit(static_cast<std::uint64_t>(maxBody));
        parser.eager(true);

        ParseResult result;
        beast::error_code ec;
        std::size_t used = 0;
        while (!parser.is_done())
        {
            std::size_t n = parser.put(boost::asio::buffer(buffer.data() + used, buffer.size() - used), ec);
            used += n;
            if (ec == http::error::need_more)
                return result;
            if (ec == http::error::header_limit || ec == http::error::body_limit)
            {
                result.status = ParseStatus::TooLarge;
                result.error = ec.message();
                return result;
            }
            if (ec)
            {
                result.status = ParseStatus::Invalid;
                result.error = ec.message();
                return result;
            }
            if (!parser.is_done() && (n == 0 || used == buffer.size()))
                return result;
        }

        result.status = ParseStatus::Complete;
        result.consumed = used;
        return result;
    }

    template <bool isRequest>
    std::string write_message(http::message<isRequest, http::string_body> &message)
    {
        message.prepare_payload();
        std::ostringstream out;
        out << message;
        return out.str();
    }
}

ParseResult parse_http_request(const std::string &buffer, std::size_t maxBody, HttpRequest &out)
{
    http::request_parser<http::string_body> parser;
    ParseResult result = run_parser(parser, buffer, maxBody);
    if (result.status != ParseStatus::Complete)
        return result;

    HttpRequest request = parser.release();
    if (request.target().empty() || request.target().front() != '/')
    {
        result.status = ParseStatus::Invalid;
        result.error = "request target must be a path";
        return result;
    }
    out = std::move(request);
    return result;
}

ParseResult parse_http_response(const std::string &buffer, std::size_t maxBody, HttpResponse &out)
{
    http::response_parser<http::string_body> parser;
    ParseResult result = run_parser(parser, buffer, maxBody);
    if (result.status == ParseStatus::Complete)
        out = parser.release();
    return result;
}

std::string request_path(const HttpRequest &request)
{
    beast::string_view target = request.target();
    auto query = target.find('?');
    if (query != beast::string_view::npos)
        target = target.substr(0, query);
    return std::string(target.data(), target.size());
}

std::string serialize_response(HttpResponse response)
{
    return write_message(response);
}

std::string serialize_request(HttpRequest request)
{
    return write_message(request);
}

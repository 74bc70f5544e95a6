#include "Gateway.hpp"

#include <limits>
#include <sodium.h>
#include <stdexcept>

#include "Logging.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace
{
    constexpr const char *JSON_TYPE = "application/json";

    HttpResponse make_json(int status, const json &payload)
    {
        HttpResponse response{static_cast<http::status>(status), 11};
        response.set(http::field::content_type, JSON_TYPE);
        response.body() = payload.dump();
        return response;
    }

    const char *route_name(const std::string &path)
    {
        if (path == "/health")
            return "health";
        if (path == "/metrics")
            return "metrics";
        if (path == "/v1/generate")
            return "generate";
        return "other";
    }
}

std::string generate_session_id()
{
    unsigned char raw[12];
    randombytes_buf(raw, sizeof(raw));
    char hex[sizeof(raw) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    return std::string("conn-") + hex;
}

HttpResponse make_error(int status, const std::string &error, const std::string &message)
{
    json resp;
    resp["status"] = "fail";
    resp["error"] = error;
    resp["message"] = message;
    return make_json(status, resp);
}

Gateway::Gateway(AdmissionController &admission, const SimulatedModel &model, Metrics &metrics)
    : admission_(admission), model_(model), metrics_(metrics)
{
}

HttpResponse Gateway::handle(const HttpRequest &request, const std::string &connectionSession)
{
    auto start = std::chrono::steady_clock::now();
    std::string path = request_path(request);
    std::string session = connectionSession;
    HttpResponse response;

    try
    {
        std::string requested = header_value(request, "X-Session-Id");
        if (path == "/v1/generate" && !requested.empty() && !isValidSessionId(requested))
        {
            response = make_error(400, ERR_BAD_REQUEST, "Invalid X-Session-Id header.");
        }
        else
        {
            if (!requested.empty())
                session = requested;

            if (path == "/health")
            {
                response = request.method() == http::verb::get ? handleHealth()
                                                               : make_error(405, ERR_METHOD_NOT_ALLOWED, "Use GET.");
            }
            else if (path == "/metrics")
            {
                response = request.method() == http::verb::get ? handleMetrics()
                                                               : make_error(405, ERR_METHOD_NOT_ALLOWED, "Use GET.");
            }
            else if (path == "/v1/generate")
            {
                response = request.method() == http::verb::post ? handleGenerate(request, session)
                                                                : make_error(405, ERR_METHOD_NOT_ALLOWED, "Use POST.");
            }
            else
            {
                response = make_error(404, ERR_NOT_FOUND, "No route for " + path);
            }
        }
        if (response.result() == http::status::method_not_allowed)
            response.set(http::field::allow, path == "/v1/generate" ? "POST" : "GET");
    }
    catch (const std::exception &e)
    {
        json extra = {{"path", path}, {"session", session}, {"detail", e.what()}};
        Logger::log_event(LogLevel::Error, "request_error", "Request handler failed", extra);
        response = make_error(500, ERR_INTERNAL, "Internal error.");
    }

    response.version(request.version());
    response.keep_alive(request.keep_alive());
    finish(request, path, response, session, start);
    return response;
}

HttpResponse Gateway::handleHealth()
{
    return make_json(200, {{"status", "ok"}});
}

HttpResponse Gateway::handleMetrics()
{
    return make_json(200, metrics_.snapshot(admission_.store().size()));
}

HttpResponse Gateway::handleGenerate(const HttpRequest &request, const std::string &session)
{
    json body;
    try
    {
        body = json::parse(request.body());
    }
    catch (const json::parse_error &e)
    {
        return make_error(400, ERR_JSON_PARSE, std::string("Invalid JSON body: ") + e.what());
    }

    if (!body.is_object() || !body.contains("prompt") || !body["prompt"].is_string() ||
        !body.contains("tokens") || !body["tokens"].is_number_integer())
    {
        return make_error(400, ERR_BAD_REQUEST, "Body must carry a string 'prompt' and an integer 'tokens'.");
    }

    const json &tokensField = body["tokens"];
    if (tokensField.is_number_unsigned() &&
        tokensField.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
        return make_error(400, ERR_BAD_REQUEST, "'tokens' is out of range.");
    }
    std::int64_t tokens = tokensField.get<std::int64_t>();
    if (tokens < 0)
    {
        return make_error(400, ERR_BAD_REQUEST, "'tokens' must not be negative.");
    }

    std::string prompt = body["prompt"];
    if (!isValidPrompt(prompt))
    {
        return make_error(400, ERR_BAD_REQUEST, "Invalid prompt content.");
    }

    CheckResult result = admission_.check(session, tokens);
    const RateLimits &limits = admission_.limits();
    if (!result.admitted())
    {
        std::string detail = result.reason == RejectReason::RequestLimit
                                 ? std::to_string(limits.requestsPerWindow) + " requests"
                                 : std::to_string(limits.tokensPerWindow) + " tokens";
        HttpResponse response = make_error(429, ERR_RATE_LIMIT,
                                           "Rate limit exceeded: at most " + detail + " per " +
                                               std::to_string(limits.window.count()) + "s. Please slow down.");
        response.set(http::field::retry_after, std::to_string(limits.window.count()));
        addLimitHeaders(response, result, session);
        return response;
    }

    json payload;
    payload["status"] = "success";
    payload["session_id"] = session;
    payload["model"] = model_.name();
    payload["completion"] = model_.complete(prompt, tokens);
    payload["tokens"] = tokens;
    HttpResponse response = make_json(200, payload);
    addLimitHeaders(response, result, session);
    return response;
}

void Gateway::addLimitHeaders(HttpResponse &response, const CheckResult &result, const std::string &session) const
{
    const RateLimits &limits = admission_.limits();
    std::size_t remainingRequests = result.requests >= limits.requestsPerWindow ? 0 : limits.requestsPerWindow - result.requests;
    std::int64_t remainingTokens = result.tokens >= limits.tokensPerWindow ? 0 : limits.tokensPerWindow - result.tokens;

    response.set("X-Session-Id", session);
    response.set("X-RateLimit-Limit-Requests", std::to_string(limits.requestsPerWindow));
    response.set("X-RateLimit-Limit-Tokens", std::to_string(limits.tokensPerWindow));
    response.set("X-RateLimit-Remaining-Requests", std::to_string(remainingRequests));
    response.set("X-RateLimit-Remaining-Tokens", std::to_string(remainingTokens));
}

void Gateway::finish(const HttpRequest &request, const std::string &path, const HttpResponse &response,
                     const std::string &session, std::chrono::steady_clock::time_point start)
{
    auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    int status = static_cast<int>(response.result_int());
    metrics_.record_request(route_name(path), status, latency);

    auto method = request.method_string();
    json extra = {
        {"method", std::string(method.data(), method.size())},
        {"path", path},
        {"status", status},
        {"latency_ms", latency.count() / 1000.0},
        {"session", session}};
    Logger::log_event(status < 400 ? LogLevel::Info : LogLevel::Warn,
                      "request", "Handled request", extra);
}

#pragma once
#include <chrono>
#include <string>

#include <nlohmann/json.hpp>
#include "AdmissionController.hpp"
#include "HttpMessage.hpp"
#include "Metrics.hpp"
#include "SimulatedModel.hpp"

// Standardized error codes for client-side handling.
constexpr const char *ERR_BAD_REQUEST = "ERR_BAD_REQUEST";
constexpr const char *ERR_JSON_PARSE = "ERR_JSON_PARSE";
constexpr const char *ERR_NOT_FOUND = "ERR_NOT_FOUND";
constexpr const char *ERR_METHOD_NOT_ALLOWED = "ERR_METHOD_NOT_ALLOWED";
constexpr const char *ERR_PAYLOAD_TOO_LARGE = "ERR_PAYLOAD_TOO_LARGE";
constexpr const char *ERR_RATE_LIMIT = "ERR_RATE_LIMIT";
constexpr const char *ERR_OVERLOADED = "ERR_OVERLOADED";
constexpr const char *ERR_INTERNAL = "ERR_INTERNAL";

// Returns a fresh "conn-<hex>" key from libsodium random bytes.
// sodium_init() must have succeeded first.
std::string generate_session_id();

// Builds a {"status":"fail"} JSON response.
HttpResponse make_error(int status, const std::string &error, const std::string &message);

// Routes HTTP requests: health, metrics and admission-gated generation.
class Gateway
{
public:
    Gateway(AdmissionController &admission, const SimulatedModel &model, Metrics &metrics);

    // Handles one request. connectionSession is used when the request has
    // no X-Session-Id header. Never throws.
    HttpResponse handle(const HttpRequest &request, const std::string &connectionSession);

private:
    HttpResponse handleHealth();
    HttpResponse handleMetrics();
    HttpResponse handleGenerate(const HttpRequest &request, const std::string &session);

    void addLimitHeaders(HttpResponse &response, const CheckResult &result, const std::string &session) const;
    void finish(const HttpRequest &request, const std::string &path, const HttpResponse &response,
                const std::string &session, std::chrono::steady_clock::time_point start);

    AdmissionController &admission_;
    const SimulatedModel &model_;
    Metrics &metrics_;
};

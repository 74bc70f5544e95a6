#include <iostream>
#include <unistd.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <cstring>
#include <string_view>
#include <thread>
#include <cstdio>
#include <cstdlib>
#include <csignal>
#include <sodium.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <queue>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <vector>
#include <errno.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <atomic>

#include <nlohmann/json.hpp>
#include "AdmissionController.hpp"
#include "Config.hpp"
#include "FdWrapper.hpp"
#include "Gateway.hpp"
#include "HttpMessage.hpp"
#include "Logging.hpp"
#include "Metrics.hpp"
#include "SimulatedModel.hpp"
#include "ThreadPool.hpp"

using json = nlohmann::json;

namespace
{
    constexpr const char *DEFAULT_CONFIG_PATH = "config/tokengate.json";

    std::atomic<bool> stop_requested{false};

    void on_signal(int)
    {
        stop_requested.store(true);
    }
}

struct Connection
{
    std::uint64_t id = 0;
    Fd fd;
    SslPtr ssl;
    bool handshaked = false;
    bool in_flight = false;     // A request is with a worker.
    bool close_after_write = false;
    std::string peer;           // IP:port
    std::string session;        // Key used when no X-Session-Id is sent.
    std::string recv_buffer;
    std::string send_buffer;
};

struct Outgoing
{
    int fd;
    std::uint64_t conn_id;
    std::string data;
    bool keep_alive;
};

// Owns the sockets, the TLS context and the event loop. Connection state is
// only touched from the loop thread; workers hand replies back through the
// outgoing queue.
class GatewayServer
{
public:
    GatewayServer(const GatewayConfig &config, SSL_CTX *ctx, AdmissionController &admission, Gateway &gateway,
                  Metrics &metrics)
        : config_(config), ctx_(ctx), admission_(admission), gateway_(gateway), metrics_(metrics),
          pool_(config.workerThreads != 0 ? config.workerThreads : std::thread::hardware_concurrency(),
                config.maxQueuedRequests)
    {
    }

    bool listen(int port);
    void run();

private:
    enum class SendResult
    {
        Ok,      // All data sent.
        Pending, // Awaiting more I/O.
        Error
    };

    void accept_clients();
    void on_client_event(int fd, std::uint32_t evs);
    bool read_available(Connection &conn);
    void pump(Connection &conn);
    void reply_now(Connection &conn, const HttpResponse &response, const std::string &reason);
    void enqueue(int fd, std::uint64_t conn_id, const HttpResponse &response);
    void drain_outgoing();
    SendResult flush(Connection &conn);
    void close_connection(int fd, const char *reason);

    const GatewayConfig &config_;
    SSL_CTX *ctx_;
    AdmissionController &admission_;
    Gateway &gateway_;
    Metrics &metrics_;

    Fd server_fd_;
    Epoll epoll_;
    EventFd wakeup_;
    std::uint64_t next_conn_id_ = 1;
    std::unordered_map<int, Connection> connections_;

    std::queue<Outgoing> outgoing_queue_;
    std::mutex outgoing_mutex_;

    // Last, so workers are joined before the state they reply into goes away.
    ThreadPool pool_;
};

bool GatewayServer::listen(int port)
{
    server_fd_.reset(::socket(AF_INET, SOCK_STREAM, 0));
    if (!server_fd_.valid())
    {
        perror("socket failed");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<std::uint16_t>(port));

    if (bind(server_fd_.get(), reinterpret_cast<sockaddr *>(&address), sizeof(address)) < 0)
    {
        perror("bind failed");
        return false;
    }
    if (::listen(server_fd_.get(), 128) < 0)
    {
        perror("listen failed");
        return false;
    }
    if (set_nonblocking(server_fd_.get()) < 0)
    {
        perror("set_nonblocking failed");
        return false;
    }
    if (!epoll_.valid() || !wakeup_.valid())
    {
        perror("epoll_create1/eventfd");
        return false;
    }

    epoll_.add(server_fd_.get(), EPOLLIN);
    epoll_.add(wakeup_.get(), EPOLLIN | EPOLLET);
    return true;
}

void GatewayServer::run()
{
    std::vector<epoll_event> events(64);
    while (!stop_requested.load())
    {
        drain_outgoing();
        int n = epoll_wait(epoll_.get(), events.data(), static_cast<int>(events.size()), 500);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            perror("epoll_wait");
            break;
        }

        for (int i = 0; i < n; ++i)
        {
            int fd = events[i].data.fd;
            if (fd == server_fd_.get())
            {
                accept_clients();
            }
            else if (fd == wakeup_.get())
            {
                wakeup_.drain();
            }
            else
            {
                on_client_event(fd, events[i].events);
            }
        }
    }

    // Let in-flight handlers finish before their connections go away.
    pool_.wait();
    std::vector<int> open;
    for (const auto &kv : connections_)
        open.push_back(kv.first);
    for (int fd : open)
        close_connection(fd, "server shutdown");
}

void GatewayServer::accept_clients()
{
    while (true)
    {
        sockaddr_in address{};
        socklen_t addrlen = sizeof(address);
        int client_fd = accept(server_fd_.get(), reinterpret_cast<sockaddr *>(&address), &addrlen);
        if (client_fd < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                perror("accept failed");
            break;
        }
        Fd client_handle(client_fd);
        if (set_nonblocking(client_handle.get()) < 0)
            continue;

        char client_ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &address.sin_addr, client_ip, sizeof(client_ip));
        std::string peer = std::string(client_ip) + ":" + std::to_string(ntohs(address.sin_port));

        SslPtr ssl(SSL_new(ctx_));
        if (!ssl)
            continue;
        SSL_set_fd(ssl.get(), client_handle.get());
        SSL_set_accept_state(ssl.get());

        Connection conn;
        conn.id = next_conn_id_++;
        conn.fd = std::move(client_handle);
        conn.ssl = std::move(ssl);
        conn.peer = peer;
        conn.session = generate_session_id();
        std::string session = conn.session;
        connections_[client_fd] = std::move(conn);

        epoll_.add(client_fd, EPOLLIN | EPOLLOUT | EPOLLET);
        metrics_.inc_connections();
        json extra = {{"fd", client_fd}, {"peer", peer}, {"session", session}};
        Logger::log_event(LogLevel::Info, "connection_open", "New client connected", extra);
    }
}

void GatewayServer::on_client_event(int fd, std::uint32_t evs)
{
    auto it = connections_.find(fd);
    if (it == connections_.end())
        return;
    Connection &conn = it->second;

    if (evs & (EPOLLHUP | EPOLLERR))
    {
        json extra = {{"fd", fd}, {"events", static_cast<int>(evs)}};
        Logger::log_event(LogLevel::Warn, "epoll_error", "EPOLL hangup/error", extra);
        close_connection(fd, "epoll hangup or error");
        return;
    }

    // Complete the TLS handshake if needed.
    if (!conn.handshaked)
    {
        int ret = SSL_accept(conn.ssl.get());
        if (ret != 1)
        {
            int err = SSL_get_error(conn.ssl.get(), ret);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                return; // Need more I/O; wait for the next event.

            json extra = {{"fd", fd}, {"peer", conn.peer}, {"ssl_error", err}, {"detail", ssl_error_string()}};
            Logger::log_event(LogLevel::Warn, "tls_handshake_fail", "TLS handshake failed", extra);
            close_connection(fd, "TLS handshake failed");
            return;
        }
        conn.handshaked = true;
        Logger::log_event(LogLevel::Debug, "tls_handshake", "Handshake complete", {{"fd", fd}, {"peer", conn.peer}});
        epoll_.mod(fd, EPOLLIN | EPOLLET);
    }

    // Records may already sit in the TLS buffer after the handshake.
    if (!read_available(conn))
        return;

    if ((evs & EPOLLOUT) && !conn.send_buffer.empty())
    {
        SendResult res = flush(conn);
        if (res == SendResult::Error)
        {
            close_connection(fd, "send error");
            return;
        }
        if (res == SendResult::Ok)
        {
            if (conn.close_after_write)
            {
                close_connection(fd, nullptr);
                return;
            }
            epoll_.mod(fd, EPOLLIN | EPOLLET);
        }
    }

    pump(conn);
}

// Returns false when the connection was closed.
bool GatewayServer::read_available(Connection &conn)
{
    int fd = conn.fd.get();
    while (true)
    {
        char buffer[4096];
        int bytes_read = SSL_read(conn.ssl.get(), buffer, sizeof(buffer));
        if (bytes_read > 0)
        {
            conn.recv_buffer.append(buffer, static_cast<std::size_t>(bytes_read));
            if (conn.recv_buffer.size() > MAX_HEADER_BYTES + config_.maxBodyBytes + 4)
            {
                // The parser reports the oversize request; stop buffering.
                break;
            }
            continue;
        }

        int err = SSL_get_error(conn.ssl.get(), bytes_read);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return true;
        if (err == SSL_ERROR_ZERO_RETURN)
        {
            Logger::log_event(LogLevel::Debug, "peer_close", "Peer closed TLS", {{"fd", fd}});
            close_connection(fd, nullptr);
        }
        else
        {
            json extra = {{"fd", fd}, {"ssl_error", err}, {"detail", ssl_error_string()}};
            Logger::log_event(LogLevel::Warn, "ssl_read_error", "SSL_read failed", extra);
            close_connection(fd, "TLS read error");
        }
        return false;
    }
    return true;
}

// Hands the next buffered request to a worker. One request per connection is
// in flight at a time so replies keep their order.
void GatewayServer::pump(Connection &conn)
{
    if (conn.in_flight || conn.close_after_write)
        return;

    auto request = std::make_shared<HttpRequest>();
    ParseResult parsed = parse_http_request(conn.recv_buffer, config_.maxBodyBytes, *request);
    switch (parsed.status)
    {
    case ParseStatus::Incomplete:
        return;
    case ParseStatus::Invalid:
        reply_now(conn, make_error(400, ERR_BAD_REQUEST, "Malformed HTTP request: " + parsed.error), parsed.error);
        return;
    case ParseStatus::TooLarge:
        reply_now(conn, make_error(413, ERR_PAYLOAD_TOO_LARGE, "Request too large: " + parsed.error), parsed.error);
        return;
    case ParseStatus::Complete:
        break;
    }
    conn.recv_buffer.erase(0, parsed.consumed);
    conn.in_flight = true;

    int fd = conn.fd.get();
    std::uint64_t conn_id = conn.id;
    std::string session = conn.session;
    bool queued = pool_.tryPost([this, fd, conn_id, session, request]()
                                { enqueue(fd, conn_id, gateway_.handle(*request, session)); });
    if (!queued)
    {
        conn.in_flight = false;
        HttpResponse busy = make_error(503, ERR_OVERLOADED, "Server is busy. Please retry later.");
        busy.set(http::field::retry_after, "1");
        busy.version(request->version());
        busy.keep_alive(request->keep_alive());
        metrics_.record_request("overloaded", 503, std::chrono::microseconds(0));
        Logger::log_event(LogLevel::Warn, "overloaded", "Worker queue full",
                          {{"fd", fd}, {"path", request_path(*request)}, {"pending", pool_.pending()}});
        enqueue(fd, conn_id, busy);
    }
}

// Answers a request the parser refused, then closes once the reply is out.
void GatewayServer::reply_now(Connection &conn, const HttpResponse &response, const std::string &reason)
{
    HttpResponse closing = response;
    closing.keep_alive(false);
    int status = static_cast<int>(closing.result_int());
    conn.recv_buffer.clear();
    metrics_.record_request("invalid", status, std::chrono::microseconds(0));
    Logger::log_event(LogLevel::Warn, "bad_request", "Rejected unparsable request",
                      {{"fd", conn.fd.get()}, {"peer", conn.peer}, {"status", status}, {"detail", reason}});
    conn.in_flight = true;
    enqueue(conn.fd.get(), conn.id, closing);
}

void GatewayServer::enqueue(int fd, std::uint64_t conn_id, const HttpResponse &response)
{
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        outgoing_queue_.push({fd, conn_id, serialize_response(response), response.keep_alive()});
    }
    wakeup_.notify();
}

void GatewayServer::drain_outgoing()
{
    std::queue<Outgoing> ready;
    {
        std::lock_guard<std::mutex> lock(outgoing_mutex_);
        std::swap(ready, outgoing_queue_);
    }

    while (!ready.empty())
    {
        Outgoing item = std::move(ready.front());
        ready.pop();

        auto it = connections_.find(item.fd);
        if (it == connections_.end() || it->second.id != item.conn_id)
            continue; // Connection closed while the worker ran.
        Connection &conn = it->second;
        conn.send_buffer.append(item.data);
        conn.in_flight = false;
        if (!item.keep_alive)
            conn.close_after_write = true;

        SendResult res = flush(conn);
        if (res == SendResult::Error)
        {
            close_connection(item.fd, "send error");
            continue;
        }
        if (res == SendResult::Pending)
        {
            epoll_.mod(item.fd, EPOLLIN | EPOLLOUT | EPOLLET);
            continue;
        }
        if (conn.close_after_write)
        {
            close_connection(item.fd, nullptr);
            continue;
        }
        pump(conn);
    }
}

GatewayServer::SendResult GatewayServer::flush(Connection &conn)
{
    while (!conn.send_buffer.empty())
    {
        int ret = SSL_write(conn.ssl.get(), conn.send_buffer.data(), static_cast<int>(conn.send_buffer.size()));
        if (ret > 0)
        {
            conn.send_buffer.erase(0, static_cast<std::size_t>(ret));
            continue;
        }
        int err = SSL_get_error(conn.ssl.get(), ret);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return SendResult::Pending; // Still has pending data.
        return SendResult::Error;       // Caller will close the connection.
    }
    return SendResult::Ok;
}

void GatewayServer::close_connection(int fd, const char *reason)
{
    auto it = connections_.find(fd);
    if (it == connections_.end())
        return;

    std::string peer = it->second.peer;
    std::string session = it->second.session;
    if (it->second.ssl && it->second.handshaked)
        SSL_shutdown(it->second.ssl.get());
    epoll_.del(fd);
    connections_.erase(it); // Fd/SslPtr destructors handle cleanup.
    metrics_.dec_connections();

    // The connection session ends with its connection.
    admission_.endSession(session);

    json extra = {{"fd", fd}, {"peer", peer}, {"session", session}};
    if (reason)
        extra["reason"] = reason;
    Logger::log_event(reason ? LogLevel::Warn : LogLevel::Info, "connection_close", "Client disconnected", extra);
}

static void print_usage(const char *prog)
{
    std::cerr << "Usage: " << prog << " [--config PATH] [--port PORT]\n";
}

int main(int argc, char *argv[])
{
    std::string config_path = DEFAULT_CONFIG_PATH;
    int port_override = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            port_override = std::atoi(argv[++i]);
            if (port_override <= 0 || port_override > 65535)
            {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return EXIT_FAILURE;
            }
        }
        else
        {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    GatewayConfig config;
    try
    {
        config = load_config(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to load " << config_path << ": " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    if (port_override != 0)
        config.port = port_override;
    Logger::set_level(config.logLevel);

    if (sodium_init() < 0)
    {
        std::cerr << "Failed to init libsodium\n";
        return EXIT_FAILURE;
    }

    SSL_library_init();
    SSL_load_error_strings();
    OpenSSL_add_all_algorithms();

    SslCtxPtr ctx(SSL_CTX_new(TLS_server_method()));
    if (!ctx)
    {
        std::cerr << "Failed to create SSL_CTX\n";
        return EXIT_FAILURE;
    }

    if (SSL_CTX_use_certificate_file(ctx.get(), config.certPath.c_str(), SSL_FILETYPE_PEM) <= 0 ||
        SSL_CTX_use_PrivateKey_file(ctx.get(), config.keyPath.c_str(), SSL_FILETYPE_PEM) <= 0)
    {
        ERR_print_errors_fp(stderr);
        return EXIT_FAILURE;
    }

    SSL_CTX_set_ecdh_auto(ctx.get(), 1);

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Metrics metrics;
    AdmissionController admission(config.limits, nullptr, &metrics);
    SimulatedModel model(config.modelName, config.modelLatency);
    Gateway gateway(admission, model, metrics);
    GatewayServer server(config, ctx.get(), admission, gateway, metrics);

    if (!server.listen(config.port))
        return EXIT_FAILURE;

    std::mutex metrics_mutex;
    std::condition_variable metrics_cv;
    std::thread metrics_thread([&]()
                               {
                                   std::unique_lock<std::mutex> lock(metrics_mutex);
                                   while (!metrics_cv.wait_for(lock, config.metricsInterval, []
                                                               { return stop_requested.load(); }))
                                   {
                                       admission.sweepIdle();
                                       auto snap = metrics.snapshot_and_reset_window(admission.store().size());
                                       Logger::log_event(LogLevel::Info, "metrics_dump", "Periodic metrics snapshot", snap);
                                   } });

    json extra = {
        {"port", config.port},
        {"requests_per_window", config.limits.requestsPerWindow},
        {"tokens_per_window", config.limits.tokensPerWindow},
        {"window_seconds", config.limits.window.count()},
        {"model", config.modelName}};
    Logger::log_event(LogLevel::Info, "startup", "Gateway listening", extra);

    server.run();

    {
        std::lock_guard<std::mutex> lock(metrics_mutex);
        stop_requested.store(true);
    }
    metrics_cv.notify_all();
    metrics_thread.join();

    Logger::log_event(LogLevel::Info, "shutdown", "Gateway stopped", metrics.snapshot(admission.store().size()));
    return 0;
}
